/**
 * @file profile_events.hpp
 * @brief Workload-profile change events and the consumer that applies them.
 *
 * Profiles arrive from an external push stream as add/update/delete events.
 * apply_profile_event() is the whole consumer contract; it is templated on
 * ProfileSinkLike so it can be exercised without a ProfileStore or a live
 * event source.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "profiles/workload_profile.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace kube_balance {

enum class ProfileEventType : uint8_t {
    Added,
    Updated,
    Deleted
};

[[nodiscard]] constexpr std::string_view to_string(ProfileEventType type) noexcept {
    switch (type) {
        case ProfileEventType::Added:   return "added";
        case ProfileEventType::Updated: return "updated";
        case ProfileEventType::Deleted: return "deleted";
    }
    return "unknown";
}

/**
 * @brief Delete notification whose final object state was missed.
 *
 * `last_known` is empty when the stream could not recover the object.
 */
struct DeletedFinalStateUnknown {
    std::string key;
    std::optional<WorkloadProfile> last_known;
};

/// monostate marks a payload the stream could not decode.
using ProfileEventPayload = std::variant<std::monostate, WorkloadProfile, DeletedFinalStateUnknown>;

struct ProfileEvent {
    ProfileEventType type{ProfileEventType::Added};
    ProfileEventPayload payload;
};

using ProfileEventHandler = std::function<void(const ProfileEvent&)>;
using SubscriptionId = uint64_t;

/**
 * @brief Source of profile change events (the external watch stream).
 *
 * subscribe() replays the current set of profiles as Added events before
 * delivering live changes. Handlers may be invoked on any thread and must
 * not call back into the source.
 */
class IProfileEventSource {
public:
    virtual ~IProfileEventSource() = default;

    virtual SubscriptionId subscribe(ProfileEventHandler handler) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;
};

/**
 * @brief Apply one event to a profile sink.
 *
 * Undecodable payloads are logged and skipped. Returns true if the sink was
 * touched.
 */
template <ProfileSinkLike Sink>
bool apply_profile_event(const ProfileEvent& event, Sink& sink, Logger& logger) {
    if (event.type == ProfileEventType::Deleted) {
        const WorkloadProfile* profile = std::get_if<WorkloadProfile>(&event.payload);
        if (profile == nullptr) {
            if (const auto* tombstone = std::get_if<DeletedFinalStateUnknown>(&event.payload);
                tombstone != nullptr && tombstone->last_known) {
                profile = &*tombstone->last_known;
            }
        }
        if (profile == nullptr) {
            logger.error("failed to decode object for delete event, invalid type");
            return false;
        }
        sink.remove(profile->name);
        logger.debug("deleted workload profile from cache: " + profile->name);
        return true;
    }

    const auto* profile = std::get_if<WorkloadProfile>(&event.payload);
    if (profile == nullptr) {
        logger.error("failed to decode object for " + std::string{to_string(event.type)}
                     + " event, invalid type");
        return false;
    }
    sink.upsert(*profile);
    logger.debug(std::string{event.type == ProfileEventType::Added ? "added" : "updated"}
                 + " workload profile in cache: " + profile->name
                 + " (evictionPriority " + std::to_string(profile->eviction_priority) + ")");
    return true;
}

}  // namespace kube_balance

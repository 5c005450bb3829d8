/**
 * @file cluster_state.cpp
 * @brief Cluster-state loading from TOML files using toml++.
 */

#include "cluster/cluster_state.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace kube_balance {

namespace {

constexpr std::string_view kDefaultNamespace = "default";

struct StagedState {
    std::vector<Node> nodes;
    std::vector<WorkloadProfile> profiles;
    std::vector<Owner> owners;
    std::vector<Pod> pods;
    std::vector<DisruptionBudget> budgets;
};

Error entry_error(std::string_view section, size_t index, std::string_view what) {
    return Error{"[[" + std::string{section} + "]] entry " + std::to_string(index) + ": "
                 + std::string{what}};
}

Result<std::string> required_string(const toml::table& tbl, std::string_view key) {
    auto value = tbl[key].value<std::string>();
    if (!value || value->empty()) {
        return Error{"missing required string '" + std::string{key} + "'"};
    }
    return *value;
}

std::string optional_string(const toml::table& tbl, std::string_view key, std::string_view fallback) {
    return tbl[key].value_or(std::string{fallback});
}

template <typename MapT>
Result<MapT> string_map(const toml::table& tbl, std::string_view key) {
    MapT result;
    const auto* inner = tbl[key].as_table();
    if (inner == nullptr) {
        if (tbl.contains(key)) return Error{"'" + std::string{key} + "' must be a table"};
        return result;
    }
    for (auto&& [k, v] : *inner) {
        auto value = v.value<std::string>();
        if (!value) {
            return Error{"'" + std::string{key} + "." + std::string{k.str()} + "' must be a string"};
        }
        result.emplace(std::string{k.str()}, *value);
    }
    return result;
}

Result<ResourceList> resource_list(const toml::table& tbl, std::string_view key) {
    ResourceList result;
    const auto* inner = tbl[key].as_table();
    if (inner == nullptr) {
        if (tbl.contains(key)) return Error{"'" + std::string{key} + "' must be a table"};
        return result;
    }
    for (auto&& [k, v] : *inner) {
        std::string text;
        if (auto s = v.value_exact<std::string>()) {
            text = *s;
        } else if (auto i = v.value_exact<int64_t>()) {
            text = std::to_string(*i);
        } else {
            return Error{"resource '" + std::string{k.str()} + "' must be a string or integer"};
        }
        auto quantity = parse_quantity(text);
        if (!quantity) return quantity.error();
        result.emplace(std::string{k.str()}, *quantity);
    }
    return result;
}

Result<OwnerReference> controller_reference(const toml::table& tbl, std::string_view key) {
    const auto* ref = tbl[key].as_table();
    if (ref == nullptr) return Error{"'" + std::string{key} + "' must be a table"};
    auto kind = required_string(*ref, "kind");
    if (!kind) return kind.error();
    auto name = required_string(*ref, "name");
    if (!name) return name.error();
    return OwnerReference{*kind, *name, (*ref)["controller"].value_or(true)};
}

// ── Per-section parsers ──────────────────────

Result<Node> parse_node(const toml::table& tbl) {
    Node node;
    auto name = required_string(tbl, "name");
    if (!name) return name.error();
    node.name = *name;

    auto annotations = string_map<Annotations>(tbl, "annotations");
    if (!annotations) return annotations.error();
    node.annotations = *annotations;

    if (tbl["degraded"].value_or(false)) {
        node.annotations.emplace(std::string{kDegradedAnnotation}, "true");
    }
    return node;
}

Result<WorkloadProfile> parse_profile(const toml::table& tbl) {
    WorkloadProfile profile;
    auto name = required_string(tbl, "name");
    if (!name) return name.error();
    profile.name = *name;
    profile.cpu_requests = optional_string(tbl, "cpu_requests", "");
    profile.memory_requests = optional_string(tbl, "memory_requests", "");

    auto priority = tbl["eviction_priority"].value<int64_t>();
    if (!priority) return Error{"missing required integer 'eviction_priority'"};
    profile.eviction_priority = static_cast<int32_t>(*priority);
    return profile;
}

Result<Owner> parse_owner(const toml::table& tbl) {
    Owner owner;
    auto kind_text = required_string(tbl, "kind");
    if (!kind_text) return kind_text.error();
    auto kind = parse_owner_kind(*kind_text);
    if (!kind) return Error{"unsupported owner kind '" + *kind_text + "'"};
    owner.kind = *kind;

    auto name = required_string(tbl, "name");
    if (!name) return name.error();
    owner.name = *name;
    owner.ns = optional_string(tbl, "namespace", kDefaultNamespace);

    auto annotations = string_map<Annotations>(tbl, "annotations");
    if (!annotations) return annotations.error();
    owner.annotations = *annotations;

    if (tbl.contains("controller")) {
        auto ref = controller_reference(tbl, "controller");
        if (!ref) return ref.error();
        owner.owner_references.push_back(*ref);
    }
    return owner;
}

Result<Container> parse_container(const toml::table& tbl) {
    Container container;
    container.name = optional_string(tbl, "name", "main");

    auto requests = resource_list(tbl, "requests");
    if (!requests) return requests.error();
    container.requests = *requests;

    auto limits = resource_list(tbl, "limits");
    if (!limits) return limits.error();
    container.limits = *limits;
    return container;
}

Result<Pod> parse_pod(const toml::table& tbl) {
    Pod pod;
    auto name = required_string(tbl, "name");
    if (!name) return name.error();
    pod.name = *name;
    pod.ns = optional_string(tbl, "namespace", kDefaultNamespace);
    pod.node_name = optional_string(tbl, "node", "");

    auto phase_text = optional_string(tbl, "phase", "Running");
    auto phase = parse_pod_phase(phase_text);
    if (!phase) return Error{"unknown pod phase '" + phase_text + "'"};
    pod.phase = *phase;

    auto labels = string_map<Labels>(tbl, "labels");
    if (!labels) return labels.error();
    pod.labels = *labels;

    if (tbl.contains("owner")) {
        auto ref = controller_reference(tbl, "owner");
        if (!ref) return ref.error();
        pod.owner_references.push_back(*ref);
    }

    if (const auto* containers = tbl["containers"].as_array()) {
        for (const auto& elem : *containers) {
            const auto* ctbl = elem.as_table();
            if (ctbl == nullptr) return Error{"'containers' entries must be tables"};
            auto container = parse_container(*ctbl);
            if (!container) return container.error();
            pod.containers.push_back(*container);
        }
    }
    return pod;
}

Result<LabelSelector> parse_selector(const toml::table& tbl) {
    LabelSelector selector;
    auto match_labels = string_map<Labels>(tbl, "match_labels");
    if (!match_labels) return match_labels.error();
    selector.match_labels = *match_labels;

    if (const auto* exprs = tbl["match_expressions"].as_array()) {
        for (const auto& elem : *exprs) {
            const auto* etbl = elem.as_table();
            if (etbl == nullptr) return Error{"'match_expressions' entries must be tables"};

            LabelSelectorRequirement req;
            req.key = optional_string(*etbl, "key", "");
            req.op = optional_string(*etbl, "operator", "");
            if (const auto* values = (*etbl)["values"].as_array()) {
                for (const auto& v : *values) {
                    auto s = v.value<std::string>();
                    if (!s) return Error{"selector values must be strings"};
                    req.values.push_back(*s);
                }
            }
            // Operator and key validity are checked when the selector is
            // compiled, so a malformed budget is skipped instead of failing
            // the whole load.
            selector.match_expressions.push_back(std::move(req));
        }
    }
    return selector;
}

Result<DisruptionBudget> parse_budget(const toml::table& tbl) {
    DisruptionBudget budget;
    auto name = required_string(tbl, "name");
    if (!name) return name.error();
    budget.name = *name;
    budget.ns = optional_string(tbl, "namespace", kDefaultNamespace);
    budget.disruptions_allowed = static_cast<int32_t>(
        tbl["disruptions_allowed"].value_or(int64_t{0}));

    if (const auto* sel = tbl["selector"].as_table()) {
        auto selector = parse_selector(*sel);
        if (!selector) return selector.error();
        budget.selector = *selector;
    }
    return budget;
}

template <typename T, typename ParseFn>
Result<void> parse_section(const toml::table& root, std::string_view section,
                           std::vector<T>& out, ParseFn parse) {
    const auto* arr = root[section].as_array();
    if (arr == nullptr) {
        if (root.contains(section)) {
            return Error{"'" + std::string{section} + "' must be an array of tables"};
        }
        return {};
    }
    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* tbl = (*arr)[i].as_table();
        if (tbl == nullptr) return entry_error(section, i, "not a table");
        auto parsed = parse(*tbl);
        if (!parsed) return entry_error(section, i, parsed.error().message);
        out.push_back(*parsed);
    }
    return {};
}

Result<ClusterStateSummary> apply_table(const toml::table& root, InMemoryCluster& cluster) {
    StagedState staged;

    if (auto r = parse_section(root, "nodes", staged.nodes, parse_node); !r) return r.error();
    if (auto r = parse_section(root, "profiles", staged.profiles, parse_profile); !r) return r.error();
    if (auto r = parse_section(root, "owners", staged.owners, parse_owner); !r) return r.error();
    if (auto r = parse_section(root, "pods", staged.pods, parse_pod); !r) return r.error();
    if (auto r = parse_section(root, "budgets", staged.budgets, parse_budget); !r) return r.error();

    for (auto& node : staged.nodes) cluster.upsert_node(std::move(node));
    for (auto& owner : staged.owners) cluster.upsert_owner(std::move(owner));
    for (auto& pod : staged.pods) cluster.upsert_pod(std::move(pod));
    for (auto& budget : staged.budgets) cluster.upsert_budget(std::move(budget));
    for (const auto& profile : staged.profiles) cluster.apply_profile(profile);

    return ClusterStateSummary{
        .nodes = staged.nodes.size(),
        .pods = staged.pods.size(),
        .owners = staged.owners.size(),
        .budgets = staged.budgets.size(),
        .profiles = staged.profiles.size()
    };
}

}  // namespace

Result<ClusterStateSummary> parse_cluster_state(std::string_view toml_text, InMemoryCluster& cluster) {
    try {
        auto tbl = toml::parse(toml_text);
        return apply_table(tbl, cluster);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<ClusterStateSummary> load_cluster_state(const std::filesystem::path& path,
                                               InMemoryCluster& cluster) {
    if (!std::filesystem::exists(path)) {
        return Error{"Cluster state file not found: " + path.string()};
    }
    try {
        auto tbl = toml::parse_file(path.string());
        return apply_table(tbl, cluster);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error in "} + path.string() + ": "
                     + std::string{err.description()}};
    }
}

}  // namespace kube_balance

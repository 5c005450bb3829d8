/**
 * @file label_selector.cpp
 * @brief Label selector validation and matching.
 */

#include "rebalancer/label_selector.hpp"

#include <algorithm>
#include <cctype>

namespace kube_balance {

namespace {

constexpr size_t kMaxNameLength = 63;
constexpr size_t kMaxPrefixLength = 253;

bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool is_name_part(std::string_view text) {
    if (text.empty() || text.size() > kMaxNameLength) return false;
    if (!is_alnum(text.front()) || !is_alnum(text.back())) return false;
    return std::all_of(text.begin(), text.end(), [](char c) {
        return is_alnum(c) || c == '-' || c == '_' || c == '.';
    });
}

// RFC 1123 subdomain: lowercase alphanumerics, '-' and '.', alnum at both ends.
bool is_dns_subdomain(std::string_view text) {
    if (text.empty() || text.size() > kMaxPrefixLength) return false;
    auto lower_alnum = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    };
    if (!lower_alnum(text.front()) || !lower_alnum(text.back())) return false;
    return std::all_of(text.begin(), text.end(), [&](char c) {
        return lower_alnum(c) || c == '-' || c == '.';
    });
}

std::optional<Selector::Operator> parse_operator(std::string_view op) {
    if (op == "In") return Selector::Operator::In;
    if (op == "NotIn") return Selector::Operator::NotIn;
    if (op == "Exists") return Selector::Operator::Exists;
    if (op == "DoesNotExist") return Selector::Operator::DoesNotExist;
    return std::nullopt;
}

Error invalid(const std::string& what) {
    return Error{"invalid label selector: " + what};
}

}  // namespace

bool is_valid_label_key(std::string_view key) {
    auto slash = key.find('/');
    if (slash == std::string_view::npos) return is_name_part(key);
    return is_dns_subdomain(key.substr(0, slash)) && is_name_part(key.substr(slash + 1));
}

bool is_valid_label_value(std::string_view value) {
    return value.empty() || is_name_part(value);
}

// ─────────────────────────────────────────────
// Selector
// ─────────────────────────────────────────────

Selector Selector::nothing() {
    Selector s;
    s.matches_nothing_ = true;
    return s;
}

Selector Selector::from_requirements(std::vector<Requirement> requirements) {
    Selector s;
    s.requirements_ = std::move(requirements);
    return s;
}

bool Selector::matches(const Labels& labels) const {
    if (matches_nothing_) return false;

    return std::all_of(requirements_.begin(), requirements_.end(), [&](const Requirement& r) {
        auto it = labels.find(r.key);
        bool present = it != labels.end();
        auto listed = [&] {
            return present && std::find(r.values.begin(), r.values.end(), it->second) != r.values.end();
        };
        switch (r.op) {
            case Operator::In:           return listed();
            case Operator::NotIn:        return !listed();
            case Operator::Exists:       return present;
            case Operator::DoesNotExist: return !present;
        }
        return false;
    });
}

// ─────────────────────────────────────────────
// Compilation
// ─────────────────────────────────────────────

Result<Selector> compile_selector(const std::optional<LabelSelector>& selector) {
    if (!selector) return Selector::nothing();

    std::vector<Selector::Requirement> requirements;
    requirements.reserve(selector->match_labels.size() + selector->match_expressions.size());

    for (const auto& [key, value] : selector->match_labels) {
        if (!is_valid_label_key(key)) return invalid("key \"" + key + "\"");
        if (!is_valid_label_value(value)) return invalid("value \"" + value + "\" for key \"" + key + "\"");
        requirements.push_back({key, Selector::Operator::In, {value}});
    }

    for (const auto& expr : selector->match_expressions) {
        if (!is_valid_label_key(expr.key)) return invalid("key \"" + expr.key + "\"");

        auto op = parse_operator(expr.op);
        if (!op) return invalid("operator \"" + expr.op + "\" for key \"" + expr.key + "\"");

        bool needs_values = *op == Selector::Operator::In || *op == Selector::Operator::NotIn;
        if (needs_values && expr.values.empty()) {
            return invalid("operator " + expr.op + " requires values for key \"" + expr.key + "\"");
        }
        if (!needs_values && !expr.values.empty()) {
            return invalid("operator " + expr.op + " takes no values for key \"" + expr.key + "\"");
        }
        for (const auto& v : expr.values) {
            if (!is_valid_label_value(v)) return invalid("value \"" + v + "\" for key \"" + expr.key + "\"");
        }
        requirements.push_back({expr.key, *op, expr.values});
    }

    return Selector::from_requirements(std::move(requirements));
}

}  // namespace kube_balance

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace rulecast {

class FilterMatcher;

// A per-collection, per-operation access policy. A null rule denies every
// request, an empty rule allows every request, anything else is an
// expression evaluated against a RuleContext.
struct AccessRule {
    enum class Kind {
        DenyAll,
        AllowAll,
        Expression
    };

    Kind kind = Kind::DenyAll;
    std::string expression;

    static AccessRule denyAll() { return AccessRule{}; }
    static AccessRule allowAll() { return AccessRule{Kind::AllowAll, {}}; }
    static AccessRule fromExpression(const std::string &expr)
    {
        if (expr.empty()) {
            return allowAll();
        }
        return AccessRule{Kind::Expression, expr};
    }
};

struct CollectionRules {
    std::string name;
    AccessRule listRule;
    AccessRule viewRule;
    AccessRule createRule;
    AccessRule updateRule;
    AccessRule deleteRule;

    const AccessRule &rule(RuleType type) const
    {
        switch (type) {
        case RuleType::List:
            return listRule;
        case RuleType::View:
            return viewRule;
        case RuleType::Create:
            return createRule;
        case RuleType::Update:
            return updateRule;
        case RuleType::Delete:
            return deleteRule;
        }
        return viewRule;
    }
};

struct RuleContext {
    std::optional<nlohmann::json> auth;
    std::optional<nlohmann::json> record;
    std::optional<nlohmann::json> data;
    bool admin = false;
};

struct Subscription {
    std::string id;
    std::string clientId;
    std::string collection;
    std::optional<std::string> recordId;
    std::optional<std::string> filterExpr;
    std::optional<nlohmann::json> authContext;
    std::chrono::system_clock::time_point createdAt;

    // Compiled form of filterExpr, built once at subscribe time.
    std::shared_ptr<const FilterMatcher> filter;
};

// Storage-level predicate compiled from an access rule. The clause uses `?`
// placeholders bound in order from params.
struct FilterFragment {
    std::string clause;
    std::vector<nlohmann::json> params;

    static FilterFragment alwaysTrue() { return FilterFragment{"1 = 1", {}}; }
    static FilterFragment alwaysFalse() { return FilterFragment{"1 = 0", {}}; }

    bool isAlwaysFalse() const { return clause == "1 = 0" && params.empty(); }
    bool isAlwaysTrue() const { return clause == "1 = 1" && params.empty(); }
};

} // namespace rulecast

#pragma once

#include <cctype>
#include <cmath>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace rulecast {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            timestamp.time_since_epoch())
                            .count()
        % 1000;
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    out << '.' << std::setw(3) << std::setfill('0') << (millis < 0 ? 0 : millis);
    out << 'Z';
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    int millis = 0;
    if (in.peek() == '.') {
        in.get();
        std::string digits;
        while (std::isdigit(in.peek())) {
            digits.push_back(static_cast<char>(in.get()));
        }
        if (!digits.empty()) {
            digits.resize(3, '0');
            millis = std::stoi(digits);
        }
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time)
        + std::chrono::milliseconds(millis);
}

inline std::string toRuleTypeString(RuleType type)
{
    switch (type) {
    case RuleType::List:
        return "list";
    case RuleType::View:
        return "view";
    case RuleType::Create:
        return "create";
    case RuleType::Update:
        return "update";
    case RuleType::Delete:
        return "delete";
    }
    return "view";
}

inline std::optional<RuleType> parseRuleTypeString(const std::string &value)
{
    if (value == "list") {
        return RuleType::List;
    }
    if (value == "view") {
        return RuleType::View;
    }
    if (value == "create") {
        return RuleType::Create;
    }
    if (value == "update") {
        return RuleType::Update;
    }
    if (value == "delete") {
        return RuleType::Delete;
    }
    return std::nullopt;
}

inline std::string toActionString(RecordAction action)
{
    switch (action) {
    case RecordAction::Create:
        return "create";
    case RecordAction::Update:
        return "update";
    case RecordAction::Delete:
        return "delete";
    }
    return "update";
}

inline std::optional<RecordAction> parseActionString(const std::string &value)
{
    if (value == "create") {
        return RecordAction::Create;
    }
    if (value == "update") {
        return RecordAction::Update;
    }
    if (value == "delete") {
        return RecordAction::Delete;
    }
    return std::nullopt;
}

inline std::string toConnectionStateString(ConnectionState state)
{
    switch (state) {
    case ConnectionState::Connecting:
        return "connecting";
    case ConnectionState::Open:
        return "open";
    case ConnectionState::Closing:
        return "closing";
    case ConnectionState::Closed:
        return "closed";
    }
    return "closed";
}

// Record ids may arrive as strings or numbers; both compare by their text form.
// Integral floating-point ids print as integers, so 1.0 and 1 are the same id.
inline std::optional<std::string> recordIdOf(const nlohmann::json &record)
{
    if (!record.is_object()) {
        return std::nullopt;
    }
    auto it = record.find("id");
    if (it == record.end()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_float()) {
        const double value = it->get<double>();
        double integral = 0.0;
        if (std::isfinite(value) && std::modf(value, &integral) == 0.0
            && std::fabs(value) < 9007199254740992.0) {
            return std::to_string(static_cast<long long>(integral));
        }
    }
    if (it->is_number()) {
        return it->dump();
    }
    return std::nullopt;
}

inline void to_json(nlohmann::json &j, const AccessRule &rule)
{
    switch (rule.kind) {
    case AccessRule::Kind::DenyAll:
        j = nullptr;
        return;
    case AccessRule::Kind::AllowAll:
        j = "";
        return;
    case AccessRule::Kind::Expression:
        j = rule.expression;
        return;
    }
    j = nullptr;
}

inline void from_json(const nlohmann::json &j, AccessRule &rule)
{
    if (j.is_string()) {
        rule = AccessRule::fromExpression(j.get<std::string>());
    } else {
        rule = AccessRule::denyAll();
    }
}

inline void to_json(nlohmann::json &j, const CollectionRules &rules)
{
    j = nlohmann::json{
        {"name", rules.name},
        {"listRule", rules.listRule},
        {"viewRule", rules.viewRule},
        {"createRule", rules.createRule},
        {"updateRule", rules.updateRule},
        {"deleteRule", rules.deleteRule}
    };
}

inline void from_json(const nlohmann::json &j, CollectionRules &rules)
{
    rules.name = j.value("name", "");
    auto readRule = [&j](const char *key) {
        if (!j.contains(key)) {
            return AccessRule::denyAll();
        }
        return j.at(key).get<AccessRule>();
    };
    rules.listRule = readRule("listRule");
    rules.viewRule = readRule("viewRule");
    rules.createRule = readRule("createRule");
    rules.updateRule = readRule("updateRule");
    rules.deleteRule = readRule("deleteRule");
}

inline void to_json(nlohmann::json &j, const Subscription &subscription)
{
    j = nlohmann::json{
        {"id", subscription.id},
        {"clientId", subscription.clientId},
        {"collection", subscription.collection},
        {"recordId", subscription.recordId ? nlohmann::json(*subscription.recordId)
                                           : nlohmann::json(nullptr)},
        {"filter", subscription.filterExpr ? nlohmann::json(*subscription.filterExpr)
                                           : nlohmann::json(nullptr)},
        {"createdAt", toIso8601Utc(subscription.createdAt)}
    };
}

inline void to_json(nlohmann::json &j, const FilterFragment &fragment)
{
    j = nlohmann::json{{"clause", fragment.clause}, {"params", fragment.params}};
}

} // namespace rulecast

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "rules/expression.hpp"

namespace rulecast {

struct EvalResult {
    nlohmann::json value;
    std::string error;

    bool ok() const { return error.empty(); }
};

// ExpressionEvaluator interprets a parsed expression against a RuleContext.
// The only inputs are the AST, the context and the clock used by $now().
// Failures come back as EvalResult::error; nothing is thrown to the caller.
class ExpressionEvaluator {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    ExpressionEvaluator();
    explicit ExpressionEvaluator(Clock clock);

    EvalResult evaluate(const expr::Node &root, const RuleContext &context) const;

    // Parses and evaluates in one step. Parse errors are evaluation failures.
    EvalResult evaluate(const std::string &source,
                        const RuleContext &context,
                        expr::ParseMode mode = expr::ParseMode::Rule) const;

    static bool truthy(const nlohmann::json &value);
    static bool valuesEqual(const nlohmann::json &a, const nlohmann::json &b);
    // Three-way ordering for <, >, <=, >=. nullopt when the operands do not
    // order (mixed types), in which case every ordering comparison is false.
    static std::optional<int> compareValues(const nlohmann::json &a,
                                            const nlohmann::json &b);
    static bool applyComparison(expr::BinaryOpKind op,
                                const nlohmann::json &a,
                                const nlohmann::json &b);
    static nlohmann::json lookupPath(const nlohmann::json &root,
                                     const std::vector<std::string> &path);

private:
    Clock m_clock;
};

} // namespace rulecast

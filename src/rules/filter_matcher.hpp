#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rules/expression.hpp"
#include "rules/expression_evaluator.hpp"

namespace rulecast {

// FilterMatcher is a compiled subscription filter. Filters shaped as an
// `&&` chain of `field <op> literal` comparisons are flattened into clauses
// and matched directly against the record; any other shape falls back to the
// general evaluator with only `record` in scope.
class FilterMatcher {
public:
    // Returns nullptr and fills error when the filter does not parse.
    static std::shared_ptr<const FilterMatcher> compile(const std::string &filter,
                                                        std::string *error = nullptr);

    // Deterministic for a given record. Evaluation failures never match.
    bool matches(const nlohmann::json &record) const;

    bool usesFastPath() const { return m_fastPath; }
    const std::string &source() const { return m_source; }

private:
    struct Clause {
        std::vector<std::string> path;
        expr::BinaryOpKind op;
        nlohmann::json literal;
    };

    FilterMatcher() = default;

    static bool flatten(const expr::NodePtr &node, std::vector<Clause> &out);

    std::string m_source;
    expr::NodePtr m_root;
    std::vector<Clause> m_clauses;
    bool m_fastPath = false;
    ExpressionEvaluator m_evaluator;
};

} // namespace rulecast

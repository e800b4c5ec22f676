#include "rules/filter_matcher.hpp"

#include <variant>

namespace rulecast {

std::shared_ptr<const FilterMatcher> FilterMatcher::compile(const std::string &filter,
                                                            std::string *error)
{
    const expr::ParseResult parsed = expr::parseExpression(filter, expr::ParseMode::Filter);
    if (!parsed.ok()) {
        if (error) {
            *error = parsed.error + " at position " + std::to_string(parsed.position);
        }
        return nullptr;
    }

    std::shared_ptr<FilterMatcher> matcher(new FilterMatcher());
    matcher->m_source = filter;
    matcher->m_root = parsed.root;
    std::vector<Clause> clauses;
    if (flatten(parsed.root, clauses)) {
        matcher->m_clauses = std::move(clauses);
        matcher->m_fastPath = true;
    }
    return matcher;
}

bool FilterMatcher::flatten(const expr::NodePtr &node, std::vector<Clause> &out)
{
    const auto *binary = std::get_if<expr::BinaryOp>(&node->value);
    if (!binary) {
        return false;
    }
    if (binary->op == expr::BinaryOpKind::And) {
        return flatten(binary->lhs, out) && flatten(binary->rhs, out);
    }
    if (!expr::isComparison(binary->op)) {
        return false;
    }

    const auto *lhsField = std::get_if<expr::FieldAccess>(&binary->lhs->value);
    const auto *rhsField = std::get_if<expr::FieldAccess>(&binary->rhs->value);
    const auto *lhsLiteral = std::get_if<expr::Literal>(&binary->lhs->value);
    const auto *rhsLiteral = std::get_if<expr::Literal>(&binary->rhs->value);

    if (lhsField && rhsLiteral) {
        out.push_back(Clause{lhsField->path, binary->op, rhsLiteral->value});
        return true;
    }
    if (lhsLiteral && rhsField) {
        out.push_back(Clause{rhsField->path, expr::mirrored(binary->op), lhsLiteral->value});
        return true;
    }
    return false;
}

bool FilterMatcher::matches(const nlohmann::json &record) const
{
    if (m_fastPath) {
        for (const auto &clause : m_clauses) {
            const nlohmann::json value = ExpressionEvaluator::lookupPath(record, clause.path);
            if (!ExpressionEvaluator::applyComparison(clause.op, value, clause.literal)) {
                return false;
            }
        }
        return true;
    }

    RuleContext context;
    context.record = record;
    const EvalResult result = m_evaluator.evaluate(*m_root, context);
    return result.ok() && ExpressionEvaluator::truthy(result.value);
}

} // namespace rulecast

#include "rules/expression_evaluator.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

#include "common/json_utils.hpp"

namespace rulecast {

namespace {

class EvaluationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::optional<double> numericValue(const nlohmann::json &value)
{
    if (value.is_number()) {
        return value.get<double>();
    }
    if (!value.is_string()) {
        return std::nullopt;
    }
    const std::string &text = value.get_ref<const std::string &>();
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const double parsed = std::stod(text, &consumed);
        if (consumed != text.size() || !std::isfinite(parsed)) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

std::optional<bool> booleanValue(const nlohmann::json &value)
{
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        const std::string &text = value.get_ref<const std::string &>();
        if (text == "true") {
            return true;
        }
        if (text == "false") {
            return false;
        }
    }
    return std::nullopt;
}

bool isEmptyValue(const nlohmann::json &value)
{
    if (value.is_null()) {
        return true;
    }
    if (value.is_string()) {
        return value.get_ref<const std::string &>().empty();
    }
    if (value.is_array() || value.is_object()) {
        return value.empty();
    }
    return false;
}

const nlohmann::json &contextRoot(const RuleContext &context, expr::FieldRoot root)
{
    static const nlohmann::json kNull = nullptr;
    const std::optional<nlohmann::json> *slot = nullptr;
    switch (root) {
    case expr::FieldRoot::Auth:
        slot = &context.auth;
        break;
    case expr::FieldRoot::Record:
        slot = &context.record;
        break;
    case expr::FieldRoot::Data:
        slot = &context.data;
        break;
    }
    if (!slot || !slot->has_value()) {
        return kNull;
    }
    return **slot;
}

class Interpreter {
public:
    Interpreter(const RuleContext &context, const ExpressionEvaluator::Clock &clock)
        : m_context(context)
        , m_clock(clock)
    {
    }

    nlohmann::json eval(const expr::Node &node) const
    {
        return std::visit([this](const auto &value) { return visit(value); }, node.value);
    }

private:
    nlohmann::json visit(const expr::Literal &literal) const
    {
        return literal.value;
    }

    nlohmann::json visit(const expr::FieldAccess &access) const
    {
        return ExpressionEvaluator::lookupPath(contextRoot(m_context, access.root),
                                               access.path);
    }

    nlohmann::json visit(const expr::UnaryOp &unary) const
    {
        return !ExpressionEvaluator::truthy(eval(*unary.operand));
    }

    nlohmann::json visit(const expr::BinaryOp &binary) const
    {
        if (binary.op == expr::BinaryOpKind::And) {
            if (!ExpressionEvaluator::truthy(eval(*binary.lhs))) {
                return false;
            }
            return ExpressionEvaluator::truthy(eval(*binary.rhs));
        }
        if (binary.op == expr::BinaryOpKind::Or) {
            if (ExpressionEvaluator::truthy(eval(*binary.lhs))) {
                return true;
            }
            return ExpressionEvaluator::truthy(eval(*binary.rhs));
        }
        return ExpressionEvaluator::applyComparison(binary.op,
                                                    eval(*binary.lhs),
                                                    eval(*binary.rhs));
    }

    nlohmann::json visit(const expr::Call &call) const
    {
        switch (call.function) {
        case expr::Function::Now:
            return toIso8601Utc(m_clock());
        case expr::Function::Contains: {
            const nlohmann::json seq = eval(*call.args.at(0));
            const nlohmann::json needle = eval(*call.args.at(1));
            if (seq.is_null()) {
                return false;
            }
            if (seq.is_array()) {
                for (const auto &item : seq) {
                    if (ExpressionEvaluator::valuesEqual(item, needle)) {
                        return true;
                    }
                }
                return false;
            }
            if (seq.is_string() && needle.is_string()) {
                return seq.get_ref<const std::string &>().find(
                           needle.get_ref<const std::string &>())
                    != std::string::npos;
            }
            throw EvaluationError("$contains expects an array or string, got "
                                  + std::string(seq.type_name()));
        }
        case expr::Function::Size: {
            const nlohmann::json value = eval(*call.args.at(0));
            if (value.is_null()) {
                return 0;
            }
            if (value.is_string()) {
                return value.get_ref<const std::string &>().size();
            }
            if (value.is_array() || value.is_object()) {
                return value.size();
            }
            throw EvaluationError("$size expects a string, array or object, got "
                                  + std::string(value.type_name()));
        }
        case expr::Function::IsEmpty:
            return isEmptyValue(eval(*call.args.at(0)));
        case expr::Function::IsNotEmpty:
            return !isEmptyValue(eval(*call.args.at(0)));
        }
        throw EvaluationError("unsupported function");
    }

    const RuleContext &m_context;
    const ExpressionEvaluator::Clock &m_clock;
};

} // namespace

ExpressionEvaluator::ExpressionEvaluator()
    : m_clock([] { return std::chrono::system_clock::now(); })
{
}

ExpressionEvaluator::ExpressionEvaluator(Clock clock)
    : m_clock(std::move(clock))
{
}

EvalResult ExpressionEvaluator::evaluate(const expr::Node &root,
                                         const RuleContext &context) const
{
    EvalResult result;
    try {
        Interpreter interpreter(context, m_clock);
        result.value = interpreter.eval(root);
    } catch (const EvaluationError &ex) {
        result.value = nullptr;
        result.error = ex.what();
    } catch (const std::exception &ex) {
        result.value = nullptr;
        result.error = std::string("evaluation failed: ") + ex.what();
    }
    return result;
}

EvalResult ExpressionEvaluator::evaluate(const std::string &source,
                                         const RuleContext &context,
                                         expr::ParseMode mode) const
{
    const expr::ParseResult parsed = expr::parseExpression(source, mode);
    if (!parsed.ok()) {
        EvalResult result;
        result.value = nullptr;
        result.error = parsed.error;
        return result;
    }
    return evaluate(*parsed.root, context);
}

bool ExpressionEvaluator::truthy(const nlohmann::json &value)
{
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number()) {
        return value.get<double>() != 0.0;
    }
    return !isEmptyValue(value);
}

bool ExpressionEvaluator::valuesEqual(const nlohmann::json &a, const nlohmann::json &b)
{
    // A missing value and an empty string are the same thing, so that
    // `auth.id != ""` is false for an anonymous request.
    if (a.is_null() || b.is_null()) {
        const nlohmann::json &other = a.is_null() ? b : a;
        return other.is_null()
            || (other.is_string() && other.get_ref<const std::string &>().empty());
    }
    if (a.is_number() && b.is_number()) {
        return a.get<double>() == b.get<double>();
    }
    if ((a.is_number() && b.is_string()) || (a.is_string() && b.is_number())) {
        const auto lhs = numericValue(a);
        const auto rhs = numericValue(b);
        return lhs && rhs && *lhs == *rhs;
    }
    if ((a.is_boolean() && b.is_string()) || (a.is_string() && b.is_boolean())) {
        const auto lhs = booleanValue(a);
        const auto rhs = booleanValue(b);
        return lhs && rhs && *lhs == *rhs;
    }
    return a == b;
}

std::optional<int> ExpressionEvaluator::compareValues(const nlohmann::json &a,
                                                      const nlohmann::json &b)
{
    if (a.is_string() && b.is_string()) {
        const int cmp = a.get_ref<const std::string &>().compare(
            b.get_ref<const std::string &>());
        return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
    }
    if (a.is_number() || b.is_number()) {
        const auto lhs = numericValue(a);
        const auto rhs = numericValue(b);
        if (!lhs || !rhs) {
            return std::nullopt;
        }
        if (*lhs < *rhs) {
            return -1;
        }
        return *lhs > *rhs ? 1 : 0;
    }
    return std::nullopt;
}

bool ExpressionEvaluator::applyComparison(expr::BinaryOpKind op,
                                          const nlohmann::json &a,
                                          const nlohmann::json &b)
{
    switch (op) {
    case expr::BinaryOpKind::Equal:
        return valuesEqual(a, b);
    case expr::BinaryOpKind::NotEqual:
        return !valuesEqual(a, b);
    default:
        break;
    }

    const auto order = compareValues(a, b);
    if (!order) {
        return false;
    }
    switch (op) {
    case expr::BinaryOpKind::Greater:
        return *order > 0;
    case expr::BinaryOpKind::Less:
        return *order < 0;
    case expr::BinaryOpKind::GreaterEqual:
        return *order >= 0;
    case expr::BinaryOpKind::LessEqual:
        return *order <= 0;
    default:
        return false;
    }
}

nlohmann::json ExpressionEvaluator::lookupPath(const nlohmann::json &root,
                                               const std::vector<std::string> &path)
{
    const nlohmann::json *current = &root;
    for (const auto &segment : path) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(segment);
        if (it == current->end()) {
            return nullptr;
        }
        current = &*it;
    }
    return *current;
}

} // namespace rulecast

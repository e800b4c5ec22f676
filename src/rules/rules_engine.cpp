#include "rules/rules_engine.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace rulecast {

namespace {

constexpr RuleType kRuleTypes[] = {
    RuleType::List,
    RuleType::View,
    RuleType::Create,
    RuleType::Update,
    RuleType::Delete,
};

std::size_t ruleIndex(RuleType type)
{
    return static_cast<std::size_t>(type);
}

// True when the subtree reads nothing but auth fields, literals and helpers,
// so its value is fixed for a given principal.
bool isAuthConstant(const expr::Node &node)
{
    return std::visit(
        [](const auto &value) -> bool {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, expr::Literal>) {
                return true;
            } else if constexpr (std::is_same_v<T, expr::FieldAccess>) {
                return value.root == expr::FieldRoot::Auth;
            } else if constexpr (std::is_same_v<T, expr::UnaryOp>) {
                return isAuthConstant(*value.operand);
            } else if constexpr (std::is_same_v<T, expr::BinaryOp>) {
                return isAuthConstant(*value.lhs) && isAuthConstant(*value.rhs);
            } else {
                return std::all_of(value.args.begin(), value.args.end(),
                                   [](const expr::NodePtr &arg) {
                                       return isAuthConstant(*arg);
                                   });
            }
        },
        node.value);
}

const expr::FieldAccess *recordColumn(const expr::Node &node)
{
    const auto *field = std::get_if<expr::FieldAccess>(&node.value);
    if (!field || field->root != expr::FieldRoot::Record || field->path.size() != 1) {
        return nullptr;
    }
    return field;
}

// Intermediate result of translating one rule subtree into SQL.
struct Translation {
    enum class Kind {
        True,
        False,
        Clause,
        Unsupported
    };

    Kind kind = Kind::Unsupported;
    std::string clause;
    std::vector<nlohmann::json> params;

    static Translation constant(bool value)
    {
        Translation t;
        t.kind = value ? Kind::True : Kind::False;
        return t;
    }
};

class FilterTranslator {
public:
    FilterTranslator(const ExpressionEvaluator &evaluator, const RuleContext &context)
        : m_evaluator(evaluator)
        , m_context(context)
    {
    }

    Translation translate(const expr::Node &node) const
    {
        if (isAuthConstant(node)) {
            const EvalResult result = m_evaluator.evaluate(node, m_context);
            return Translation::constant(result.ok() && ExpressionEvaluator::truthy(result.value));
        }

        const auto *binary = std::get_if<expr::BinaryOp>(&node.value);
        if (!binary) {
            return {};
        }
        if (binary->op == expr::BinaryOpKind::And) {
            return combine(translate(*binary->lhs), translate(*binary->rhs), true);
        }
        if (binary->op == expr::BinaryOpKind::Or) {
            return combine(translate(*binary->lhs), translate(*binary->rhs), false);
        }
        return comparison(*binary);
    }

private:
    Translation comparison(const expr::BinaryOp &binary) const
    {
        const expr::FieldAccess *column = recordColumn(*binary.lhs);
        const expr::Node *other = binary.rhs.get();
        expr::BinaryOpKind op = binary.op;
        if (!column) {
            column = recordColumn(*binary.rhs);
            other = binary.lhs.get();
            op = expr::mirrored(binary.op);
        }
        if (!column || !isAuthConstant(*other)) {
            return {};
        }

        const EvalResult bound = m_evaluator.evaluate(*other, m_context);
        if (!bound.ok()) {
            return Translation::constant(false);
        }
        if (bound.value.is_null()) {
            // A missing principal value never owns a row.
            if (op == expr::BinaryOpKind::Equal) {
                return Translation::constant(false);
            }
            return {};
        }
        if (!bound.value.is_primitive()) {
            return {};
        }

        Translation t;
        t.kind = Translation::Kind::Clause;
        t.clause = "\"" + column->path.front() + "\" " + expr::toOperatorString(op) + " ?";
        t.params.push_back(bound.value);
        return t;
    }

    static Translation combine(Translation lhs, Translation rhs, bool conjunction)
    {
        using Kind = Translation::Kind;
        const Kind absorbing = conjunction ? Kind::False : Kind::True;
        const Kind identity = conjunction ? Kind::True : Kind::False;

        if (lhs.kind == absorbing || rhs.kind == absorbing) {
            return Translation::constant(!conjunction);
        }
        if (lhs.kind == Kind::Unsupported || rhs.kind == Kind::Unsupported) {
            return {};
        }
        if (lhs.kind == identity) {
            return rhs;
        }
        if (rhs.kind == identity) {
            return lhs;
        }

        Translation t;
        t.kind = Kind::Clause;
        t.clause = "(" + lhs.clause + (conjunction ? ") AND (" : ") OR (") + rhs.clause + ")";
        t.params = std::move(lhs.params);
        t.params.insert(t.params.end(), rhs.params.begin(), rhs.params.end());
        return t;
    }

    const ExpressionEvaluator &m_evaluator;
    const RuleContext &m_context;
};

} // namespace

RulesEngine::RulesEngine() = default;

RulesEngine::RulesEngine(ExpressionEvaluator evaluator)
    : m_evaluator(std::move(evaluator))
{
}

bool RulesEngine::setCollectionRules(const CollectionRules &rules, std::string *error)
{
    auto compiled = compile(rules, error);
    if (!compiled) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_collections[rules.name] = std::move(compiled);
    }
    RLOG_INFO(QStringLiteral("RulesEngine"),
              QStringLiteral("setCollectionRules"),
              QStringLiteral("rules_installed"),
              QStringLiteral("rules_update"),
              QStringLiteral("in_memory_swap"),
              rulecast::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"collection", rules.name}}));
    return true;
}

bool RulesEngine::validateCollectionRules(const CollectionRules &rules, std::string *error) const
{
    return compile(rules, error) != nullptr;
}

std::shared_ptr<const RulesEngine::CompiledCollection> RulesEngine::compile(
    const CollectionRules &rules,
    std::string *error)
{
    if (rules.name.empty()) {
        if (error) {
            *error = "collection name is required";
        }
        return nullptr;
    }

    auto compiled = std::make_shared<CompiledCollection>();
    compiled->source = rules;
    for (RuleType type : kRuleTypes) {
        CompiledRule &slot = compiled->rules[ruleIndex(type)];
        slot.rule = rules.rule(type);
        if (slot.rule.kind != AccessRule::Kind::Expression) {
            continue;
        }
        const expr::ParseResult parsed = expr::parseExpression(slot.rule.expression);
        if (!parsed.ok()) {
            if (error) {
                *error = toRuleTypeString(type) + "Rule: " + parsed.error
                    + " at position " + std::to_string(parsed.position);
            }
            RLOG_WARN(QStringLiteral("RulesEngine"),
                      QStringLiteral("compile"),
                      QStringLiteral("rule_rejected"),
                      QStringLiteral("parse_error"),
                      QStringLiteral("expression_parser"),
                      rulecast::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"collection", rules.name},
                                      {"ruleType", toRuleTypeString(type)},
                                      {"error", parsed.error}}));
            return nullptr;
        }
        slot.root = parsed.root;
    }
    return compiled;
}

bool RulesEngine::removeCollection(const std::string &name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_collections.erase(name) > 0;
}

bool RulesEngine::hasCollection(const std::string &name) const
{
    return lookup(name) != nullptr;
}

std::optional<CollectionRules> RulesEngine::collectionRules(const std::string &name) const
{
    const auto compiled = lookup(name);
    if (!compiled) {
        return std::nullopt;
    }
    return compiled->source;
}

std::vector<CollectionRules> RulesEngine::listCollections() const
{
    std::vector<CollectionRules> result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        result.reserve(m_collections.size());
        for (const auto &entry : m_collections) {
            result.push_back(entry.second->source);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const CollectionRules &a, const CollectionRules &b) {
                  return a.name < b.name;
              });
    return result;
}

bool RulesEngine::checkRule(const std::string &collection,
                            RuleType type,
                            const RuleContext &context) const
{
    if (context.admin) {
        return true;
    }

    const auto compiled = lookup(collection);
    if (!compiled) {
        RLOG_DEBUG(QStringLiteral("RulesEngine"),
                   QStringLiteral("checkRule"),
                   QStringLiteral("rule_denied"),
                   QStringLiteral("unknown_collection"),
                   QStringLiteral("fail_closed"),
                   rulecast::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"collection", collection},
                                   {"ruleType", toRuleTypeString(type)}}));
        return false;
    }

    const CompiledRule &slot = compiled->rules[ruleIndex(type)];
    switch (slot.rule.kind) {
    case AccessRule::Kind::DenyAll:
        return false;
    case AccessRule::Kind::AllowAll:
        return true;
    case AccessRule::Kind::Expression:
        break;
    }
    if (!slot.root) {
        return false;
    }

    const EvalResult result = m_evaluator.evaluate(*slot.root, context);
    if (!result.ok()) {
        RLOG_WARN(QStringLiteral("RulesEngine"),
                  QStringLiteral("checkRule"),
                  QStringLiteral("rule_evaluation_failed"),
                  QStringLiteral("runtime_error"),
                  QStringLiteral("fail_closed"),
                  rulecast::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"collection", collection},
                                  {"ruleType", toRuleTypeString(type)},
                                  {"error", result.error}}));
        return false;
    }
    return ExpressionEvaluator::truthy(result.value);
}

std::optional<FilterFragment> RulesEngine::generateFilter(const std::string &collection,
                                                          const RuleContext &context) const
{
    if (context.admin) {
        return FilterFragment::alwaysTrue();
    }

    const auto compiled = lookup(collection);
    if (!compiled) {
        return FilterFragment::alwaysFalse();
    }

    const CompiledRule &slot = compiled->rules[ruleIndex(RuleType::List)];
    switch (slot.rule.kind) {
    case AccessRule::Kind::DenyAll:
        return FilterFragment::alwaysFalse();
    case AccessRule::Kind::AllowAll:
        return FilterFragment::alwaysTrue();
    case AccessRule::Kind::Expression:
        break;
    }
    if (!slot.root) {
        return FilterFragment::alwaysFalse();
    }

    FilterTranslator translator(m_evaluator, context);
    Translation translation = translator.translate(*slot.root);
    switch (translation.kind) {
    case Translation::Kind::True:
        return FilterFragment::alwaysTrue();
    case Translation::Kind::False:
        return FilterFragment::alwaysFalse();
    case Translation::Kind::Clause:
        return FilterFragment{std::move(translation.clause), std::move(translation.params)};
    case Translation::Kind::Unsupported:
        break;
    }

    RLOG_DEBUG(QStringLiteral("RulesEngine"),
               QStringLiteral("generateFilter"),
               QStringLiteral("filter_not_pushed_down"),
               QStringLiteral("unrecognized_rule_shape"),
               QStringLiteral("per_record_evaluation"),
               rulecast::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"collection", collection}}));
    return std::nullopt;
}

std::shared_ptr<const RulesEngine::CompiledCollection> RulesEngine::lookup(
    const std::string &name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_collections.find(name);
    if (it == m_collections.end()) {
        return nullptr;
    }
    return it->second;
}

} // namespace rulecast

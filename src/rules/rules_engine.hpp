#pragma once

#include <array>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/models.hpp"
#include "rules/expression.hpp"
#include "rules/expression_evaluator.hpp"

namespace rulecast {

/**
 * RulesEngine answers access questions for a collection and operation.
 *
 * Rules are compiled once when installed. Lookups copy an immutable snapshot
 * of the collection out from under the mutex, so evaluation never holds it.
 * Every failure path denies: unknown collections, deny-all rules, and
 * expressions that fail to evaluate.
 */
class RulesEngine {
public:
    RulesEngine();
    explicit RulesEngine(ExpressionEvaluator evaluator);

    // Compiles every expression in rules. On a parse error nothing is
    // installed and error describes the offending rule.
    bool setCollectionRules(const CollectionRules &rules, std::string *error = nullptr);
    // Compiles rules without installing them.
    bool validateCollectionRules(const CollectionRules &rules, std::string *error = nullptr) const;
    bool removeCollection(const std::string &name);
    bool hasCollection(const std::string &name) const;
    std::optional<CollectionRules> collectionRules(const std::string &name) const;
    std::vector<CollectionRules> listCollections() const;

    bool checkRule(const std::string &collection,
                   RuleType type,
                   const RuleContext &context) const;

    // Translates the list rule into a storage predicate. nullopt means the
    // rule shape is not recognized and rows must be checked one by one.
    std::optional<FilterFragment> generateFilter(const std::string &collection,
                                                 const RuleContext &context) const;

private:
    struct CompiledRule {
        AccessRule rule;
        expr::NodePtr root;
    };

    struct CompiledCollection {
        CollectionRules source;
        std::array<CompiledRule, 5> rules;
    };

    static std::shared_ptr<const CompiledCollection> compile(const CollectionRules &rules,
                                                             std::string *error);
    std::shared_ptr<const CompiledCollection> lookup(const std::string &name) const;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<const CompiledCollection>> m_collections;
    ExpressionEvaluator m_evaluator;
};

} // namespace rulecast

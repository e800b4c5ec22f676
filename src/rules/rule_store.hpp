#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace rulecast {

// RuleStore is the SQLite persistence layer for per-collection access rules.
// A NULL column is a deny-all rule, an empty string an allow-all rule.
class RuleStore {
public:
    RuleStore();
    ~RuleStore();

    std::vector<CollectionRules> listCollectionRules() const;
    std::optional<CollectionRules> getCollectionRules(const std::string &name) const;
    void upsertCollectionRules(const CollectionRules &rules);
    bool deleteCollectionRules(const std::string &name);

    bool integrityCheck(std::string *message = nullptr) const;

    static std::string databasePath();

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace rulecast

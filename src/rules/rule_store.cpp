#include "rules/rule_store.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include <sqlite3.h>

namespace rulecast {

namespace {

constexpr const char *kCreateCollectionRulesTable =
    "CREATE TABLE IF NOT EXISTS collection_rules ("
    "    name TEXT PRIMARY KEY,"
    "    list_rule TEXT,"
    "    view_rule TEXT,"
    "    create_rule TEXT,"
    "    update_rule TEXT,"
    "    delete_rule TEXT,"
    "    updated_at INTEGER NOT NULL DEFAULT (strftime('%s','now'))"
    ");";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ")
                                     + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindRule(sqlite3_stmt *stmt, int index, const AccessRule &rule)
{
    switch (rule.kind) {
    case AccessRule::Kind::DenyAll:
        sqlite3_bind_null(stmt, index);
        return;
    case AccessRule::Kind::AllowAll:
        bindText(stmt, index, std::string());
        return;
    case AccessRule::Kind::Expression:
        bindText(stmt, index, rule.expression);
        return;
    }
    sqlite3_bind_null(stmt, index);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

AccessRule columnRule(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return AccessRule::denyAll();
    }
    return AccessRule::fromExpression(columnText(stmt, index));
}

CollectionRules readRow(sqlite3_stmt *stmt)
{
    CollectionRules rules;
    rules.name = columnText(stmt, 0);
    rules.listRule = columnRule(stmt, 1);
    rules.viewRule = columnRule(stmt, 2);
    rules.createRule = columnRule(stmt, 3);
    rules.updateRule = columnRule(stmt, 4);
    rules.deleteRule = columnRule(stmt, 5);
    return rules;
}

} // namespace

struct RuleStore::Impl {
    sqlite3 *db = nullptr;
};

std::string RuleStore::databasePath()
{
    const char *home = std::getenv("HOME");
    std::filesystem::path basePath = home ? home : ".";
    basePath /= ".local/share/rulecast";
    return (basePath / "rulecast.db").string();
}

RuleStore::RuleStore()
    : impl(std::make_unique<Impl>())
{
    const std::filesystem::path dbPath = databasePath();
    std::filesystem::create_directories(dbPath.parent_path());

    if (sqlite3_open(dbPath.string().c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw std::runtime_error("failed to open rulecast database: " + message);
    }

    execOrThrow(impl->db, "PRAGMA journal_mode=WAL;");
    execOrThrow(impl->db, kCreateCollectionRulesTable);
}

RuleStore::~RuleStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
    }
}

std::vector<CollectionRules> RuleStore::listCollectionRules() const
{
    Statement stmt(impl->db,
                   "SELECT name, list_rule, view_rule, create_rule, update_rule, delete_rule "
                   "FROM collection_rules ORDER BY name ASC;");

    std::vector<CollectionRules> result;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        result.push_back(readRow(stmt.get()));
    }
    return result;
}

std::optional<CollectionRules> RuleStore::getCollectionRules(const std::string &name) const
{
    Statement stmt(impl->db,
                   "SELECT name, list_rule, view_rule, create_rule, update_rule, delete_rule "
                   "FROM collection_rules WHERE name = ? LIMIT 1;");
    bindText(stmt.get(), 1, name);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readRow(stmt.get());
}

void RuleStore::upsertCollectionRules(const CollectionRules &rules)
{
    Statement stmt(impl->db,
                   "INSERT INTO collection_rules "
                   "(name, list_rule, view_rule, create_rule, update_rule, delete_rule, updated_at) "
                   "VALUES (?, ?, ?, ?, ?, ?, strftime('%s','now')) "
                   "ON CONFLICT(name) DO UPDATE SET "
                   "list_rule = excluded.list_rule, "
                   "view_rule = excluded.view_rule, "
                   "create_rule = excluded.create_rule, "
                   "update_rule = excluded.update_rule, "
                   "delete_rule = excluded.delete_rule, "
                   "updated_at = excluded.updated_at;");
    bindText(stmt.get(), 1, rules.name);
    bindRule(stmt.get(), 2, rules.listRule);
    bindRule(stmt.get(), 3, rules.viewRule);
    bindRule(stmt.get(), 4, rules.createRule);
    bindRule(stmt.get(), 5, rules.updateRule);
    bindRule(stmt.get(), 6, rules.deleteRule);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error(std::string("failed to upsert collection rules: ")
                                 + sqlite3_errmsg(impl->db));
    }
}

bool RuleStore::deleteCollectionRules(const std::string &name)
{
    Statement stmt(impl->db, "DELETE FROM collection_rules WHERE name = ?;");
    bindText(stmt.get(), 1, name);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error(std::string("failed to delete collection rules: ")
                                 + sqlite3_errmsg(impl->db));
    }
    return sqlite3_changes(impl->db) > 0;
}

bool RuleStore::integrityCheck(std::string *message) const
{
    Statement stmt(impl->db, "PRAGMA integrity_check;");

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

} // namespace rulecast

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace rulecast::expr {

constexpr std::size_t kMaxExpressionLength = 4096;
constexpr int kMaxDepth = 32;
constexpr int kMaxNodes = 512;

enum class FieldRoot {
    Auth,
    Record,
    Data
};

enum class BinaryOpKind {
    Equal,
    NotEqual,
    Greater,
    Less,
    GreaterEqual,
    LessEqual,
    And,
    Or
};

enum class UnaryOpKind {
    Not
};

// The closed helper set. Nothing else is callable from an expression.
enum class Function {
    Now,
    Contains,
    Size,
    IsEmpty,
    IsNotEmpty
};

struct Node;
using NodePtr = std::shared_ptr<const Node>;

struct Literal {
    nlohmann::json value;
};

struct FieldAccess {
    FieldRoot root;
    std::vector<std::string> path;
};

struct BinaryOp {
    BinaryOpKind op;
    NodePtr lhs;
    NodePtr rhs;
};

struct UnaryOp {
    UnaryOpKind op;
    NodePtr operand;
};

struct Call {
    Function function;
    std::vector<NodePtr> args;
};

struct Node {
    std::variant<Literal, FieldAccess, BinaryOp, UnaryOp, Call> value;
};

// Rule mode accepts only paths rooted at auth/record/data. Filter mode also
// accepts bare paths, which resolve against record.
enum class ParseMode {
    Rule,
    Filter
};

struct ParseResult {
    NodePtr root;
    std::string error;
    std::size_t position = 0;

    bool ok() const { return root != nullptr; }
};

ParseResult parseExpression(const std::string &source,
                            ParseMode mode = ParseMode::Rule);

bool isComparison(BinaryOpKind op);
std::string toRootString(FieldRoot root);
std::string toOperatorString(BinaryOpKind op);

// Swaps the operands of a comparison: `a < b` becomes `b > a`.
BinaryOpKind mirrored(BinaryOpKind op);

} // namespace rulecast::expr

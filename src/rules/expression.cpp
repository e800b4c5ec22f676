#include "rules/expression.hpp"

#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace rulecast::expr {

namespace {

enum class TokenKind {
    Identifier,
    Function,
    String,
    Number,
    Operator,
    LParen,
    RParen,
    Comma,
    Dot,
    End
};

struct Token {
    TokenKind kind;
    std::string text;
    nlohmann::json literal;
    std::size_t position = 0;
};

class ParseError : public std::runtime_error {
public:
    ParseError(const std::string &message, std::size_t position)
        : std::runtime_error(message)
        , m_position(position)
    {
    }

    std::size_t position() const { return m_position; }

private:
    std::size_t m_position;
};

bool isIdentStart(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isDigit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

nlohmann::json numberLiteral(const std::string &text, std::size_t position)
{
    try {
        if (text.find('.') != std::string::npos) {
            return std::stod(text);
        }
        return static_cast<std::int64_t>(std::stoll(text));
    } catch (const std::out_of_range &) {
        try {
            return std::stod(text);
        } catch (const std::exception &) {
            throw ParseError("number out of range '" + text + "'", position);
        }
    } catch (const std::invalid_argument &) {
        throw ParseError("invalid number '" + text + "'", position);
    }
}

std::vector<Token> tokenize(const std::string &source)
{
    std::vector<Token> tokens;
    std::size_t i = 0;
    const std::size_t n = source.size();

    while (i < n) {
        const char c = source[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        const std::size_t start = i;

        if (isIdentStart(c)) {
            while (i < n && isIdentChar(source[i])) {
                ++i;
            }
            tokens.push_back({TokenKind::Identifier, source.substr(start, i - start), {}, start});
            continue;
        }

        if (c == '$') {
            ++i;
            if (i >= n || !isIdentStart(source[i])) {
                throw ParseError("expected function name after '$'", start);
            }
            while (i < n && isIdentChar(source[i])) {
                ++i;
            }
            tokens.push_back({TokenKind::Function, source.substr(start + 1, i - start - 1), {}, start});
            continue;
        }

        if (isDigit(c) || (c == '-' && i + 1 < n && isDigit(source[i + 1]))) {
            ++i;
            while (i < n && isDigit(source[i])) {
                ++i;
            }
            if (i + 1 < n && source[i] == '.' && isDigit(source[i + 1])) {
                ++i;
                while (i < n && isDigit(source[i])) {
                    ++i;
                }
            }
            const std::string text = source.substr(start, i - start);
            tokens.push_back({TokenKind::Number, text, numberLiteral(text, start), start});
            continue;
        }

        if (c == '\'' || c == '"') {
            const char quote = c;
            ++i;
            std::string value;
            bool closed = false;
            while (i < n) {
                const char ch = source[i++];
                if (ch == quote) {
                    closed = true;
                    break;
                }
                if (ch == '\\') {
                    if (i >= n) {
                        break;
                    }
                    const char escaped = source[i++];
                    switch (escaped) {
                    case 'n':
                        value.push_back('\n');
                        break;
                    case 't':
                        value.push_back('\t');
                        break;
                    default:
                        value.push_back(escaped);
                        break;
                    }
                    continue;
                }
                value.push_back(ch);
            }
            if (!closed) {
                throw ParseError("unterminated string literal", start);
            }
            tokens.push_back({TokenKind::String, source.substr(start, i - start), value, start});
            continue;
        }

        const std::string two = source.substr(i, 2);
        if (two == "&&" || two == "||" || two == "==" || two == "!="
            || two == ">=" || two == "<=") {
            tokens.push_back({TokenKind::Operator, two, {}, start});
            i += 2;
            continue;
        }

        switch (c) {
        case '=':
        case '>':
        case '<':
        case '!':
            tokens.push_back({TokenKind::Operator, std::string(1, c), {}, start});
            ++i;
            continue;
        case '(':
            tokens.push_back({TokenKind::LParen, "(", {}, start});
            ++i;
            continue;
        case ')':
            tokens.push_back({TokenKind::RParen, ")", {}, start});
            ++i;
            continue;
        case ',':
            tokens.push_back({TokenKind::Comma, ",", {}, start});
            ++i;
            continue;
        case '.':
            tokens.push_back({TokenKind::Dot, ".", {}, start});
            ++i;
            continue;
        default:
            break;
        }

        throw ParseError(std::string("unexpected character '") + c + "'", start);
    }

    tokens.push_back({TokenKind::End, "", {}, n});
    return tokens;
}

struct FunctionSpec {
    const char *name;
    Function function;
    std::size_t arity;
};

constexpr FunctionSpec kFunctions[] = {
    {"now", Function::Now, 0},
    {"contains", Function::Contains, 2},
    {"size", Function::Size, 1},
    {"isEmpty", Function::IsEmpty, 1},
    {"isNotEmpty", Function::IsNotEmpty, 1},
};

class Parser {
public:
    Parser(std::vector<Token> tokens, ParseMode mode)
        : m_tokens(std::move(tokens))
        , m_mode(mode)
    {
    }

    NodePtr parse()
    {
        NodePtr root = parseOr();
        if (peek().kind != TokenKind::End) {
            throw ParseError("unexpected token '" + peek().text + "'", peek().position);
        }
        return root;
    }

private:
    class DepthGuard {
    public:
        DepthGuard(Parser &parser, std::size_t position)
            : m_parser(parser)
        {
            if (++m_parser.m_depth > kMaxDepth) {
                throw ParseError("expression nesting too deep", position);
            }
        }
        ~DepthGuard() { --m_parser.m_depth; }

    private:
        Parser &m_parser;
    };

    const Token &peek() const { return m_tokens[m_index]; }

    const Token &advance()
    {
        const Token &token = m_tokens[m_index];
        if (token.kind != TokenKind::End) {
            ++m_index;
        }
        return token;
    }

    bool matchOperator(const char *op)
    {
        if (peek().kind == TokenKind::Operator && peek().text == op) {
            advance();
            return true;
        }
        return false;
    }

    void expect(TokenKind kind, const char *what)
    {
        if (peek().kind != kind) {
            const std::string found = peek().kind == TokenKind::End
                ? std::string("end of expression")
                : "'" + peek().text + "'";
            throw ParseError(std::string("expected ") + what + ", found " + found,
                             peek().position);
        }
        advance();
    }

    template <typename T>
    NodePtr makeNode(T value, std::size_t position)
    {
        if (++m_nodeCount > kMaxNodes) {
            throw ParseError("expression too large", position);
        }
        return std::make_shared<const Node>(Node{std::move(value)});
    }

    NodePtr parseOr()
    {
        DepthGuard guard(*this, peek().position);
        NodePtr lhs = parseAnd();
        while (peek().kind == TokenKind::Operator && peek().text == "||") {
            const std::size_t position = advance().position;
            NodePtr rhs = parseAnd();
            lhs = makeNode(BinaryOp{BinaryOpKind::Or, lhs, rhs}, position);
        }
        return lhs;
    }

    NodePtr parseAnd()
    {
        NodePtr lhs = parseComparison();
        while (peek().kind == TokenKind::Operator && peek().text == "&&") {
            const std::size_t position = advance().position;
            NodePtr rhs = parseComparison();
            lhs = makeNode(BinaryOp{BinaryOpKind::And, lhs, rhs}, position);
        }
        return lhs;
    }

    static bool comparisonFor(const std::string &text, BinaryOpKind &out)
    {
        if (text == "=" || text == "==") {
            out = BinaryOpKind::Equal;
        } else if (text == "!=") {
            out = BinaryOpKind::NotEqual;
        } else if (text == ">") {
            out = BinaryOpKind::Greater;
        } else if (text == "<") {
            out = BinaryOpKind::Less;
        } else if (text == ">=") {
            out = BinaryOpKind::GreaterEqual;
        } else if (text == "<=") {
            out = BinaryOpKind::LessEqual;
        } else {
            return false;
        }
        return true;
    }

    NodePtr parseComparison()
    {
        NodePtr lhs = parseUnary();
        BinaryOpKind op;
        if (peek().kind != TokenKind::Operator || !comparisonFor(peek().text, op)) {
            return lhs;
        }
        const std::size_t position = advance().position;
        NodePtr rhs = parseUnary();
        if (peek().kind == TokenKind::Operator && comparisonFor(peek().text, op)) {
            throw ParseError("comparisons cannot be chained", peek().position);
        }
        return makeNode(BinaryOp{op, lhs, rhs}, position);
    }

    NodePtr parseUnary()
    {
        DepthGuard guard(*this, peek().position);
        if (peek().kind == TokenKind::Operator && peek().text == "!") {
            const std::size_t position = advance().position;
            NodePtr operand = parseUnary();
            return makeNode(UnaryOp{UnaryOpKind::Not, operand}, position);
        }
        return parsePrimary();
    }

    NodePtr parsePrimary()
    {
        const Token &token = peek();
        switch (token.kind) {
        case TokenKind::Number:
        case TokenKind::String: {
            advance();
            return makeNode(Literal{token.literal}, token.position);
        }
        case TokenKind::Identifier:
            return parseIdentifier();
        case TokenKind::Function:
            return parseCall();
        case TokenKind::LParen: {
            advance();
            NodePtr inner = parseOr();
            expect(TokenKind::RParen, "')'");
            return inner;
        }
        case TokenKind::End:
            throw ParseError("unexpected end of expression", token.position);
        default:
            break;
        }
        throw ParseError("unexpected token '" + token.text + "'", token.position);
    }

    NodePtr parseIdentifier()
    {
        const Token &first = advance();
        if (first.text == "true") {
            return makeNode(Literal{true}, first.position);
        }
        if (first.text == "false") {
            return makeNode(Literal{false}, first.position);
        }
        if (first.text == "null") {
            return makeNode(Literal{nullptr}, first.position);
        }

        std::vector<std::string> segments{first.text};
        while (peek().kind == TokenKind::Dot) {
            advance();
            if (peek().kind != TokenKind::Identifier) {
                throw ParseError("expected field name after '.'", peek().position);
            }
            segments.push_back(advance().text);
        }

        FieldAccess access{FieldRoot::Record, {}};
        const std::string &head = segments.front();
        if (m_mode == ParseMode::Filter) {
            if (head == "record") {
                access.path.assign(segments.begin() + 1, segments.end());
            } else {
                access.path = segments;
            }
            return makeNode(std::move(access), first.position);
        }

        if (head == "auth") {
            access.root = FieldRoot::Auth;
        } else if (head == "record") {
            access.root = FieldRoot::Record;
        } else if (head == "data") {
            access.root = FieldRoot::Data;
        } else {
            throw ParseError("unknown identifier '" + head + "'", first.position);
        }
        access.path.assign(segments.begin() + 1, segments.end());
        return makeNode(std::move(access), first.position);
    }

    NodePtr parseCall()
    {
        const Token &name = advance();
        const FunctionSpec *spec = nullptr;
        for (const auto &candidate : kFunctions) {
            if (name.text == candidate.name) {
                spec = &candidate;
                break;
            }
        }
        if (!spec) {
            throw ParseError("unknown function '$" + name.text + "'", name.position);
        }
        // Filters must give the same answer for the same record at any time.
        if (m_mode == ParseMode::Filter && spec->function == Function::Now) {
            throw ParseError("$now() is not allowed in filters", name.position);
        }

        DepthGuard guard(*this, name.position);
        expect(TokenKind::LParen, "'('");
        std::vector<NodePtr> args;
        if (peek().kind != TokenKind::RParen) {
            args.push_back(parseOr());
            while (peek().kind == TokenKind::Comma) {
                advance();
                args.push_back(parseOr());
            }
        }
        expect(TokenKind::RParen, "')'");

        if (args.size() != spec->arity) {
            throw ParseError("$" + name.text + " expects "
                                 + std::to_string(spec->arity) + " argument(s), got "
                                 + std::to_string(args.size()),
                             name.position);
        }
        return makeNode(Call{spec->function, std::move(args)}, name.position);
    }

    std::vector<Token> m_tokens;
    std::size_t m_index = 0;
    ParseMode m_mode;
    int m_depth = 0;
    int m_nodeCount = 0;
};

} // namespace

ParseResult parseExpression(const std::string &source, ParseMode mode)
{
    ParseResult result;
    if (source.size() > kMaxExpressionLength) {
        result.error = "expression exceeds " + std::to_string(kMaxExpressionLength)
            + " characters";
        result.position = kMaxExpressionLength;
        return result;
    }
    if (source.find_first_not_of(" \t\r\n") == std::string::npos) {
        result.error = "empty expression";
        return result;
    }

    try {
        Parser parser(tokenize(source), mode);
        result.root = parser.parse();
    } catch (const ParseError &ex) {
        result.root.reset();
        result.error = ex.what();
        result.position = ex.position();
    }
    return result;
}

bool isComparison(BinaryOpKind op)
{
    return op != BinaryOpKind::And && op != BinaryOpKind::Or;
}

std::string toRootString(FieldRoot root)
{
    switch (root) {
    case FieldRoot::Auth:
        return "auth";
    case FieldRoot::Record:
        return "record";
    case FieldRoot::Data:
        return "data";
    }
    return "record";
}

std::string toOperatorString(BinaryOpKind op)
{
    switch (op) {
    case BinaryOpKind::Equal:
        return "=";
    case BinaryOpKind::NotEqual:
        return "!=";
    case BinaryOpKind::Greater:
        return ">";
    case BinaryOpKind::Less:
        return "<";
    case BinaryOpKind::GreaterEqual:
        return ">=";
    case BinaryOpKind::LessEqual:
        return "<=";
    case BinaryOpKind::And:
        return "&&";
    case BinaryOpKind::Or:
        return "||";
    }
    return "=";
}

BinaryOpKind mirrored(BinaryOpKind op)
{
    switch (op) {
    case BinaryOpKind::Greater:
        return BinaryOpKind::Less;
    case BinaryOpKind::Less:
        return BinaryOpKind::Greater;
    case BinaryOpKind::GreaterEqual:
        return BinaryOpKind::LessEqual;
    case BinaryOpKind::LessEqual:
        return BinaryOpKind::GreaterEqual;
    default:
        return op;
    }
}

} // namespace rulecast::expr

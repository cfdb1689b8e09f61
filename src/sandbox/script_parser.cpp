#include "sandbox/script_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace ael::sandbox::script {

using core::errors::AelError;
using core::errors::ErrorCategory;

namespace {

enum class TokenType {
    Identifier,
    Number,
    String,
    Symbol,
    Newline,
    End
};

struct Token {
    TokenType type = TokenType::End;
    std::string text;
    nlohmann::json value;
    int line = 1;
};

struct ParseFailure {
    int line;
    std::string message;
};

const std::set<std::string>& keywords() {
    static const std::set<std::string> kKeywords = {
        "import", "from", "as",    "if",  "else", "while", "for",  "in",
        "break",  "continue", "and", "or", "not",  "true",  "false", "null"};
    return kKeywords;
}

bool is_keyword(const std::string& text) {
    return keywords().count(text) != 0;
}

std::vector<Token> tokenize(const std::string& source) {
    std::vector<Token> tokens;
    int line = 1;
    std::size_t i = 0;
    const std::size_t n = source.size();

    auto push = [&tokens, &line](TokenType type, std::string text,
                                 nlohmann::json value = nullptr) {
        Token token;
        token.type = type;
        token.text = std::move(text);
        token.value = std::move(value);
        token.line = line;
        tokens.push_back(std::move(token));
    };

    while (i < n) {
        const char c = source[i];
        if (c == ' ' || c == '\t' || c == '\r') {
            ++i;
            continue;
        }
        if (c == '#') {
            while (i < n && source[i] != '\n') {
                ++i;
            }
            continue;
        }
        if (c == '\n' || c == ';') {
            push(TokenType::Newline, std::string(1, c));
            if (c == '\n') {
                ++line;
            }
            ++i;
            continue;
        }
        if (std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_') {
            const std::size_t start = i;
            while (i < n && (std::isalnum(static_cast<unsigned char>(source[i])) != 0 ||
                             source[i] == '_')) {
                ++i;
            }
            push(TokenType::Identifier, source.substr(start, i - start));
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
            const std::size_t start = i;
            bool is_float = false;
            while (i < n && std::isdigit(static_cast<unsigned char>(source[i])) != 0) {
                ++i;
            }
            if (i + 1 < n && source[i] == '.' &&
                std::isdigit(static_cast<unsigned char>(source[i + 1])) != 0) {
                is_float = true;
                ++i;
                while (i < n && std::isdigit(static_cast<unsigned char>(source[i])) != 0) {
                    ++i;
                }
            }
            if (i < n && (source[i] == 'e' || source[i] == 'E')) {
                std::size_t j = i + 1;
                if (j < n && (source[j] == '+' || source[j] == '-')) {
                    ++j;
                }
                if (j < n && std::isdigit(static_cast<unsigned char>(source[j])) != 0) {
                    is_float = true;
                    i = j;
                    while (i < n && std::isdigit(static_cast<unsigned char>(source[i])) != 0) {
                        ++i;
                    }
                }
            }
            const std::string text = source.substr(start, i - start);
            if (is_float) {
                errno = 0;
                const double parsed = std::strtod(text.c_str(), nullptr);
                if (errno == ERANGE) {
                    throw ParseFailure{line, "number out of range: " + text};
                }
                push(TokenType::Number, text, parsed);
            } else {
                std::int64_t parsed = 0;
                auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
                if (ec != std::errc() || ptr != text.data() + text.size()) {
                    throw ParseFailure{line, "integer out of range: " + text};
                }
                push(TokenType::Number, text, parsed);
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            const char quote = c;
            const int start_line = line;
            std::string text;
            ++i;
            bool closed = false;
            while (i < n) {
                const char ch = source[i];
                if (ch == quote) {
                    closed = true;
                    ++i;
                    break;
                }
                if (ch == '\n') {
                    break;
                }
                if (ch == '\\' && i + 1 < n) {
                    const char escaped = source[i + 1];
                    switch (escaped) {
                        case 'n': text.push_back('\n'); break;
                        case 't': text.push_back('\t'); break;
                        case '\\': text.push_back('\\'); break;
                        case '\'': text.push_back('\''); break;
                        case '"': text.push_back('"'); break;
                        default:
                            throw ParseFailure{line, std::string("unknown escape \\") + escaped};
                    }
                    i += 2;
                    continue;
                }
                text.push_back(ch);
                ++i;
            }
            if (!closed) {
                throw ParseFailure{start_line, "unterminated string literal"};
            }
            push(TokenType::String, text, text);
            continue;
        }

        if (i + 1 < n) {
            const std::string pair = source.substr(i, 2);
            if (pair == "==" || pair == "!=" || pair == "<=" || pair == ">=") {
                push(TokenType::Symbol, pair);
                i += 2;
                continue;
            }
        }
        static const std::string kSingle = "+-*/%<>=()[]{},.:";
        if (kSingle.find(c) != std::string::npos) {
            push(TokenType::Symbol, std::string(1, c));
            ++i;
            continue;
        }
        throw ParseFailure{line, std::string("unexpected character '") + c + "'"};
    }

    push(TokenType::End, "");
    return tokens;
}

// Counts one level of parser recursion for as long as it lives.
class NestingGuard {
public:
    explicit NestingGuard(int& depth) : depth_(depth) { ++depth_; }
    ~NestingGuard() { --depth_; }

    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;

private:
    int& depth_;
};

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    Program parse_program() {
        Program program;
        program.statements = parse_statements(false);
        return program;
    }

private:
    const Token& peek(const std::size_t ahead = 0) const {
        const std::size_t index = std::min(pos_ + ahead, tokens_.size() - 1);
        return tokens_[index];
    }

    const Token& advance() {
        const Token& token = tokens_[pos_];
        if (pos_ + 1 < tokens_.size()) {
            ++pos_;
        }
        return token;
    }

    bool check_symbol(const std::string& symbol) const {
        return peek().type == TokenType::Symbol && peek().text == symbol;
    }

    bool match_symbol(const std::string& symbol) {
        if (!check_symbol(symbol)) {
            return false;
        }
        advance();
        return true;
    }

    bool check_keyword(const std::string& keyword) const {
        return peek().type == TokenType::Identifier && peek().text == keyword;
    }

    bool match_keyword(const std::string& keyword) {
        if (!check_keyword(keyword)) {
            return false;
        }
        advance();
        return true;
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw ParseFailure{peek().line, message};
    }

    void expect_symbol(const std::string& symbol) {
        if (!match_symbol(symbol)) {
            fail("expected '" + symbol + "'" + describe_current());
        }
    }

    std::string expect_identifier(const std::string& what) {
        if (peek().type != TokenType::Identifier || is_keyword(peek().text)) {
            fail("expected " + what + describe_current());
        }
        return advance().text;
    }

    NestingGuard nest() {
        if (nesting_ >= kMaxNestingDepth) {
            fail("code is nested more than " + std::to_string(kMaxNestingDepth) +
                 " levels deep");
        }
        return NestingGuard(nesting_);
    }

    // Records the height of a freshly built node and rejects trees too tall
    // to walk.
    ExprPtr sealed(ExprPtr expr) {
        int deepest = 0;
        const auto visit = [&deepest](const ExprPtr& child) {
            if (child) {
                deepest = std::max(deepest, child->depth);
            }
        };
        visit(expr->target);
        visit(expr->index);
        for (const auto& item : expr->items) {
            visit(item);
        }
        expr->depth = deepest + 1;
        if (expr->depth > kMaxExpressionDepth) {
            throw ParseFailure{expr->line, "expression is more than " +
                                               std::to_string(kMaxExpressionDepth) +
                                               " levels deep"};
        }
        return expr;
    }

    std::string describe_current() const {
        switch (peek().type) {
            case TokenType::End:
                return " but reached end of code";
            case TokenType::Newline:
                return " but found end of line";
            default:
                return " but found '" + peek().text + "'";
        }
    }

    void skip_newlines() {
        while (peek().type == TokenType::Newline) {
            advance();
        }
    }

    std::string parse_dotted_name() {
        std::string name = expect_identifier("module name");
        while (match_symbol(".")) {
            name += "." + expect_identifier("module name");
        }
        return name;
    }

    std::vector<Stmt> parse_statements(const bool in_block) {
        std::vector<Stmt> statements;
        while (true) {
            skip_newlines();
            if (in_block && check_symbol("}")) {
                break;
            }
            if (peek().type == TokenType::End) {
                if (in_block) {
                    fail("missing '}' to close block");
                }
                break;
            }
            statements.push_back(parse_statement());
            if (peek().type == TokenType::Newline || peek().type == TokenType::End ||
                (in_block && check_symbol("}"))) {
                continue;
            }
            fail("expected end of statement" + describe_current());
        }
        return statements;
    }

    std::vector<Stmt> parse_block() {
        const auto guard = nest();
        expect_symbol("{");
        auto body = parse_statements(true);
        expect_symbol("}");
        return body;
    }

    std::vector<Stmt> parse_loop_body() {
        ++loop_depth_;
        auto body = parse_block();
        --loop_depth_;
        return body;
    }

    Stmt parse_statement() {
        Stmt stmt;
        stmt.line = peek().line;

        if (match_keyword("import")) {
            stmt.kind = StmtKind::Import;
            stmt.name = parse_dotted_name();
            stmt.alias = stmt.name;
            if (match_keyword("as")) {
                stmt.alias = expect_identifier("alias");
            }
            return stmt;
        }
        if (match_keyword("from")) {
            stmt.kind = StmtKind::FromImport;
            stmt.name = parse_dotted_name();
            if (!match_keyword("import")) {
                fail("expected 'import'" + describe_current());
            }
            stmt.names.push_back(expect_identifier("imported name"));
            while (match_symbol(",")) {
                stmt.names.push_back(expect_identifier("imported name"));
            }
            return stmt;
        }
        if (match_keyword("if")) {
            return parse_if(stmt.line);
        }
        if (match_keyword("while")) {
            stmt.kind = StmtKind::While;
            stmt.expr = parse_expression();
            stmt.body = parse_loop_body();
            return stmt;
        }
        if (match_keyword("for")) {
            stmt.kind = StmtKind::For;
            stmt.name = expect_identifier("loop variable");
            if (!match_keyword("in")) {
                fail("expected 'in'" + describe_current());
            }
            stmt.expr = parse_expression();
            stmt.body = parse_loop_body();
            return stmt;
        }
        if (check_keyword("break") || check_keyword("continue")) {
            if (loop_depth_ == 0) {
                fail("'" + peek().text + "' outside loop");
            }
            stmt.kind = advance().text == "break" ? StmtKind::Break : StmtKind::Continue;
            return stmt;
        }
        if (peek().type == TokenType::Identifier && !is_keyword(peek().text) &&
            peek(1).type == TokenType::Symbol && peek(1).text == "=") {
            stmt.kind = StmtKind::Assign;
            stmt.name = advance().text;
            advance();
            stmt.expr = parse_expression();
            return stmt;
        }

        stmt.kind = StmtKind::Expression;
        stmt.expr = parse_expression();
        return stmt;
    }

    Stmt parse_if(const int line) {
        const auto guard = nest();
        Stmt stmt;
        stmt.kind = StmtKind::If;
        stmt.line = line;
        stmt.expr = parse_expression();
        stmt.body = parse_block();

        const std::size_t saved = pos_;
        skip_newlines();
        if (match_keyword("else")) {
            if (check_keyword("if")) {
                const int nested_line = peek().line;
                advance();
                stmt.else_body.push_back(parse_if(nested_line));
            } else {
                stmt.else_body = parse_block();
            }
        } else {
            pos_ = saved;
        }
        return stmt;
    }

    ExprPtr make_expr(const ExprKind kind, const int line) {
        auto expr = std::make_unique<Expr>();
        expr->kind = kind;
        expr->line = line;
        return expr;
    }

    ExprPtr make_binary(std::string op, ExprPtr lhs, ExprPtr rhs, const int line) {
        auto expr = make_expr(ExprKind::Binary, line);
        expr->name = std::move(op);
        expr->target = std::move(lhs);
        expr->index = std::move(rhs);
        return sealed(std::move(expr));
    }

    ExprPtr parse_expression() {
        const auto guard = nest();
        return parse_or();
    }

    ExprPtr parse_or() {
        auto lhs = parse_and();
        while (check_keyword("or")) {
            const int line = advance().line;
            lhs = make_binary("or", std::move(lhs), parse_and(), line);
        }
        return lhs;
    }

    ExprPtr parse_and() {
        auto lhs = parse_not();
        while (check_keyword("and")) {
            const int line = advance().line;
            lhs = make_binary("and", std::move(lhs), parse_not(), line);
        }
        return lhs;
    }

    ExprPtr parse_not() {
        if (check_keyword("not")) {
            const int line = advance().line;
            auto expr = make_expr(ExprKind::Unary, line);
            expr->name = "not";
            const auto guard = nest();
            expr->target = parse_not();
            return sealed(std::move(expr));
        }
        return parse_comparison();
    }

    ExprPtr parse_comparison() {
        auto lhs = parse_additive();
        while (true) {
            const Token& token = peek();
            const bool is_compare =
                token.type == TokenType::Symbol &&
                (token.text == "==" || token.text == "!=" || token.text == "<" ||
                 token.text == "<=" || token.text == ">" || token.text == ">=");
            if (!is_compare && !check_keyword("in")) {
                return lhs;
            }
            const std::string op = token.text;
            const int line = advance().line;
            lhs = make_binary(op, std::move(lhs), parse_additive(), line);
        }
    }

    ExprPtr parse_additive() {
        auto lhs = parse_multiplicative();
        while (check_symbol("+") || check_symbol("-")) {
            const std::string op = peek().text;
            const int line = advance().line;
            lhs = make_binary(op, std::move(lhs), parse_multiplicative(), line);
        }
        return lhs;
    }

    ExprPtr parse_multiplicative() {
        auto lhs = parse_unary();
        while (check_symbol("*") || check_symbol("/") || check_symbol("%")) {
            const std::string op = peek().text;
            const int line = advance().line;
            lhs = make_binary(op, std::move(lhs), parse_unary(), line);
        }
        return lhs;
    }

    ExprPtr parse_unary() {
        if (check_symbol("-")) {
            const int line = advance().line;
            auto expr = make_expr(ExprKind::Unary, line);
            expr->name = "-";
            const auto guard = nest();
            expr->target = parse_unary();
            return sealed(std::move(expr));
        }
        return parse_postfix();
    }

    ExprPtr parse_postfix() {
        auto expr = parse_primary();
        while (true) {
            const int line = peek().line;
            if (match_symbol(".")) {
                auto member = make_expr(ExprKind::Member, line);
                member->name = expect_identifier("field name");
                member->target = std::move(expr);
                expr = sealed(std::move(member));
            } else if (match_symbol("[")) {
                skip_newlines();
                auto index = make_expr(ExprKind::Index, line);
                index->target = std::move(expr);
                index->index = parse_expression();
                skip_newlines();
                expect_symbol("]");
                expr = sealed(std::move(index));
            } else if (match_symbol("(")) {
                auto call = make_expr(ExprKind::Call, line);
                call->target = std::move(expr);
                call->items = parse_sequence(")");
                expr = sealed(std::move(call));
            } else {
                return expr;
            }
        }
    }

    // Comma-separated expressions up to `closer`; newlines and a trailing
    // comma are allowed.
    std::vector<ExprPtr> parse_sequence(const std::string& closer) {
        std::vector<ExprPtr> items;
        skip_newlines();
        while (!check_symbol(closer)) {
            items.push_back(parse_expression());
            skip_newlines();
            if (!match_symbol(",")) {
                break;
            }
            skip_newlines();
        }
        expect_symbol(closer);
        return items;
    }

    ExprPtr parse_primary() {
        const Token& token = peek();
        const int line = token.line;

        if (token.type == TokenType::Number || token.type == TokenType::String) {
            auto expr = make_expr(ExprKind::Literal, line);
            expr->literal = token.value;
            advance();
            return expr;
        }
        if (token.type == TokenType::Identifier) {
            if (token.text == "true" || token.text == "false" || token.text == "null") {
                auto expr = make_expr(ExprKind::Literal, line);
                if (token.text == "true") {
                    expr->literal = true;
                } else if (token.text == "false") {
                    expr->literal = false;
                }
                advance();
                return expr;
            }
            if (is_keyword(token.text)) {
                fail("unexpected keyword '" + token.text + "'");
            }
            auto expr = make_expr(ExprKind::Name, line);
            expr->name = advance().text;
            return expr;
        }
        if (match_symbol("(")) {
            skip_newlines();
            auto expr = parse_expression();
            skip_newlines();
            expect_symbol(")");
            return expr;
        }
        if (match_symbol("[")) {
            auto expr = make_expr(ExprKind::List, line);
            expr->items = parse_sequence("]");
            return sealed(std::move(expr));
        }
        if (match_symbol("{")) {
            auto expr = make_expr(ExprKind::Object, line);
            skip_newlines();
            while (!check_symbol("}")) {
                if (peek().type == TokenType::String) {
                    expr->keys.push_back(advance().text);
                } else {
                    expr->keys.push_back(expect_identifier("object key"));
                }
                expect_symbol(":");
                skip_newlines();
                expr->items.push_back(parse_expression());
                skip_newlines();
                if (!match_symbol(",")) {
                    break;
                }
                skip_newlines();
            }
            expect_symbol("}");
            return sealed(std::move(expr));
        }
        fail("expected an expression" + describe_current());
    }

    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    int loop_depth_ = 0;
    int nesting_ = 0;
};

}  // namespace

core::errors::Result<Program> parse_script(const std::string& source) {
    try {
        Parser parser(tokenize(source));
        Program program = parser.parse_program();
        return core::errors::Result<Program>(std::move(program));
    } catch (const ParseFailure& failure) {
        return AelError{ErrorCategory::Validation,
                        "line " + std::to_string(failure.line) + ": " + failure.message,
                        "bad_syntax"};
    }
}

}  // namespace ael::sandbox::script

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ael::sandbox::script {

enum class ExprKind {
    Literal,
    Name,
    List,
    Object,
    Member,
    Index,
    Call,
    Unary,
    Binary
};

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct Expr {
    ExprKind kind = ExprKind::Literal;
    int line = 0;
    nlohmann::json literal;          // Literal
    std::string name;                // Name, Member field, Unary/Binary operator
    std::vector<ExprPtr> items;      // List items, Object values, Call arguments
    std::vector<std::string> keys;   // Object keys
    ExprPtr target;                  // Member/Index base, Call callee, operand, lhs
    ExprPtr index;                   // Index key, Binary rhs
    int depth = 1;                   // height of this subtree
};

enum class StmtKind {
    Import,
    FromImport,
    Assign,
    Expression,
    If,
    While,
    For,
    Break,
    Continue
};

struct Stmt {
    StmtKind kind = StmtKind::Expression;
    int line = 0;
    std::string name;                // module, assignment target, loop variable
    std::string alias;               // import ... as alias
    std::vector<std::string> names;  // from ... import a, b
    ExprPtr expr;                    // value, condition or iterable
    std::vector<Stmt> body;
    std::vector<Stmt> else_body;
};

struct Program {
    std::vector<Stmt> statements;
};

}  // namespace ael::sandbox::script

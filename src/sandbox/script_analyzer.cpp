#include "sandbox/script_analyzer.hpp"

#include <algorithm>
#include <utility>

#include "core/errors/ael_errors.hpp"

namespace ael::sandbox::script {

using protocol::ViolationKind;

namespace {

class Analyzer {
public:
    Analyzer(const std::vector<std::string>& allowed_modules,
             const policy::PolicyGuard& guard)
        : allowed_modules_(allowed_modules), guard_(guard) {}

    std::optional<Violation> visit(const std::vector<Stmt>& statements) const {
        for (const auto& stmt : statements) {
            if (auto found = visit(stmt)) {
                return found;
            }
        }
        return std::nullopt;
    }

private:
    std::optional<Violation> visit(const Stmt& stmt) const {
        switch (stmt.kind) {
            case StmtKind::Import:
            case StmtKind::FromImport: {
                const auto verdict = guard_.validate_import(stmt.name, allowed_modules_);
                if (core::errors::is_error(verdict)) {
                    return Violation{ViolationKind::ForbiddenImport,
                                     core::errors::get_error(verdict).message, stmt.line};
                }
                if (guard_.is_eval_primitive(stmt.alias)) {
                    return eval_violation(stmt.alias, stmt.line);
                }
                for (const auto& name : stmt.names) {
                    if (guard_.is_eval_primitive(name)) {
                        return eval_violation(name, stmt.line);
                    }
                }
                return std::nullopt;
            }
            case StmtKind::Assign:
            case StmtKind::For:
                if (guard_.is_eval_primitive(stmt.name)) {
                    return eval_violation(stmt.name, stmt.line);
                }
                break;
            default:
                break;
        }

        if (stmt.expr) {
            if (auto found = visit(*stmt.expr)) {
                return found;
            }
        }
        if (auto found = visit(stmt.body)) {
            return found;
        }
        return visit(stmt.else_body);
    }

    std::optional<Violation> visit(const Expr& expr) const {
        if ((expr.kind == ExprKind::Name || expr.kind == ExprKind::Member) &&
            guard_.is_eval_primitive(expr.name)) {
            return eval_violation(expr.name, expr.line);
        }
        if (expr.target) {
            if (auto found = visit(*expr.target)) {
                return found;
            }
        }
        if (expr.index) {
            if (auto found = visit(*expr.index)) {
                return found;
            }
        }
        for (const auto& item : expr.items) {
            if (auto found = visit(*item)) {
                return found;
            }
        }
        return std::nullopt;
    }

    static Violation eval_violation(const std::string& name, const int line) {
        return Violation{ViolationKind::ForbiddenEval,
                         "'" + name + "' evaluates code dynamically and is not allowed",
                         line};
    }

    const std::vector<std::string>& allowed_modules_;
    const policy::PolicyGuard& guard_;
};

void collect_steps(const Expr& expr, std::vector<std::string>& out) {
    const bool reads_steps = expr.target && expr.target->kind == ExprKind::Name &&
                             expr.target->name == "steps";
    if (reads_steps && expr.kind == ExprKind::Member) {
        out.push_back(expr.name);
    } else if (reads_steps && expr.kind == ExprKind::Index && expr.index &&
               expr.index->kind == ExprKind::Literal && expr.index->literal.is_string()) {
        out.push_back(expr.index->literal.get<std::string>());
    }
    if (expr.target) {
        collect_steps(*expr.target, out);
    }
    if (expr.index) {
        collect_steps(*expr.index, out);
    }
    for (const auto& item : expr.items) {
        collect_steps(*item, out);
    }
}

void collect_steps(const std::vector<Stmt>& statements, std::vector<std::string>& out) {
    for (const auto& stmt : statements) {
        if (stmt.expr) {
            collect_steps(*stmt.expr, out);
        }
        collect_steps(stmt.body, out);
        collect_steps(stmt.else_body, out);
    }
}

}  // namespace

std::vector<std::string> referenced_steps(const Program& program) {
    std::vector<std::string> found;
    collect_steps(program.statements, found);
    std::vector<std::string> ids;
    for (auto& id : found) {
        if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
            ids.push_back(std::move(id));
        }
    }
    return ids;
}

std::optional<Violation> find_violation(const Program& program,
                                        const std::vector<std::string>& allowed_modules,
                                        const policy::PolicyGuard& guard) {
    return Analyzer(allowed_modules, guard).visit(program.statements);
}

}  // namespace ael::sandbox::script

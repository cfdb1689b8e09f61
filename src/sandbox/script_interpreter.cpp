#include "sandbox/script_interpreter.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <new>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>

namespace ael::sandbox::script {

using nlohmann::json;
using protocol::ViolationKind;

namespace {

struct ScriptFailure {
    std::string code;
    std::string message;
    int line = 0;
    std::optional<ViolationKind> violation;
};

[[noreturn]] void raise(const std::string& code, const std::string& message, const int line) {
    throw ScriptFailure{code, message, line, std::nullopt};
}

[[noreturn]] void raise_violation(const ViolationKind kind,
                                  const std::string& message,
                                  const int line) {
    throw ScriptFailure{protocol::to_string(kind), message, line, kind};
}

std::optional<ViolationKind> violation_for_code(const std::string& code) {
    if (code == "forbidden_import") {
        return ViolationKind::ForbiddenImport;
    }
    if (code == "forbidden_eval") {
        return ViolationKind::ForbiddenEval;
    }
    if (code == "forbidden_file_access") {
        return ViolationKind::ForbiddenFileAccess;
    }
    if (code == "resource_limit") {
        return ViolationKind::ResourceLimit;
    }
    return std::nullopt;
}

const std::map<std::string, std::set<std::string>>& module_functions() {
    static const std::map<std::string, std::set<std::string>> kModules = {
        {"math", {"sqrt", "floor", "ceil", "pow", "abs"}},
        {"json", {"parse", "dump"}},
        {"text", {"strip", "replace", "starts_with", "ends_with"}}};
    return kModules;
}

bool truthy(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            return false;
        case json::value_t::boolean:
            return value.get<bool>();
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            return value.get<std::int64_t>() != 0;
        case json::value_t::number_float:
            return value.get<double>() != 0.0;
        case json::value_t::string:
        case json::value_t::array:
        case json::value_t::object:
            return !value.empty();
        default:
            return false;
    }
}

bool is_int(const json& value) {
    return value.is_number_integer();
}

std::int64_t as_int(const json& value) {
    return value.get<std::int64_t>();
}

double as_double(const json& value) {
    return value.get<double>();
}

std::string describe(const json& value) {
    return value.type_name();
}

void expect_arity(const std::string& name,
                  const std::vector<json>& args,
                  const std::size_t min_count,
                  const std::size_t max_count,
                  const int line) {
    if (args.size() >= min_count && args.size() <= max_count) {
        return;
    }
    std::string expected = std::to_string(min_count);
    if (max_count != min_count) {
        expected += max_count == std::numeric_limits<std::size_t>::max()
                        ? " or more"
                        : " to " + std::to_string(max_count);
    }
    raise("type_error",
          name + "() takes " + expected + " argument(s), got " + std::to_string(args.size()),
          line);
}

const std::string& expect_string(const std::string& name, const json& value, const int line) {
    if (!value.is_string()) {
        raise("type_error", name + "() expects a string, got " + describe(value), line);
    }
    return value.get_ref<const std::string&>();
}

std::int64_t expect_int(const std::string& name, const json& value, const int line) {
    if (!is_int(value)) {
        raise("type_error", name + "() expects an integer, got " + describe(value), line);
    }
    return as_int(value);
}

double expect_number(const std::string& name, const json& value, const int line) {
    if (!value.is_number()) {
        raise("type_error", name + "() expects a number, got " + describe(value), line);
    }
    return as_double(value);
}

[[noreturn]] void overflow(const int line) {
    raise("arithmetic_overflow", "integer result out of range", line);
}

std::int64_t checked_add(const std::int64_t a, const std::int64_t b, const int line) {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if ((b > 0 && a > kMax - b) || (b < 0 && a < kMin - b)) {
        overflow(line);
    }
    return a + b;
}

std::int64_t checked_sub(const std::int64_t a, const std::int64_t b, const int line) {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if ((b < 0 && a > kMax + b) || (b > 0 && a < kMin + b)) {
        overflow(line);
    }
    return a - b;
}

std::int64_t checked_mul(const std::int64_t a, const std::int64_t b, const int line) {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if (a == 0 || b == 0) {
        return 0;
    }
    if (a > 0) {
        if ((b > 0 && a > kMax / b) || (b < 0 && b < kMin / a)) {
            overflow(line);
        }
    } else if ((b > 0 && a < kMin / b) || (b < 0 && a < kMax / b)) {
        overflow(line);
    }
    return a * b;
}

std::int64_t checked_negate(const std::int64_t value, const int line) {
    if (value == std::numeric_limits<std::int64_t>::min()) {
        overflow(line);
    }
    return -value;
}

json integral_or_float(const double value) {
    if (std::isfinite(value) &&
        value >= static_cast<double>(std::numeric_limits<std::int64_t>::min()) &&
        value < static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
        return static_cast<std::int64_t>(value);
    }
    return value;
}

// Numbers order numerically, strings lexicographically; nothing else orders.
int compare(const json& lhs, const json& rhs, const int line) {
    if (lhs.is_number() && rhs.is_number()) {
        if (is_int(lhs) && is_int(rhs)) {
            const auto a = as_int(lhs);
            const auto b = as_int(rhs);
            return a < b ? -1 : (a > b ? 1 : 0);
        }
        const double a = as_double(lhs);
        const double b = as_double(rhs);
        return a < b ? -1 : (a > b ? 1 : 0);
    }
    if (lhs.is_string() && rhs.is_string()) {
        const int order = lhs.get_ref<const std::string&>().compare(
            rhs.get_ref<const std::string&>());
        return order < 0 ? -1 : (order > 0 ? 1 : 0);
    }
    raise("type_error", "cannot order " + describe(lhs) + " and " + describe(rhs), line);
}

bool contains(const json& container, const json& needle, const int line) {
    if (container.is_array()) {
        return std::find(container.begin(), container.end(), needle) != container.end();
    }
    if (container.is_object()) {
        if (!needle.is_string()) {
            raise("type_error", "object keys are strings, got " + describe(needle), line);
        }
        return container.contains(needle.get<std::string>());
    }
    if (container.is_string()) {
        if (!needle.is_string()) {
            raise("type_error", "cannot search a string for " + describe(needle), line);
        }
        return container.get_ref<const std::string&>().find(
                   needle.get_ref<const std::string&>()) != std::string::npos;
    }
    raise("type_error", describe(container) + " is not a container", line);
}

std::string to_text(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

std::string trim(const std::string& value) {
    const auto first = std::find_if_not(value.begin(), value.end(), [](const unsigned char c) {
        return std::isspace(c) != 0;
    });
    const auto last = std::find_if_not(value.rbegin(), value.rend(), [](const unsigned char c) {
        return std::isspace(c) != 0;
    }).base();
    return first < last ? std::string(first, last) : std::string();
}

}  // namespace

std::size_t approximate_size(const json& value) {
    constexpr std::size_t kSlot = 16;
    switch (value.type()) {
        case json::value_t::string:
            return kSlot + value.get_ref<const std::string&>().size();
        case json::value_t::array: {
            std::size_t total = kSlot;
            for (const auto& item : value) {
                total += approximate_size(item);
            }
            return total;
        }
        case json::value_t::object: {
            std::size_t total = kSlot;
            for (auto it = value.begin(); it != value.end(); ++it) {
                total += kSlot + it.key().size() + approximate_size(it.value());
            }
            return total;
        }
        default:
            return kSlot;
    }
}

ScriptInterpreter::ScriptInterpreter(ScriptEnvironment environment,
                                     ScriptLimits limits,
                                     const policy::PolicyGuard& guard)
    : environment_(std::move(environment)), limits_(std::move(limits)), guard_(guard) {}

ScriptOutcome ScriptInterpreter::run(const Program& program) {
    ScriptOutcome outcome;
    variables_.clear();
    variable_sizes_.clear();
    modules_.clear();
    functions_.clear();
    memory_in_use_ = 0;
    operations_ = 0;
    variables_["result"] = nullptr;

    try {
        exec_block(program.statements);
        outcome.success = true;
        outcome.result = variables_["result"];
    } catch (const ScriptFailure& failure) {
        outcome.error_code = failure.code;
        outcome.violation = failure.violation;
        outcome.message = "line " + std::to_string(failure.line) + ": " + failure.message;
    } catch (const json::exception& e) {
        outcome.error_code = "type_error";
        outcome.message = e.what();
    } catch (const std::bad_alloc&) {
        outcome.error_code = protocol::to_string(ViolationKind::ResourceLimit);
        outcome.violation = ViolationKind::ResourceLimit;
        outcome.message = "allocation failed";
    } catch (const std::exception& e) {
        outcome.error_code = "script_error";
        outcome.message = e.what();
    }
    outcome.operations = operations_;
    return outcome;
}

void ScriptInterpreter::checkpoint(const int line) {
    ++operations_;
    if (operations_ > limits_.max_operations) {
        raise_violation(ViolationKind::ResourceLimit,
                        "operation budget of " + std::to_string(limits_.max_operations) +
                            " exceeded",
                        line);
    }
    if (limits_.cancel_token && limits_.cancel_token->load()) {
        raise_violation(ViolationKind::ResourceLimit, "execution cancelled", line);
    }
    if ((operations_ & 0x3F) == 1 && std::chrono::steady_clock::now() >= limits_.deadline) {
        raise_violation(ViolationKind::ResourceLimit, "wall-clock timeout exceeded", line);
    }
}

void ScriptInterpreter::charge(const std::size_t bytes, const int line) const {
    if (bytes > limits_.memory_ceiling_bytes ||
        memory_in_use_ > limits_.memory_ceiling_bytes - bytes) {
        raise_violation(ViolationKind::ResourceLimit,
                        "memory ceiling of " + std::to_string(limits_.memory_ceiling_bytes) +
                            " bytes exceeded",
                        line);
    }
}

void ScriptInterpreter::assign(const std::string& name, json value, const int line) {
    if (name == "inputs" || name == "steps") {
        raise("type_error", "'" + name + "' is read-only", line);
    }
    const std::size_t new_size = approximate_size(value);
    const std::size_t old_size = variable_sizes_[name];
    memory_in_use_ -= old_size;
    try {
        charge(new_size, line);
    } catch (const ScriptFailure&) {
        memory_in_use_ += old_size;
        throw;
    }
    memory_in_use_ += new_size;
    variable_sizes_[name] = new_size;
    variables_[name] = std::move(value);
    modules_.erase(name);
    functions_.erase(name);
}

ScriptInterpreter::Flow ScriptInterpreter::exec_block(const std::vector<Stmt>& statements) {
    for (const auto& stmt : statements) {
        const Flow flow = exec(stmt);
        if (flow != Flow::Normal) {
            return flow;
        }
    }
    return Flow::Normal;
}

ScriptInterpreter::Flow ScriptInterpreter::exec(const Stmt& stmt) {
    checkpoint(stmt.line);

    switch (stmt.kind) {
        case StmtKind::Import: {
            if (module_functions().count(stmt.name) == 0) {
                raise("name_error", "module '" + stmt.name + "' is not available", stmt.line);
            }
            modules_[stmt.alias] = stmt.name;
            return Flow::Normal;
        }
        case StmtKind::FromImport: {
            const auto module = module_functions().find(stmt.name);
            if (module == module_functions().end()) {
                raise("name_error", "module '" + stmt.name + "' is not available", stmt.line);
            }
            for (const auto& name : stmt.names) {
                if (module->second.count(name) == 0) {
                    raise("name_error",
                          "module '" + stmt.name + "' has no function '" + name + "'",
                          stmt.line);
                }
                functions_[name] = stmt.name;
            }
            return Flow::Normal;
        }
        case StmtKind::Assign:
            assign(stmt.name, eval(*stmt.expr), stmt.line);
            return Flow::Normal;
        case StmtKind::Expression:
            eval(*stmt.expr);
            return Flow::Normal;
        case StmtKind::If:
            if (truthy(eval(*stmt.expr))) {
                return exec_block(stmt.body);
            }
            return exec_block(stmt.else_body);
        case StmtKind::While:
            while (true) {
                checkpoint(stmt.line);
                if (!truthy(eval(*stmt.expr))) {
                    break;
                }
                if (exec_block(stmt.body) == Flow::Break) {
                    break;
                }
            }
            return Flow::Normal;
        case StmtKind::For: {
            const json iterable = eval(*stmt.expr);
            json items;
            if (iterable.is_array()) {
                items = iterable;
            } else if (iterable.is_object()) {
                items = json::array();
                for (auto it = iterable.begin(); it != iterable.end(); ++it) {
                    items.push_back(it.key());
                }
            } else if (iterable.is_string()) {
                items = json::array();
                for (const char c : iterable.get_ref<const std::string&>()) {
                    items.push_back(std::string(1, c));
                }
            } else {
                raise("type_error", describe(iterable) + " is not iterable", stmt.line);
            }
            for (auto& item : items) {
                checkpoint(stmt.line);
                assign(stmt.name, std::move(item), stmt.line);
                if (exec_block(stmt.body) == Flow::Break) {
                    break;
                }
            }
            return Flow::Normal;
        }
        case StmtKind::Break:
            return Flow::Break;
        case StmtKind::Continue:
            return Flow::Continue;
        default:
            raise("script_error", "unsupported statement", stmt.line);
    }
}

json ScriptInterpreter::lookup(const std::string& name, const int line) const {
    const auto variable = variables_.find(name);
    if (variable != variables_.end()) {
        return variable->second;
    }
    if (name == "inputs") {
        return environment_.inputs;
    }
    if (name == "steps") {
        return environment_.steps;
    }
    if (modules_.count(name) != 0 || functions_.count(name) != 0) {
        raise("type_error", "'" + name + "' can only be called", line);
    }
    raise("name_error", "name '" + name + "' is not defined", line);
}

json ScriptInterpreter::eval(const Expr& expr) {
    checkpoint(expr.line);

    switch (expr.kind) {
        case ExprKind::Literal:
            return expr.literal;
        case ExprKind::Name:
            return lookup(expr.name, expr.line);
        case ExprKind::List: {
            json list = json::array();
            for (const auto& item : expr.items) {
                list.push_back(eval(*item));
            }
            charge(approximate_size(list), expr.line);
            return list;
        }
        case ExprKind::Object: {
            json object = json::object();
            for (std::size_t i = 0; i < expr.items.size(); ++i) {
                object[expr.keys[i]] = eval(*expr.items[i]);
            }
            charge(approximate_size(object), expr.line);
            return object;
        }
        case ExprKind::Member:
            return eval_member(expr);
        case ExprKind::Index:
            return eval_index(expr);
        case ExprKind::Call:
            return eval_call(expr);
        case ExprKind::Unary:
            return eval_unary(expr);
        case ExprKind::Binary:
            return eval_binary(expr);
        default:
            raise("script_error", "unsupported expression", expr.line);
    }
}

json ScriptInterpreter::eval_member(const Expr& expr) {
    if (expr.target->kind == ExprKind::Name && modules_.count(expr.target->name) != 0) {
        raise("type_error", "'" + expr.target->name + "." + expr.name + "' can only be called",
              expr.line);
    }
    json base = eval(*expr.target);
    if (!base.is_object()) {
        raise("type_error",
              "cannot read field '" + expr.name + "' of " + describe(base), expr.line);
    }
    auto field = base.find(expr.name);
    if (field == base.end()) {
        raise("key_error", "no field '" + expr.name + "'", expr.line);
    }
    return std::move(*field);
}

json ScriptInterpreter::eval_index(const Expr& expr) {
    json base = eval(*expr.target);
    const json key = eval(*expr.index);

    if (base.is_object()) {
        if (!key.is_string()) {
            raise("type_error", "object keys are strings, got " + describe(key), expr.line);
        }
        auto field = base.find(key.get<std::string>());
        if (field == base.end()) {
            raise("key_error", "no field '" + key.get<std::string>() + "'", expr.line);
        }
        return std::move(*field);
    }
    if (base.is_array() || base.is_string()) {
        if (!is_int(key)) {
            raise("type_error", "indices must be integers, got " + describe(key), expr.line);
        }
        const auto size = static_cast<std::int64_t>(
            base.is_array() ? base.size() : base.get_ref<const std::string&>().size());
        std::int64_t position = as_int(key);
        if (position < 0) {
            position += size;
        }
        if (position < 0 || position >= size) {
            raise("key_error", "index " + std::to_string(as_int(key)) + " out of range",
                  expr.line);
        }
        const auto offset = static_cast<std::size_t>(position);
        if (base.is_array()) {
            return std::move(base[offset]);
        }
        return std::string(1, base.get_ref<const std::string&>()[offset]);
    }
    raise("type_error", describe(base) + " is not indexable", expr.line);
}

json ScriptInterpreter::eval_unary(const Expr& expr) {
    const json operand = eval(*expr.target);
    if (expr.name == "not") {
        return !truthy(operand);
    }
    if (!operand.is_number()) {
        raise("type_error", "cannot negate " + describe(operand), expr.line);
    }
    if (is_int(operand)) {
        const auto value = as_int(operand);
        return checked_negate(value, expr.line);
    }
    return -as_double(operand);
}

json ScriptInterpreter::eval_binary(const Expr& expr) {
    const std::string& op = expr.name;
    const int line = expr.line;

    if (op == "and") {
        return truthy(eval(*expr.target)) && truthy(eval(*expr.index));
    }
    if (op == "or") {
        return truthy(eval(*expr.target)) || truthy(eval(*expr.index));
    }

    const json lhs = eval(*expr.target);
    const json rhs = eval(*expr.index);

    if (op == "==") {
        return lhs == rhs;
    }
    if (op == "!=") {
        return lhs != rhs;
    }
    if (op == "<") {
        return compare(lhs, rhs, line) < 0;
    }
    if (op == "<=") {
        return compare(lhs, rhs, line) <= 0;
    }
    if (op == ">") {
        return compare(lhs, rhs, line) > 0;
    }
    if (op == ">=") {
        return compare(lhs, rhs, line) >= 0;
    }
    if (op == "in") {
        return contains(rhs, lhs, line);
    }

    if (op == "+" && lhs.is_string() && rhs.is_string()) {
        const auto& a = lhs.get_ref<const std::string&>();
        const auto& b = rhs.get_ref<const std::string&>();
        charge(a.size() + b.size(), line);
        return a + b;
    }
    if (op == "+" && lhs.is_array() && rhs.is_array()) {
        charge(approximate_size(lhs) + approximate_size(rhs), line);
        json joined = lhs;
        joined.insert(joined.end(), rhs.begin(), rhs.end());
        return joined;
    }
    if (op == "*" && (lhs.is_string() || lhs.is_array()) && is_int(rhs)) {
        const std::int64_t count = std::max<std::int64_t>(0, as_int(rhs));
        const std::size_t unit = lhs.is_string()
                                     ? lhs.get_ref<const std::string&>().size()
                                     : approximate_size(lhs);
        if (count > 0 && unit > limits_.memory_ceiling_bytes / static_cast<std::size_t>(count)) {
            charge(limits_.memory_ceiling_bytes + 1, line);
        }
        charge(unit * static_cast<std::size_t>(count), line);
        if (lhs.is_string()) {
            std::string repeated;
            for (std::int64_t i = 0; i < count; ++i) {
                repeated += lhs.get_ref<const std::string&>();
            }
            return repeated;
        }
        json repeated = json::array();
        for (std::int64_t i = 0; i < count; ++i) {
            repeated.insert(repeated.end(), lhs.begin(), lhs.end());
        }
        return repeated;
    }

    if (!lhs.is_number() || !rhs.is_number()) {
        raise("type_error",
              "unsupported operands for '" + op + "': " + describe(lhs) + " and " +
                  describe(rhs),
              line);
    }

    if (op == "/") {
        if (as_double(rhs) == 0.0) {
            raise("zero_division", "division by zero", line);
        }
        return as_double(lhs) / as_double(rhs);
    }

    if (is_int(lhs) && is_int(rhs)) {
        const std::int64_t a = as_int(lhs);
        const std::int64_t b = as_int(rhs);
        if (op == "+") {
            return checked_add(a, b, line);
        }
        if (op == "-") {
            return checked_sub(a, b, line);
        }
        if (op == "*") {
            return checked_mul(a, b, line);
        }
        if (op == "%") {
            if (b == 0) {
                raise("zero_division", "modulo by zero", line);
            }
            if (b == -1) {
                return 0;
            }
            std::int64_t remainder = a % b;
            if (remainder != 0 && ((remainder < 0) != (b < 0))) {
                remainder += b;
            }
            return remainder;
        }
    } else {
        const double a = as_double(lhs);
        const double b = as_double(rhs);
        if (op == "+") {
            return a + b;
        }
        if (op == "-") {
            return a - b;
        }
        if (op == "*") {
            return a * b;
        }
        if (op == "%") {
            if (b == 0.0) {
                raise("zero_division", "modulo by zero", line);
            }
            double remainder = std::fmod(a, b);
            if (remainder != 0.0 && ((remainder < 0) != (b < 0))) {
                remainder += b;
            }
            return remainder;
        }
    }
    raise("script_error", "unknown operator '" + op + "'", line);
}

json ScriptInterpreter::eval_call(const Expr& expr) {
    const Expr& callee = *expr.target;
    std::vector<json> args;
    args.reserve(expr.items.size());
    for (const auto& item : expr.items) {
        args.push_back(eval(*item));
    }

    if (callee.kind == ExprKind::Name) {
        const auto imported = functions_.find(callee.name);
        if (imported != functions_.end()) {
            return call_module(imported->second, callee.name, args, expr.line);
        }
        return call_builtin(callee.name, args, expr.line);
    }
    if (callee.kind == ExprKind::Member && callee.target->kind == ExprKind::Name) {
        const auto module = modules_.find(callee.target->name);
        if (module != modules_.end()) {
            return call_module(module->second, callee.name, args, expr.line);
        }
        if (variables_.count(callee.target->name) == 0 && callee.target->name != "inputs" &&
            callee.target->name != "steps") {
            raise("name_error", "name '" + callee.target->name + "' is not defined", expr.line);
        }
    }
    raise("type_error", "expression is not callable", expr.line);
}

json ScriptInterpreter::call_builtin(const std::string& name,
                                     std::vector<json>& args,
                                     const int line) {
    constexpr auto kMany = std::numeric_limits<std::size_t>::max();

    if (name == "len") {
        expect_arity(name, args, 1, 1, line);
        const json& value = args[0];
        if (value.is_string()) {
            return value.get_ref<const std::string&>().size();
        }
        if (value.is_array() || value.is_object()) {
            return value.size();
        }
        raise("type_error", describe(value) + " has no length", line);
    }
    if (name == "str") {
        expect_arity(name, args, 1, 1, line);
        return to_text(args[0]);
    }
    if (name == "int") {
        expect_arity(name, args, 1, 1, line);
        const json& value = args[0];
        if (value.is_boolean()) {
            return value.get<bool>() ? 1 : 0;
        }
        if (is_int(value)) {
            return value;
        }
        if (value.is_number_float()) {
            const double truncated = std::trunc(as_double(value));
            const json converted = integral_or_float(truncated);
            if (!is_int(converted)) {
                raise("value_error", "cannot convert " + value.dump() + " to int", line);
            }
            return converted;
        }
        if (value.is_string()) {
            const std::string text = trim(value.get<std::string>());
            std::int64_t parsed = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
            if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
                raise("value_error", "invalid integer '" + text + "'", line);
            }
            return parsed;
        }
        raise("type_error", "cannot convert " + describe(value) + " to int", line);
    }
    if (name == "float") {
        expect_arity(name, args, 1, 1, line);
        const json& value = args[0];
        if (value.is_boolean()) {
            return value.get<bool>() ? 1.0 : 0.0;
        }
        if (value.is_number()) {
            return as_double(value);
        }
        if (value.is_string()) {
            const std::string text = trim(value.get<std::string>());
            char* end = nullptr;
            const double parsed = std::strtod(text.c_str(), &end);
            if (text.empty() || end != text.c_str() + text.size()) {
                raise("value_error", "invalid number '" + text + "'", line);
            }
            return parsed;
        }
        raise("type_error", "cannot convert " + describe(value) + " to float", line);
    }
    if (name == "bool") {
        expect_arity(name, args, 1, 1, line);
        return truthy(args[0]);
    }
    if (name == "abs") {
        expect_arity(name, args, 1, 1, line);
        return call_module("math", "abs", args, line);
    }
    if (name == "min" || name == "max") {
        expect_arity(name, args, 1, kMany, line);
        const json values = (args.size() == 1 && args[0].is_array()) ? args[0] : json(args);
        if (values.empty()) {
            raise("value_error", name + "() of an empty sequence", line);
        }
        json best = values[0];
        for (std::size_t i = 1; i < values.size(); ++i) {
            const int order = compare(values[i], best, line);
            if ((name == "min" && order < 0) || (name == "max" && order > 0)) {
                best = values[i];
            }
        }
        return best;
    }
    if (name == "sum") {
        expect_arity(name, args, 1, 1, line);
        if (!args[0].is_array()) {
            raise("type_error", "sum() expects a list, got " + describe(args[0]), line);
        }
        std::int64_t int_total = 0;
        double float_total = 0.0;
        bool any_float = false;
        for (const auto& item : args[0]) {
            if (!item.is_number()) {
                raise("type_error", "sum() expects numbers, got " + describe(item), line);
            }
            if (is_int(item)) {
                int_total = checked_add(int_total, as_int(item), line);
            } else {
                any_float = true;
                float_total += as_double(item);
            }
        }
        if (any_float) {
            return float_total + static_cast<double>(int_total);
        }
        return int_total;
    }
    if (name == "range") {
        expect_arity(name, args, 1, 3, line);
        std::int64_t start = 0;
        std::int64_t stop = 0;
        std::int64_t step = 1;
        if (args.size() == 1) {
            stop = expect_int(name, args[0], line);
        } else {
            start = expect_int(name, args[0], line);
            stop = expect_int(name, args[1], line);
            if (args.size() == 3) {
                step = expect_int(name, args[2], line);
            }
        }
        if (step == 0) {
            raise("value_error", "range() step must not be zero", line);
        }
        std::uint64_t count = 0;
        if (step > 0 && start < stop) {
            count = (static_cast<std::uint64_t>(stop) - static_cast<std::uint64_t>(start) - 1) /
                        static_cast<std::uint64_t>(step) + 1;
        } else if (step < 0 && start > stop) {
            count = (static_cast<std::uint64_t>(start) - static_cast<std::uint64_t>(stop) - 1) /
                        (0 - static_cast<std::uint64_t>(step)) + 1;
        }
        if (count > limits_.memory_ceiling_bytes / 16) {
            charge(limits_.memory_ceiling_bytes + 1, line);
        }
        charge(static_cast<std::size_t>(count) * 16, line);
        json values = json::array();
        std::int64_t current = start;
        for (std::uint64_t i = 0; i < count; ++i) {
            values.push_back(current);
            current += step;
        }
        return values;
    }
    if (name == "keys") {
        expect_arity(name, args, 1, 1, line);
        if (!args[0].is_object()) {
            raise("type_error", "keys() expects an object, got " + describe(args[0]), line);
        }
        json names = json::array();
        for (auto it = args[0].begin(); it != args[0].end(); ++it) {
            names.push_back(it.key());
        }
        return names;
    }
    if (name == "contains") {
        expect_arity(name, args, 2, 2, line);
        return contains(args[0], args[1], line);
    }
    if (name == "append") {
        expect_arity(name, args, 2, 2, line);
        if (!args[0].is_array()) {
            raise("type_error", "append() expects a list, got " + describe(args[0]), line);
        }
        charge(approximate_size(args[0]) + approximate_size(args[1]), line);
        json list = std::move(args[0]);
        list.push_back(std::move(args[1]));
        return list;
    }
    if (name == "upper" || name == "lower") {
        expect_arity(name, args, 1, 1, line);
        std::string text = expect_string(name, args[0], line);
        std::transform(text.begin(), text.end(), text.begin(), [&name](const unsigned char c) {
            return static_cast<char>(name == "upper" ? std::toupper(c) : std::tolower(c));
        });
        return text;
    }
    if (name == "split") {
        expect_arity(name, args, 2, 2, line);
        const std::string& text = expect_string(name, args[0], line);
        const std::string& separator = expect_string(name, args[1], line);
        if (separator.empty()) {
            raise("value_error", "split() separator must not be empty", line);
        }
        charge(text.size() * 2, line);
        json parts = json::array();
        std::size_t begin = 0;
        while (true) {
            const std::size_t found = text.find(separator, begin);
            if (found == std::string::npos) {
                parts.push_back(text.substr(begin));
                break;
            }
            parts.push_back(text.substr(begin, found - begin));
            begin = found + separator.size();
        }
        return parts;
    }
    if (name == "join") {
        expect_arity(name, args, 2, 2, line);
        if (!args[0].is_array()) {
            raise("type_error", "join() expects a list, got " + describe(args[0]), line);
        }
        const std::string& separator = expect_string(name, args[1], line);
        std::string joined;
        bool first = true;
        for (const auto& item : args[0]) {
            if (!first) {
                joined += separator;
            }
            joined += to_text(item);
            first = false;
            charge(joined.size(), line);
        }
        return joined;
    }
    if (name == "call_tool") {
        expect_arity(name, args, 1, 2, line);
        const std::string& tool_name = expect_string(name, args[0], line);
        const json arguments = args.size() == 2 ? args[1] : json::object();
        if (!arguments.is_object()) {
            raise("type_error", "call_tool() arguments must be an object", line);
        }
        if (!environment_.call_tool) {
            raise("tool_not_granted", "no tools are granted to this step", line);
        }
        auto outcome = environment_.call_tool(tool_name, arguments);
        if (core::errors::is_error(outcome)) {
            const auto& error = core::errors::get_error(outcome);
            throw ScriptFailure{error.code, error.message, line, violation_for_code(error.code)};
        }
        json value = std::move(core::errors::get_value(outcome));
        charge(approximate_size(value), line);
        return value;
    }
    if (name == "open") {
        expect_arity(name, args, 1, 1, line);
        return open_file(args[0], line);
    }
    if (name == "fail") {
        expect_arity(name, args, 0, 1, line);
        raise("script_failed", args.empty() ? "fail() called" : to_text(args[0]), line);
    }
    raise("name_error", "name '" + name + "' is not defined", line);
}

json ScriptInterpreter::call_module(const std::string& module,
                                    const std::string& function,
                                    std::vector<json>& args,
                                    const int line) {
    const auto known = module_functions().find(module);
    if (known == module_functions().end() || known->second.count(function) == 0) {
        raise("name_error", "module '" + module + "' has no function '" + function + "'", line);
    }
    const std::string qualified = module + "." + function;

    if (module == "math") {
        if (function == "pow") {
            expect_arity(qualified, args, 2, 2, line);
            if (is_int(args[0]) && is_int(args[1]) && as_int(args[1]) >= 0) {
                std::int64_t base = as_int(args[0]);
                std::int64_t exponent = as_int(args[1]);
                std::int64_t out = 1;
                while (exponent > 0) {
                    if ((exponent & 1) != 0) {
                        out = checked_mul(out, base, line);
                    }
                    exponent >>= 1;
                    if (exponent > 0) {
                        base = checked_mul(base, base, line);
                    }
                }
                return out;
            }
            return std::pow(expect_number(qualified, args[0], line),
                            expect_number(qualified, args[1], line));
        }
        expect_arity(qualified, args, 1, 1, line);
        const double value = expect_number(qualified, args[0], line);
        if (function == "abs") {
            if (is_int(args[0])) {
                const auto integral = as_int(args[0]);
                return integral < 0 ? checked_negate(integral, line) : integral;
            }
            return std::fabs(value);
        }
        if (function == "sqrt") {
            if (value < 0.0) {
                raise("value_error", "math.sqrt() of a negative number", line);
            }
            return std::sqrt(value);
        }
        if (function == "floor") {
            return integral_or_float(std::floor(value));
        }
        return integral_or_float(std::ceil(value));
    }

    if (module == "json") {
        expect_arity(qualified, args, 1, 1, line);
        if (function == "dump") {
            std::string text = args[0].dump();
            charge(text.size(), line);
            return text;
        }
        const std::string& text = expect_string(qualified, args[0], line);
        charge(text.size() * 2, line);
        json parsed = json::parse(text, nullptr, false);
        if (parsed.is_discarded()) {
            raise("value_error", "json.parse() received malformed JSON", line);
        }
        return parsed;
    }

    // text
    if (function == "strip") {
        expect_arity(qualified, args, 1, 1, line);
        return trim(expect_string(qualified, args[0], line));
    }
    if (function == "replace") {
        expect_arity(qualified, args, 3, 3, line);
        std::string text = expect_string(qualified, args[0], line);
        const std::string& from = expect_string(qualified, args[1], line);
        const std::string& to = expect_string(qualified, args[2], line);
        if (from.empty()) {
            raise("value_error", "text.replace() pattern must not be empty", line);
        }
        std::size_t position = 0;
        while ((position = text.find(from, position)) != std::string::npos) {
            text.replace(position, from.size(), to);
            position += to.size();
            charge(text.size(), line);
        }
        return text;
    }
    expect_arity(qualified, args, 2, 2, line);
    const std::string& text = expect_string(qualified, args[0], line);
    const std::string& affix = expect_string(qualified, args[1], line);
    if (affix.size() > text.size()) {
        return false;
    }
    if (function == "starts_with") {
        return text.compare(0, affix.size(), affix) == 0;
    }
    return text.compare(text.size() - affix.size(), affix.size(), affix) == 0;
}

json ScriptInterpreter::open_file(const json& path, const int line) {
    const std::string& target = expect_string("open", path, line);
    if (!environment_.working_directory) {
        raise_violation(ViolationKind::ForbiddenFileAccess,
                        "no directory is granted to this step: " + target, line);
    }
    const auto resolved = guard_.validate_path_in_workspace(*environment_.working_directory, target);
    if (core::errors::is_error(resolved)) {
        const auto& error = core::errors::get_error(resolved);
        if (error.code == "forbidden_file_access") {
            raise_violation(ViolationKind::ForbiddenFileAccess, error.message, line);
        }
        raise("io_error", error.message, line);
    }

    const auto& file_path = core::errors::get_value(resolved);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        raise("io_error", "not a readable file: " + target, line);
    }
    const auto size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        raise("io_error", "unable to stat file: " + target, line);
    }
    charge(static_cast<std::size_t>(size), line);

    std::ifstream input(file_path, std::ios::binary);
    if (!input.is_open()) {
        raise("io_error", "unable to open file: " + target, line);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace ael::sandbox::script

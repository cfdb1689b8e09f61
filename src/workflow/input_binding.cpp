#include "workflow/input_binding.hpp"

#include <cctype>
#include <utility>
#include "workflow/validation_error.hpp"

namespace ael::workflow {

using core::errors::AelError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::string trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
        --end;
    }
    return value.substr(begin, end - begin);
}

bool is_segment(const std::string& segment) {
    if (segment.empty()) {
        return false;
    }
    bool all_digits = true;
    for (const char c : segment) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            all_digits = false;
            break;
        }
    }
    if (all_digits) {
        return true;
    }
    if (std::isalpha(static_cast<unsigned char>(segment.front())) == 0 && segment.front() != '_') {
        return false;
    }
    for (const char c : segment) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

AelError bad_reference(const std::string& expression, const std::string& reason) {
    return make_validation_error(ValidationErrorKind::BadSyntax,
                                 "Invalid reference '" + expression + "': " + reason,
                                 "Use inputs.<name> or steps.<id>.output[.<field>].");
}

void collect(const json& value, std::vector<std::string>& out) {
    if (const auto expression = reference_expression(value)) {
        out.push_back(expression.value());
        return;
    }
    if (value.is_array() || value.is_object()) {
        for (const auto& item : value) {
            collect(item, out);
        }
    }
}

core::errors::Result<json> bind(const json& value, const json& scope) {
    if (const auto expression = reference_expression(value)) {
        auto reference = parse_reference(expression.value());
        if (core::errors::is_error(reference)) {
            return core::errors::get_error(reference);
        }
        return resolve_reference(core::errors::get_value(reference), scope);
    }
    if (value.is_array()) {
        json bound = json::array();
        for (const auto& item : value) {
            auto item_result = bind(item, scope);
            if (core::errors::is_error(item_result)) {
                return item_result;
            }
            bound.push_back(std::move(core::errors::get_value(item_result)));
        }
        return bound;
    }
    if (value.is_object()) {
        json bound = json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            auto item_result = bind(it.value(), scope);
            if (core::errors::is_error(item_result)) {
                return item_result;
            }
            bound[it.key()] = std::move(core::errors::get_value(item_result));
        }
        return bound;
    }
    return value;
}

}  // namespace

std::optional<std::string> reference_expression(const json& value) {
    if (!value.is_string()) {
        return std::nullopt;
    }
    const std::string text = trim(value.get<std::string>());
    if (text.size() < 4 || text.compare(0, 2, "{{") != 0 ||
        text.compare(text.size() - 2, 2, "}}") != 0) {
        return std::nullopt;
    }
    return trim(text.substr(2, text.size() - 4));
}

core::errors::Result<InputReference> parse_reference(const std::string& expression) {
    InputReference reference;
    reference.expression = expression;

    std::size_t begin = 0;
    while (true) {
        const std::size_t dot = expression.find('.', begin);
        const std::string segment = expression.substr(
            begin, dot == std::string::npos ? std::string::npos : dot - begin);
        if (!is_segment(segment)) {
            return bad_reference(expression, "malformed path segment '" + segment + "'");
        }
        reference.segments.push_back(segment);
        if (dot == std::string::npos) {
            break;
        }
        begin = dot + 1;
    }

    const std::string& root = reference.segments.front();
    if (root == "inputs") {
        if (reference.segments.size() < 2) {
            return bad_reference(expression, "name a workflow input");
        }
        return reference;
    }
    if (root == "steps") {
        if (reference.segments.size() < 3 || reference.segments[2] != "output") {
            return bad_reference(expression, "step references read steps.<id>.output");
        }
        return reference;
    }
    return bad_reference(expression, "unknown root '" + root + "'");
}

std::vector<std::string> collect_references(const json& value) {
    std::vector<std::string> references;
    collect(value, references);
    return references;
}

core::errors::Result<json> resolve_reference(const InputReference& reference, const json& scope) {
    const json* current = &scope;
    for (const auto& segment : reference.segments) {
        if (current->is_object()) {
            const auto found = current->find(segment);
            if (found == current->end()) {
                current = nullptr;
            } else {
                current = &found.value();
            }
        } else if (current->is_array() && segment.size() < 19 &&
                   std::isdigit(static_cast<unsigned char>(segment.front())) != 0) {
            const std::size_t index = std::stoul(segment);
            current = index < current->size() ? &(*current)[index] : nullptr;
        } else {
            current = nullptr;
        }
        if (current == nullptr) {
            return AelError{ErrorCategory::Execution,
                            "Reference {{ " + reference.expression + " }} is not bound",
                            "unbound_input"};
        }
    }
    return *current;
}

core::errors::Result<json> bind_step_inputs(const json& inputs, const json& scope) {
    if (inputs.is_null()) {
        return json::object();
    }
    return bind(inputs, scope);
}

json make_binding_scope(const json& run_inputs, const json& step_outputs) {
    json scope = json::object();
    scope["inputs"] = run_inputs.is_object() ? run_inputs : json::object();
    scope["steps"] = step_outputs.is_object() ? step_outputs : json::object();
    return scope;
}

}  // namespace ael::workflow

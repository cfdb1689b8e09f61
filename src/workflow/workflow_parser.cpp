#include "workflow/workflow_parser.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>
#include "workflow/validation_error.hpp"

namespace ael::workflow {

using core::errors::AelError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::BackoffType;
using protocol::InputDefinition;
using protocol::OutputDefinition;
using protocol::RetryPolicy;
using protocol::StepDefinition;
using protocol::WorkflowDefinition;

namespace {

struct DocumentError {
    std::string message;
};

[[noreturn]] void reject(const std::string& message) {
    throw DocumentError{message};
}

bool parse_integer(const std::string& text, std::int64_t& value) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (first != last && *first == '+') {
        ++first;
    }
    if (first == last) {
        return false;
    }
    const auto [ptr, ec] = std::from_chars(first, last, value);
    return ec == std::errc() && ptr == last;
}

bool parse_float(const std::string& text, double& value) {
    if (text.empty()) {
        return false;
    }
    const char first = text.front();
    if (first != '-' && first != '+' && first != '.' &&
        (first < '0' || first > '9')) {
        return false;
    }
    char* end = nullptr;
    value = std::strtod(text.c_str(), &end);
    return end == text.c_str() + text.size();
}

void expect_fields(const json& object,
                   const std::set<std::string>& allowed,
                   const std::string& where) {
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (allowed.count(it.key()) == 0) {
            reject("Unknown field '" + it.key() + "' in " + where);
        }
    }
}

std::string read_string(const json& value, const std::string& what) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number()) {
        return value.dump();
    }
    reject(what + " must be a string");
}

std::uint32_t read_count(const json& value, const std::string& what) {
    if (!value.is_number_integer()) {
        reject(what + " must be an integer");
    }
    const auto number = value.get<std::int64_t>();
    if (number < 0 || number > std::numeric_limits<std::uint32_t>::max()) {
        reject(what + " is out of range");
    }
    return static_cast<std::uint32_t>(number);
}

std::vector<std::string> read_string_list(const json& value, const std::string& what) {
    std::vector<std::string> items;
    if (value.is_null()) {
        return items;
    }
    if (value.is_string()) {
        items.push_back(value.get<std::string>());
        return items;
    }
    if (!value.is_array()) {
        reject(what + " must be a list of strings");
    }
    for (const auto& item : value) {
        if (!item.is_string()) {
            reject(what + " must be a list of strings");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

RetryPolicy read_retry(const json& value, const std::string& where) {
    if (!value.is_object()) {
        reject("retry in " + where + " must be a mapping");
    }
    expect_fields(value, {"max_attempts", "backoff", "delay_ms"}, "retry of " + where);

    RetryPolicy policy;
    if (value.contains("max_attempts")) {
        policy.max_attempts = read_count(value["max_attempts"], "retry.max_attempts in " + where);
    }
    if (value.contains("delay_ms")) {
        policy.delay_ms = read_count(value["delay_ms"], "retry.delay_ms in " + where);
    }
    if (value.contains("backoff")) {
        const std::string backoff = read_string(value["backoff"], "retry.backoff in " + where);
        if (backoff == "fixed") {
            policy.backoff = BackoffType::Fixed;
        } else if (backoff == "exponential") {
            policy.backoff = BackoffType::Exponential;
        } else {
            reject("retry.backoff in " + where + " must be fixed or exponential");
        }
    }
    return policy;
}

StepDefinition read_step(const json& value, const std::size_t position) {
    const std::string where = "step #" + std::to_string(position + 1);
    if (!value.is_object()) {
        reject(where + " must be a mapping");
    }
    expect_fields(value,
                  {"id", "tool", "code", "inputs", "depends_on", "retry", "timeout_ms", "tools",
                   "description"},
                  where);

    StepDefinition step;
    if (value.contains("id")) {
        step.id = read_string(value["id"], "id of " + where);
    }
    const std::string label = step.id.empty() ? where : "step " + step.id;
    if (value.contains("tool") && !value["tool"].is_null()) {
        step.tool = read_string(value["tool"], "tool of " + label);
    }
    if (value.contains("code") && !value["code"].is_null()) {
        step.code = read_string(value["code"], "code of " + label);
    }
    if (value.contains("inputs") && !value["inputs"].is_null()) {
        if (!value["inputs"].is_object()) {
            reject("inputs of " + label + " must be a mapping");
        }
        step.inputs = value["inputs"];
    }
    if (value.contains("depends_on")) {
        step.depends_on = read_string_list(value["depends_on"], "depends_on of " + label);
    }
    if (value.contains("retry") && !value["retry"].is_null()) {
        step.retry = read_retry(value["retry"], label);
    }
    if (value.contains("timeout_ms") && !value["timeout_ms"].is_null()) {
        step.timeout_ms = read_count(value["timeout_ms"], "timeout_ms of " + label);
    }
    if (value.contains("tools")) {
        step.granted_tools = read_string_list(value["tools"], "tools of " + label);
    }
    return step;
}

InputDefinition read_input(const std::string& name, const json& value) {
    InputDefinition input;
    input.name = name;
    if (value.is_null()) {
        return input;
    }
    if (!value.is_object()) {
        reject("workflow input " + name + " must be a mapping");
    }
    expect_fields(value, {"name", "type", "required", "default", "description"},
                  "workflow input " + name);
    if (value.contains("type")) {
        input.type = read_string(value["type"], "type of input " + name);
    }
    if (value.contains("required")) {
        if (!value["required"].is_boolean()) {
            reject("required of input " + name + " must be true or false");
        }
        input.required = value["required"].get<bool>();
    }
    if (value.contains("default")) {
        input.default_value = value["default"];
    }
    if (value.contains("description")) {
        input.description = read_string(value["description"], "description of input " + name);
    }
    return input;
}

OutputDefinition read_output(const std::string& name, const json& value) {
    OutputDefinition output;
    output.name = name;
    if (value.is_string()) {
        output.from = value.get<std::string>();
        return output;
    }
    if (!value.is_object()) {
        reject("workflow output " + name + " must be a reference or a mapping");
    }
    expect_fields(value, {"name", "from", "value"}, "workflow output " + name);
    if (value.contains("from")) {
        output.from = read_string(value["from"], "from of output " + name);
    }
    if (value.contains("value")) {
        output.value = value["value"];
    }
    return output;
}

// Lists of `{name: ...}` mappings or a mapping keyed by name.
template <typename T, typename Reader>
std::vector<T> read_named(const json& value, const std::string& what, Reader reader) {
    std::vector<T> items;
    if (value.is_null()) {
        return items;
    }
    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            items.push_back(reader(it.key(), it.value()));
        }
        return items;
    }
    if (!value.is_array()) {
        reject(what + " must be a list or a mapping");
    }
    for (const auto& item : value) {
        if (!item.is_object() || !item.contains("name")) {
            reject("each entry of " + what + " needs a name");
        }
        items.push_back(reader(read_string(item["name"], "name in " + what), item));
    }
    return items;
}

WorkflowDefinition read_workflow(const json& document) {
    if (!document.is_object()) {
        reject("Workflow document must be a mapping");
    }
    expect_fields(document,
                  {"name", "version", "description", "defaults", "inputs", "steps", "outputs"},
                  "workflow");

    WorkflowDefinition definition;
    if (!document.contains("name")) {
        reject("Workflow name is required");
    }
    definition.name = read_string(document["name"], "Workflow name");
    if (document.contains("version")) {
        definition.version = read_string(document["version"], "Workflow version");
    }
    if (document.contains("description")) {
        definition.description = read_string(document["description"], "Workflow description");
    }

    if (document.contains("defaults") && !document["defaults"].is_null()) {
        const json& defaults = document["defaults"];
        if (!defaults.is_object()) {
            reject("defaults must be a mapping");
        }
        expect_fields(defaults, {"timeout_ms", "retry"}, "defaults");
        if (defaults.contains("timeout_ms")) {
            definition.defaults.step_timeout_ms =
                read_count(defaults["timeout_ms"], "defaults.timeout_ms");
        }
        if (defaults.contains("retry")) {
            definition.defaults.retry = read_retry(defaults["retry"], "defaults");
        }
    }

    if (document.contains("inputs")) {
        definition.inputs = read_named<InputDefinition>(document["inputs"], "inputs", read_input);
    }
    if (document.contains("steps") && !document["steps"].is_null()) {
        const json& steps = document["steps"];
        if (!steps.is_array()) {
            reject("steps must be a list");
        }
        for (std::size_t i = 0; i < steps.size(); ++i) {
            definition.steps.push_back(read_step(steps[i], i));
        }
    }
    if (document.contains("outputs")) {
        definition.outputs =
            read_named<OutputDefinition>(document["outputs"], "outputs", read_output);
    }
    return definition;
}

}  // namespace

json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar: {
            const std::string& scalar = node.Scalar();
            // Quoted scalars carry the "!" tag.
            if (node.Tag() == "!") {
                return scalar;
            }
            if (scalar == "true" || scalar == "True" || scalar == "TRUE") {
                return true;
            }
            if (scalar == "false" || scalar == "False" || scalar == "FALSE") {
                return false;
            }
            if (scalar.empty() || scalar == "~" || scalar == "null" || scalar == "Null" ||
                scalar == "NULL") {
                return nullptr;
            }
            std::int64_t integer = 0;
            if (parse_integer(scalar, integer)) {
                return integer;
            }
            double number = 0.0;
            if (parse_float(scalar, number)) {
                return number;
            }
            return scalar;
        }
        case YAML::NodeType::Sequence: {
            json array = json::array();
            for (const auto& item : node) {
                array.push_back(yaml_to_json(item));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            json object = json::object();
            for (const auto& entry : node) {
                object[entry.first.as<std::string>()] = yaml_to_json(entry.second);
            }
            return object;
        }
        default:
            return nullptr;
    }
}

core::errors::Result<WorkflowDefinition> workflow_from_json(const json& document) {
    try {
        return read_workflow(document);
    } catch (const DocumentError& error) {
        return make_validation_error(ValidationErrorKind::BadSyntax, error.message);
    }
}

core::errors::Result<WorkflowDefinition> parse_workflow(const std::string& document) {
    json converted;
    try {
        converted = yaml_to_json(YAML::Load(document));
    } catch (const YAML::Exception& e) {
        const std::string where =
            e.mark.is_null() ? "" : " (line " + std::to_string(e.mark.line + 1) + ")";
        return make_validation_error(ValidationErrorKind::BadSyntax,
                                     "Malformed workflow document" + where + ": " + e.msg);
    }
    return workflow_from_json(converted);
}

core::errors::Result<WorkflowDefinition> load_workflow(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return AelError{ErrorCategory::Input, "Unable to open workflow file: " + path.string(),
                        "workflow_not_found"};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_workflow(buffer.str());
}

}  // namespace ael::workflow

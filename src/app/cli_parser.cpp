#include "cli_parser.hpp"
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace ael::app::cli {

    using namespace ael::core::errors;
    using ael::protocol::CliCommand;
    using ael::protocol::RunRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> workflow;
        std::vector<std::string> inputs;
        std::optional<std::string> config;
        std::optional<std::string> cwd;
        bool trace = false;
        bool verbose = false;
    };

    std::string usage() {
        return "Usage: ael validate <workflow.yaml> | ael run <workflow.yaml> [--input key=value]... "
               "[--config file] [--cwd dir] [--trace] | ael list-tools [--cwd dir]";
    }

    namespace {

        Result<std::filesystem::path> existing_directory(const std::string& raw) {
            std::filesystem::path p(raw);
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return AelError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }
            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return AelError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            return canonical_path;
        }

        // Values that parse as JSON keep their type (numbers, booleans, arrays);
        // anything else is taken as a plain string.
        nlohmann::json parse_input_value(const std::string& text) {
            nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
            if (parsed.is_discarded()) {
                return text;
            }
            return parsed;
        }

    } // namespace

    Result<RunRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return AelError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        RunRequest req;
        const std::string command = argv[1];
        if (command == "validate") {
            req.command = CliCommand::Validate;
        } else if (command == "run") {
            req.command = CliCommand::Run;
        } else if (command == "list-tools") {
            req.command = CliCommand::ListTools;
        } else {
            return AelError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", usage()};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--input") {
                if (i + 1 < args.size()) raw.inputs.push_back(args[++i]);
                else return AelError{ErrorCategory::Input, "Missing value for --input", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return AelError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--cwd") {
                if (i + 1 < args.size()) raw.cwd = args[++i];
                else return AelError{ErrorCategory::Input, "Missing value for --cwd", "missing_value"};
            } else if (args[i] == "--trace") {
                raw.trace = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else if (!args[i].empty() && args[i][0] != '-' && !raw.workflow.has_value()) {
                raw.workflow = args[i];
            } else {
                return AelError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.verbose = raw.verbose;
        req.trace = raw.trace;

        if (req.command == CliCommand::ListTools) {
            if (raw.workflow.has_value()) {
                return AelError{ErrorCategory::Input, "list-tools does not take a workflow file", "unknown_argument"};
            }
        } else if (!raw.workflow.has_value()) {
            return AelError{ErrorCategory::Input, "Missing workflow file for " + command, "missing_required_argument", usage()};
        } else {
            req.workflow_file = raw.workflow.value();
        }

        if (req.command != CliCommand::Run && (!raw.inputs.empty() || raw.trace)) {
            return AelError{ErrorCategory::Input, "--input and --trace are only valid with run", "conflicting_flags"};
        }

        for (const auto& entry : raw.inputs) {
            const auto eq = entry.find('=');
            if (eq == std::string::npos || eq == 0) {
                return AelError{ErrorCategory::Input, "Malformed --input: " + entry, "invalid_input", "Use --input key=value."};
            }
            const std::string key = entry.substr(0, eq);
            if (req.inputs.contains(key)) {
                return AelError{ErrorCategory::Input, "Duplicate --input for " + key, "duplicate_input"};
            }
            req.inputs[key] = parse_input_value(entry.substr(eq + 1));
        }

        if (raw.config) req.config_file = std::filesystem::path(raw.config.value());

        if (raw.cwd) {
            auto dir = existing_directory(raw.cwd.value());
            if (is_error(dir)) {
                return get_error(dir);
            }
            req.working_directory = std::move(get_value(dir));
        }

        return req;
    }

} // namespace ael::app::cli

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace ael::protocol {

    enum class CliCommand {
        Validate,
        Run,
        ListTools
    };

    // Validated command-line request. `workflow_file` is empty for list-tools.
    struct RunRequest {
        CliCommand command = CliCommand::Run;
        std::filesystem::path workflow_file;
        nlohmann::json inputs = nlohmann::json::object();
        std::optional<std::filesystem::path> config_file;
        std::filesystem::path working_directory = std::filesystem::current_path();
        bool trace = false;
        bool verbose = false;
    };

    inline std::string to_string(const CliCommand command) {
        switch (command) {
            case CliCommand::Validate:
                return "validate";
            case CliCommand::Run:
                return "run";
            case CliCommand::ListTools:
                return "list-tools";
            default:
                return "unknown";
        }
    }

} // namespace ael::protocol

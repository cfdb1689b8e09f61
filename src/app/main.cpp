#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/engine_config.hpp"
#include "core/config/run_id.hpp"
#include "core/errors/ael_errors.hpp"
#include "core/logging/logger.hpp"
#include "engine/execution_engine.hpp"
#include "protocol/run_execution_contract.hpp"
#include "registry/tool_registry.hpp"
#include "session/trace_writer.hpp"
#include "tools/workspace_tools.hpp"
#include "workflow/workflow_parser.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitRunFailed = 1;
constexpr int kExitInputError = 2;
constexpr int kExitValidationError = 3;
constexpr int kExitInternalError = 4;

void report_error(const std::string& what, const ael::core::errors::AelError& err) {
    AEL_LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        AEL_LOG_INFO("Hint: " + err.hint);
    }
}

int exit_code_for(const ael::core::errors::AelError& err) {
    switch (err.category) {
        case ael::core::errors::ErrorCategory::Input:
            return kExitInputError;
        case ael::core::errors::ErrorCategory::Validation:
            return kExitValidationError;
        case ael::core::errors::ErrorCategory::Internal:
            return kExitInternalError;
        default:
            return kExitRunFailed;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Bootstrap id until the engine assigns a real run id
    ael::core::logging::Logger::get().set_run_id(ael::core::config::generate_run_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = ael::app::cli::parse_and_validate(argc, argv);
    if (ael::core::errors::is_error(parsed)) {
        report_error("Input error", ael::core::errors::get_error(parsed));
        return kExitInputError;
    }
    const auto& req = ael::core::errors::get_value(parsed);

    // 3. Engine configuration
    ael::core::config::EngineConfig config;
    if (req.config_file) {
        auto loaded = ael::core::config::load_engine_config(req.config_file.value());
        if (ael::core::errors::is_error(loaded)) {
            report_error("Config error", ael::core::errors::get_error(loaded));
            return kExitInputError;
        }
        config = ael::core::errors::get_value(loaded);
    }
    if (!config.working_directory) {
        config.working_directory = req.working_directory;
    }
    ael::core::logging::Logger::get().set_min_level(
        req.verbose ? ael::core::logging::LogLevel::DEBUG : config.log_level);

    // 4. Tool registry with the built-in workspace tools
    ael::registry::RegistryOptions options;
    options.ttl = std::chrono::milliseconds(config.registry_ttl_ms);
    ael::registry::ToolRegistry registry(options);
    auto added = registry.add_source(
        std::make_shared<ael::tools::WorkspaceToolSource>(config.working_directory.value()));
    if (ael::core::errors::is_error(added)) {
        report_error("Failed to register tool source", ael::core::errors::get_error(added));
        return kExitInternalError;
    }
    for (const auto& refreshed : registry.refresh_all()) {
        if (ael::core::errors::is_error(refreshed)) {
            report_error("Tool discovery failed", ael::core::errors::get_error(refreshed));
        }
    }

    ael::engine::ExecutionEngine engine(registry, config);

    if (req.command == ael::protocol::CliCommand::ListTools) {
        nlohmann::json tools = nlohmann::json::array();
        for (const auto& tool : engine.list_tools()) {
            tools.push_back(ael::protocol::to_json(tool));
        }
        std::cout << tools.dump(2) << std::endl;
        return kExitOk;
    }

    // 5. Load and validate the workflow
    auto loaded = ael::workflow::load_workflow(req.workflow_file);
    if (ael::core::errors::is_error(loaded)) {
        const auto& err = ael::core::errors::get_error(loaded);
        report_error("Workflow load failed", err);
        return exit_code_for(err);
    }
    const auto& definition = ael::core::errors::get_value(loaded);

    if (req.command == ael::protocol::CliCommand::Validate) {
        auto validated = engine.validate(definition);
        if (ael::core::errors::is_error(validated)) {
            report_error("Validation failed", ael::core::errors::get_error(validated));
            return kExitValidationError;
        }
        AEL_LOG_INFO("Workflow " + definition.name + " is valid (" +
                     std::to_string(ael::core::errors::get_value(validated).size()) + " steps)");
        return kExitOk;
    }

    // 6. Execute
    std::unique_ptr<ael::session::TraceWriter> trace;
    if (req.trace) {
        trace = std::make_unique<ael::session::TraceWriter>(config.working_directory.value(),
                                                            config.trace_directory);
        engine.set_event_sink(trace->as_sink());
    }

    const ael::protocol::ExecutionReport report = engine.run(definition, req.inputs);
    std::cout << ael::protocol::to_json(report).dump(2) << std::endl;

    if (trace) {
        auto path = trace->trace_path(report.run_id);
        if (!ael::core::errors::is_error(path)) {
            AEL_LOG_INFO("Trace: " + ael::core::errors::get_value(path).string());
        }
    }

    if (report.status == ael::protocol::RunStatus::Succeeded) {
        return kExitOk;
    }
    if (report.error.has_value()) {
        report_error("Run failed", report.error.value());
        return exit_code_for(report.error.value());
    }
    AEL_LOG_ERROR("Run failed: " + std::to_string(report.steps_failed) + " step(s) failed");
    return kExitRunFailed;
}

#include "tools/workspace_tools.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <fcntl.h>
#include <fstream>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace ael::tools {

using core::errors::AelError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::ToolCallContext;
using protocol::ToolDescriptor;

namespace {

constexpr std::uintmax_t kMaxReadBytes = 4 * 1024 * 1024;
constexpr std::uintmax_t kMaxSearchFileBytes = 1024 * 1024;
constexpr std::size_t kMaxCapturedBytes = 1024 * 1024;

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
};

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kProbeSize = 1024;
    char buffer[kProbeSize];
    in.read(buffer, static_cast<std::streamsize>(kProbeSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

std::string trim_line(const std::string& line) {
    constexpr std::size_t kMaxLineLength = 240;
    if (line.size() <= kMaxLineLength) {
        return line;
    }
    return line.substr(0, kMaxLineLength) + "...";
}

AelError invalid_argument(const std::string& tool, const std::string& message) {
    return AelError{ErrorCategory::Input, tool + ": " + message, "invalid_arguments"};
}

core::errors::Result<std::string> string_argument(const json& arguments,
                                                  const std::string& tool,
                                                  const std::string& key,
                                                  const std::string& fallback,
                                                  const bool required) {
    if (!arguments.is_object() || !arguments.contains(key)) {
        if (required) {
            return invalid_argument(tool, "missing argument '" + key + "'");
        }
        return fallback;
    }
    if (!arguments[key].is_string()) {
        return invalid_argument(tool, "argument '" + key + "' must be a string");
    }
    return arguments[key].get<std::string>();
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            if (out.size() < kMaxCapturedBytes) {
                out.append(buffer, static_cast<std::size_t>(n));
            }
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

// Runs `command` under /bin/sh in `cwd`, killing it when the call context
// asks to stop (deadline passed or cancellation).
core::errors::Result<ProcessCapture> run_shell_command(const std::string& command,
                                                       const std::filesystem::path& cwd,
                                                       const ToolCallContext& context) {
    if (context.should_stop()) {
        ProcessCapture capture;
        capture.cancelled = context.cancel_token && context.cancel_token->load();
        capture.timed_out = !capture.cancelled;
        return capture;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0) {
        return AelError{ErrorCategory::Internal, "Failed to create process pipes.",
                        "pipe_creation_failed"};
    }
    if (pipe(stderr_pipe) != 0) {
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        return AelError{ErrorCategory::Internal, "Failed to create process pipes.",
                        "pipe_creation_failed"};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        return AelError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool killed = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        if (!child_exited && !killed && context.should_stop()) {
            const bool by_cancel = context.cancel_token && context.cancel_token->load();
            capture.cancelled = by_cancel;
            capture.timed_out = !by_cancel;
            killed = true;
            static_cast<void>(kill(pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    }
    return capture;
}

}  // namespace

WorkspaceTools::WorkspaceTools(std::filesystem::path workspace_root, policy::PolicyGuard guard)
    : workspace_root_(std::move(workspace_root)), guard_(std::move(guard)) {}

core::errors::Result<json> WorkspaceTools::read_file(const json& arguments,
                                                     const ToolCallContext& context) const {
    static_cast<void>(context);
    auto path = string_argument(arguments, "read_file", "path", "", true);
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }

    auto resolved = guard_.validate_path_in_workspace(workspace_root_, core::errors::get_value(path));
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec) || ec) {
        return AelError{ErrorCategory::Execution, "File does not exist: " + file_path.string(),
                        "file_not_found"};
    }
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return AelError{ErrorCategory::Execution,
                        "Path is not a regular file: " + file_path.string(), "io_error"};
    }
    const auto size = std::filesystem::file_size(file_path, ec);
    if (ec || size > kMaxReadBytes) {
        return AelError{ErrorCategory::Execution,
                        "File is too large to read: " + file_path.string(), "io_error"};
    }
    if (is_probably_binary(file_path)) {
        return AelError{ErrorCategory::Execution,
                        "Refusing to read binary file: " + file_path.string(), "io_error"};
    }

    std::ifstream in(file_path);
    if (!in.is_open()) {
        return AelError{ErrorCategory::Execution, "Failed to open file: " + file_path.string(),
                        "io_error"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return AelError{ErrorCategory::Execution,
                        "I/O error while reading file: " + file_path.string(), "io_error"};
    }

    json output;
    output["path"] = core::errors::get_value(path);
    output["content"] = buffer.str();
    output["bytes"] = output["content"].get_ref<const std::string&>().size();
    return output;
}

core::errors::Result<json> WorkspaceTools::search(const json& arguments,
                                                  const ToolCallContext& context) const {
    auto pattern = string_argument(arguments, "search", "pattern", "", true);
    if (core::errors::is_error(pattern)) {
        return core::errors::get_error(pattern);
    }
    if (core::errors::get_value(pattern).empty()) {
        return invalid_argument("search", "pattern cannot be empty");
    }
    auto scope = string_argument(arguments, "search", "scope", ".", false);
    if (core::errors::is_error(scope)) {
        return core::errors::get_error(scope);
    }
    std::size_t max_matches = 20;
    if (arguments.contains("max_matches")) {
        if (!arguments["max_matches"].is_number_integer() ||
            arguments["max_matches"].get<std::int64_t>() <= 0) {
            return invalid_argument("search", "max_matches must be a positive integer");
        }
        max_matches = arguments["max_matches"].get<std::size_t>();
    }

    auto resolved = guard_.validate_path_in_workspace(workspace_root_, core::errors::get_value(scope));
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path scope_path = core::errors::get_value(resolved);

    std::error_code ec;
    std::vector<std::filesystem::path> files;
    if (std::filesystem::is_regular_file(scope_path, ec) && !ec) {
        files.push_back(scope_path);
    } else if (std::filesystem::is_directory(scope_path, ec) && !ec) {
        const auto options = std::filesystem::directory_options::skip_permission_denied;
        for (const auto& entry :
             std::filesystem::recursive_directory_iterator(scope_path, options, ec)) {
            if (!entry.is_regular_file(ec) || ec) {
                continue;
            }
            files.push_back(entry.path());
        }
    } else {
        return AelError{ErrorCategory::Execution,
                        "Scope does not exist: " + scope_path.string(), "file_not_found"};
    }
    // Directory iteration order is filesystem-defined.
    std::sort(files.begin(), files.end());

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(workspace_root_, ec);
    const std::string& needle = core::errors::get_value(pattern);
    json matches = json::array();
    for (const auto& file : files) {
        if (matches.size() >= max_matches || context.should_stop()) {
            break;
        }
        const auto size = std::filesystem::file_size(file, ec);
        if (ec || size > kMaxSearchFileBytes || is_probably_binary(file)) {
            continue;
        }
        std::ifstream in(file);
        if (!in.is_open()) {
            continue;
        }

        std::string line;
        std::size_t line_no = 0;
        while (std::getline(in, line)) {
            ++line_no;
            if (line.find(needle) == std::string::npos) {
                continue;
            }
            json match;
            match["file"] = file.lexically_relative(canonical_root).generic_string();
            match["line"] = line_no;
            match["text"] = trim_line(line);
            matches.push_back(std::move(match));
            if (matches.size() >= max_matches) {
                break;
            }
        }
    }

    json output;
    output["pattern"] = needle;
    output["count"] = matches.size();
    output["matches"] = std::move(matches);
    return output;
}

core::errors::Result<json> WorkspaceTools::run_command(const json& arguments,
                                                       const ToolCallContext& context) const {
    auto command = string_argument(arguments, "run_command", "command", "", true);
    if (core::errors::is_error(command)) {
        return core::errors::get_error(command);
    }
    auto validated_command = guard_.validate_command(core::errors::get_value(command));
    if (core::errors::is_error(validated_command)) {
        return core::errors::get_error(validated_command);
    }
    auto cwd = string_argument(arguments, "run_command", "cwd", ".", false);
    if (core::errors::is_error(cwd)) {
        return core::errors::get_error(cwd);
    }
    auto validated_cwd = guard_.validate_path_in_workspace(workspace_root_, core::errors::get_value(cwd));
    if (core::errors::is_error(validated_cwd)) {
        return core::errors::get_error(validated_cwd);
    }

    AEL_LOG_DEBUG("WorkspaceTools: run_command in " +
                  core::errors::get_value(validated_cwd).string());
    auto capture_result = run_shell_command(core::errors::get_value(validated_command),
                                            core::errors::get_value(validated_cwd), context);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);

    if (capture.cancelled) {
        return AelError{ErrorCategory::Execution, "Command cancelled.", "cancelled"};
    }
    if (capture.timed_out) {
        return AelError{ErrorCategory::Sandbox, "Command exceeded its deadline.",
                        "resource_limit"};
    }
    if (capture.exit_code != 0) {
        std::string message = "Command failed with exit code " + std::to_string(capture.exit_code);
        if (!capture.stderr_text.empty()) {
            message += ": " + trim_line(capture.stderr_text);
        }
        return AelError{ErrorCategory::Execution, message, "command_failed"};
    }

    json output;
    output["exit_code"] = capture.exit_code;
    output["stdout"] = capture.stdout_text;
    output["stderr"] = capture.stderr_text;
    return output;
}

WorkspaceToolSource::WorkspaceToolSource(std::filesystem::path workspace_root)
    : tools_(std::make_shared<const WorkspaceTools>(std::move(workspace_root))) {}

std::string WorkspaceToolSource::name() const {
    return "workspace";
}

core::errors::Result<std::vector<ToolDescriptor>> WorkspaceToolSource::discover() {
    std::error_code ec;
    if (!std::filesystem::is_directory(tools_->workspace_root(), ec) || ec) {
        return AelError{ErrorCategory::Registry,
                        "Workspace root is not a directory: " +
                            tools_->workspace_root().string(),
                        "source_unreachable"};
    }

    const auto tools = tools_;
    std::vector<ToolDescriptor> descriptors;

    ToolDescriptor read_file;
    read_file.name = "read_file";
    read_file.description = "Read a text file inside the workspace.";
    read_file.input_schema = {{"type", "object"},
                              {"properties", {{"path", {{"type", "string"}}}}},
                              {"required", {"path"}}};
    read_file.output_schema = {{"type", "object"}};
    read_file.source = name();
    read_file.handler = [tools](const json& arguments, const ToolCallContext& context) {
        return tools->read_file(arguments, context);
    };
    descriptors.push_back(std::move(read_file));

    ToolDescriptor search;
    search.name = "search";
    search.description = "Search workspace files for lines containing a pattern.";
    search.input_schema = {{"type", "object"},
                           {"properties",
                            {{"pattern", {{"type", "string"}}},
                             {"scope", {{"type", "string"}}},
                             {"max_matches", {{"type", "integer"}}}}},
                           {"required", {"pattern"}}};
    search.output_schema = {{"type", "object"}};
    search.source = name();
    search.handler = [tools](const json& arguments, const ToolCallContext& context) {
        return tools->search(arguments, context);
    };
    descriptors.push_back(std::move(search));

    ToolDescriptor run_command;
    run_command.name = "run_command";
    run_command.description = "Run a shell command inside the workspace.";
    run_command.input_schema = {{"type", "object"},
                                {"properties",
                                 {{"command", {{"type", "string"}}},
                                  {"cwd", {{"type", "string"}}}}},
                                {"required", {"command"}}};
    run_command.output_schema = {{"type", "object"}};
    run_command.source = name();
    run_command.handler = [tools](const json& arguments, const ToolCallContext& context) {
        return tools->run_command(arguments, context);
    };
    descriptors.push_back(std::move(run_command));

    return descriptors;
}

}  // namespace ael::tools

#pragma once
#include "protocol/run_request.hpp"
#include "core/errors/ael_errors.hpp"

namespace ael::app::cli {

    // ael validate <workflow> [--config f] [--cwd d] [--verbose]
    // ael run <workflow> [--input k=v]... [--config f] [--cwd d] [--trace] [--verbose]
    // ael list-tools [--config f] [--cwd d] [--verbose]
    ael::core::errors::Result<ael::protocol::RunRequest> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}

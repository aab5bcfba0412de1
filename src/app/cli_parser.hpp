#pragma once
#include "protocol/launch_request.hpp"
#include <string>
#include "core/errors/dispatch_errors.hpp"

namespace cidispatch::app::cli {
    // cidispatch [serve|list] [options]
    // cidispatch call <tool> [--args '<json object>'] [options]
    cidispatch::core::errors::Result<cidispatch::protocol::LaunchRequest> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}

#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/dispatch_errors.hpp"
#include "protocol/pipeline_contract.hpp"
#include "protocol/tool_spec.hpp"
#include "tools/tool_context.hpp"

namespace cidispatch::runtime {

using ToolHandler =
    std::function<protocol::ToolOutcome(const tools::ToolContext&, const nlohmann::json&)>;

// Closed name -> (spec, handler) table. Filled at startup, then sealed and
// shared read-only by every request.
class ToolRegistry {
public:
    core::errors::Result<bool> register_tool(protocol::ToolSpec spec, ToolHandler handler);
    void seal() { sealed_ = true; }

    // Checks `request` against its spec and returns the arguments with
    // defaults filled in. Errors are always ErrorCategory::Schema.
    core::errors::Result<nlohmann::json> validate(const protocol::ToolRequest& request) const;

    // validate() then the handler. A handler that throws yields an error
    // result, never an exception.
    core::errors::Result<protocol::ToolOutcome> dispatch(const protocol::ToolRequest& request,
                                                         const tools::ToolContext& context) const;

    // Specs in registration order.
    std::vector<protocol::ToolSpec> specs() const;

private:
    struct Entry {
        protocol::ToolSpec spec;
        ToolHandler handler;
    };

    bool sealed_ = false;
    std::vector<std::string> order_;
    std::map<std::string, Entry> entries_;
};

}  // namespace cidispatch::runtime

#pragma once

#include "core/errors/dispatch_errors.hpp"
#include "runtime/tool_registry.hpp"

namespace cidispatch::runtime {

// Registers the closed tool set. `registry` must outlive every dispatch,
// since full_ci dispatches its stages back through it.
core::errors::Result<bool> register_builtin_tools(ToolRegistry& registry);

}  // namespace cidispatch::runtime

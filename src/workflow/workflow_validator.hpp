#pragma once

#include <string>
#include <vector>
#include "core/errors/dispatch_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace cidispatch::workflow {

// Structural checks for one GitHub Actions workflow document. Every
// violation found is returned, each with the position of the offending node
// and a rule id. Errors only when the text is not YAML at all.
core::errors::Result<std::vector<protocol::Finding>> validate_workflow_document(
    const std::string& text, const std::string& source_name);

}  // namespace cidispatch::workflow

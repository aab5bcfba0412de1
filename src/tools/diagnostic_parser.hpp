#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "protocol/tool_contract.hpp"

namespace cidispatch::tools {

enum class LineKind {
    Diagnostic,
    Note,    // "note:" continuation of the previous diagnostic
    Noise,   // source snippets, carets, tool banners
    Unparsed
};

struct ParsedLine {
    LineKind kind = LineKind::Unparsed;
    std::optional<protocol::Finding> finding;
};

struct ParsedDiagnostics {
    std::vector<protocol::Finding> findings;
    std::size_t unparsed_lines = 0;
};

// Parses "path:line[:column]: severity: message [rule]" as printed by
// clang-format, clang-tidy, compilers and cppcheck with a matching template.
ParsedLine parse_diagnostic_line(const std::string& line);

ParsedDiagnostics parse_diagnostics(const std::string& output);

}  // namespace cidispatch::tools

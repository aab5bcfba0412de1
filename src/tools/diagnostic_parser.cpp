#include "tools/diagnostic_parser.hpp"

#include <charconv>
#include <sstream>
#include <utility>

namespace cidispatch::tools {

using protocol::Finding;
using protocol::Severity;

namespace {

struct SeverityToken {
    const char* marker;
    Severity severity;
    bool is_note;
};

// cppcheck's style/performance/portability are reported as warnings.
constexpr SeverityToken kSeverityTokens[] = {
    {": fatal error: ", Severity::Error, false},
    {": error: ", Severity::Error, false},
    {": warning: ", Severity::Warning, false},
    {": style: ", Severity::Warning, false},
    {": performance: ", Severity::Warning, false},
    {": portability: ", Severity::Warning, false},
    {": information: ", Severity::Info, false},
    {": remark: ", Severity::Info, false},
    {": note: ", Severity::Note, true},
};

std::optional<int> parse_number(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    int value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || value < 0) {
        return std::nullopt;
    }
    return value;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

bool is_noise(const std::string& line) {
    if (line.empty()) {
        return true;
    }
    // Indented source snippets and caret markers under a diagnostic.
    if (line.front() == ' ' || line.front() == '\t') {
        return true;
    }
    if (line.find(" warnings generated.") != std::string::npos ||
        line.find(" warning generated.") != std::string::npos ||
        line.find(" errors generated.") != std::string::npos ||
        line.find(" error generated.") != std::string::npos) {
        return true;
    }
    return starts_with(line, "Suppressed ") || starts_with(line, "Use -header-filter") ||
           starts_with(line, "Checking ") || starts_with(line, "nofile:0:0: information:") ||
           starts_with(line, "[output truncated:");
}

// Splits "path:line[:column]" into its parts. The path may itself hold ':'.
bool split_location(const std::string& location, Finding& finding) {
    const auto last = location.rfind(':');
    if (last == std::string::npos) {
        return false;
    }
    const auto tail = parse_number(location.substr(last + 1));
    if (!tail) {
        return false;
    }

    const std::string head = location.substr(0, last);
    const auto previous = head.rfind(':');
    if (previous != std::string::npos) {
        if (const auto line = parse_number(head.substr(previous + 1))) {
            finding.file = head.substr(0, previous);
            finding.line = *line;
            finding.column = *tail;
            return !finding.file->empty();
        }
    }
    finding.file = head;
    finding.line = *tail;
    return !head.empty();
}

}  // namespace

ParsedLine parse_diagnostic_line(const std::string& raw_line) {
    std::string line = raw_line;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    ParsedLine parsed;
    if (is_noise(line)) {
        parsed.kind = LineKind::Noise;
        return parsed;
    }

    const SeverityToken* token = nullptr;
    std::size_t position = std::string::npos;
    for (const auto& candidate : kSeverityTokens) {
        const auto found = line.find(candidate.marker);
        if (found != std::string::npos && found < position) {
            position = found;
            token = &candidate;
        }
    }
    if (token == nullptr) {
        parsed.kind = LineKind::Unparsed;
        return parsed;
    }

    Finding finding;
    finding.severity = token->severity;
    if (!split_location(line.substr(0, position), finding)) {
        parsed.kind = LineKind::Unparsed;
        return parsed;
    }
    // cppcheck reports 0 for "no column".
    if (finding.column && *finding.column == 0) {
        finding.column.reset();
    }

    std::string message = line.substr(position + std::char_traits<char>::length(token->marker));
    if (!message.empty() && message.back() == ']') {
        const auto open = message.rfind(" [");
        if (open != std::string::npos) {
            finding.rule = message.substr(open + 2, message.size() - open - 3);
            message.erase(open);
        }
    }
    finding.message = std::move(message);

    parsed.kind = token->is_note ? LineKind::Note : LineKind::Diagnostic;
    parsed.finding = std::move(finding);
    return parsed;
}

ParsedDiagnostics parse_diagnostics(const std::string& output) {
    ParsedDiagnostics diagnostics;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        ParsedLine parsed = parse_diagnostic_line(line);
        switch (parsed.kind) {
            case LineKind::Diagnostic:
                diagnostics.findings.push_back(std::move(*parsed.finding));
                break;
            case LineKind::Unparsed:
                ++diagnostics.unparsed_lines;
                break;
            case LineKind::Note:
            case LineKind::Noise:
                break;
        }
    }
    return diagnostics;
}

}  // namespace cidispatch::tools

#include "diagnostic.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace pdl::cli {

// ============================================================================
// Terminal Detection
// ============================================================================

bool terminal_supports_colors() {
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string_view(term) != "dumb";
}

// ============================================================================
// Global Emitter
// ============================================================================

DiagnosticEmitter& get_diagnostic_emitter() {
    static DiagnosticEmitter emitter(std::cerr);
    return emitter;
}

// ============================================================================
// DiagnosticEmitter Implementation
// ============================================================================

DiagnosticEmitter::DiagnosticEmitter(std::ostream& out) : out_(out) {
    use_colors_ = terminal_supports_colors();
}

void DiagnosticEmitter::emit(const lexer::Source& source, const ParseError& error) {
    ++error_count_;

    if (ToolOptions::diagnostic_format == DiagnosticFormat::JSON) {
        emit_json(source, error);
        return;
    }
    emit_text(source, error);
}

void DiagnosticEmitter::emit_text(const lexer::Source& source, const ParseError& error) {
    auto start = source.location(error.span.start);

    // error[P001]: message
    out_ << color(Colors::Bold) << color(Colors::BrightRed) << "error";
    if (!error.code.empty()) {
        out_ << "[" << error.code << "]";
    }
    out_ << color(Colors::Reset) << color(Colors::Bold) << ": " << error.message
         << color(Colors::Reset) << "\n";

    out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << source.filename()
         << ":" << start.line << ":" << start.column << "\n";

    int line_width = std::max(static_cast<int>(std::to_string(start.line).length()), 4);
    auto gutter = [&](std::string_view number) {
        out_ << color(Colors::BrightBlue) << std::setw(line_width) << number << " |"
             << color(Colors::Reset);
    };

    std::string_view source_line = source.line(start.line);

    gutter("");
    out_ << "\n";
    gutter(std::to_string(start.line));
    out_ << " " << source_line << "\n";

    // Underline to the end of the span, or of the line for multi-line spans.
    // Zero-width spans (end of input) still get one caret.
    size_t first = start.column - 1;
    size_t last = first + std::max<size_t>(error.span.length(), 1);
    last = std::min(last, std::max(source_line.size(), first + 1));

    gutter("");
    out_ << " " << std::string(first, ' ') << color(Colors::BrightRed)
         << std::string(last - first, '^') << color(Colors::Reset) << "\n";

    gutter("");
    out_ << "\n";
}

std::string DiagnosticEmitter::escape_json_string(std::string_view s) {
    std::ostringstream result;
    for (char c : s) {
        switch (c) {
        case '"':
            result << "\\\"";
            break;
        case '\\':
            result << "\\\\";
            break;
        case '\b':
            result << "\\b";
            break;
        case '\f':
            result << "\\f";
            break;
        case '\n':
            result << "\\n";
            break;
        case '\r':
            result << "\\r";
            break;
        case '\t':
            result << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                result << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec << std::setfill(' ');
            } else {
                result << c;
            }
            break;
        }
    }
    return result.str();
}

void DiagnosticEmitter::emit_json(const lexer::Source& source, const ParseError& error) {
    auto start = source.location(error.span.start);
    auto end = source.location(error.span.end);

    out_ << "{";
    out_ << "\"severity\":\"error\",";
    out_ << "\"code\":\"" << escape_json_string(error.code) << "\",";
    out_ << "\"message\":\"" << escape_json_string(error.message) << "\",";
    out_ << "\"span\":{";
    out_ << "\"file\":\"" << escape_json_string(source.filename()) << "\",";
    out_ << "\"start\":{\"line\":" << start.line << ",\"column\":" << start.column
         << ",\"offset\":" << start.offset << "},";
    out_ << "\"end\":{\"line\":" << end.line << ",\"column\":" << end.column
         << ",\"offset\":" << end.offset << "}";
    out_ << "}";
    out_ << "}\n";
}

} // namespace pdl::cli

//! # Source Buffers
//!
//! This module provides the source buffer handed to the tokenizer and the
//! line/column mapping used when rendering diagnostics.
//!
//! ## Example
//!
//! ```cpp
//! auto result = Source::from_file("component.profile");
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result) << "\n";
//!     return;
//! }
//! Source source = std::move(unwrap(result));
//!
//! SourceLocation loc = source.location(8); // line/column of byte 8
//! std::string_view line = source.line(loc.line);
//! ```

#ifndef PDL_LEXER_SOURCE_HPP
#define PDL_LEXER_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pdl::lexer {

/// A profile file held in memory, with a line index for diagnostics.
///
/// The source owns its content. Views returned by `content()`, `slice()`
/// and `line()`, and every view inside a tree parsed from `content()`, are
/// valid only while the Source is alive and unmoved.
class Source {
public:
    Source(std::string filename, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    /// File name, or `<input>` for in-memory sources.
    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns the text covered by `span`, clamped to the buffer.
    [[nodiscard]] auto slice(Span span) const -> std::string_view;

    /// Converts a byte offset to a 1-based line/column location.
    ///
    /// Offsets past the end map to the position just after the last byte.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Byte range of a 1-based line, line terminator excluded.
    ///
    /// Out-of-range lines yield an empty span at the end of the buffer.
    [[nodiscard]] auto line_span(uint32_t line_num) const -> Span;

    /// Text of a 1-based line without its terminator; empty if out of range.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view {
        return slice(line_span(line_num));
    }

    [[nodiscard]] auto line_count() const -> uint32_t {
        return static_cast<uint32_t>(line_starts_.size());
    }

    /// Loads a profile from disk. A leading UTF-8 byte order mark is dropped,
    /// so offsets count from the first character after it.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<uint32_t> line_starts_;
};

} // namespace pdl::lexer

#endif // PDL_LEXER_SOURCE_HPP

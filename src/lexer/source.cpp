#include "lexer/source.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace pdl::lexer {

static constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

Source::Source(std::string filename, std::string content)
    : filename_(std::move(filename)), content_(std::move(content)) {
    line_starts_.push_back(0);
    for (size_t i = 0; i < content_.size(); ++i) {
        if (content_[i] == '\n') {
            line_starts_.push_back(static_cast<uint32_t>(i + 1));
        }
    }
}

auto Source::slice(Span span) const -> std::string_view {
    size_t start = std::min<size_t>(span.start, content_.size());
    size_t end = std::clamp<size_t>(span.end, start, content_.size());
    return std::string_view(content_).substr(start, end - start);
}

auto Source::location(size_t offset) const -> SourceLocation {
    auto clamped = static_cast<uint32_t>(std::min(offset, content_.size()));

    // Last line starting at or before the offset
    auto next_line = std::upper_bound(line_starts_.begin(), line_starts_.end(), clamped);
    auto line_index = static_cast<uint32_t>(next_line - line_starts_.begin()) - 1;

    return SourceLocation{.file = filename_,
                          .line = line_index + 1,
                          .column = clamped - line_starts_[line_index] + 1,
                          .offset = clamped};
}

auto Source::line_span(uint32_t line_num) const -> Span {
    auto size = static_cast<uint32_t>(content_.size());
    if (line_num == 0 || line_num > line_starts_.size()) {
        return Span{size, size};
    }

    uint32_t start = line_starts_[line_num - 1];
    uint32_t end = line_num < line_starts_.size() ? line_starts_[line_num] - 1 : size;
    if (end > start && content_[end - 1] == '\r') {
        --end;
    }
    return Span{start, end};
}

auto Source::from_file(const std::string& path) -> Result<Source, std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "failed to open file: " + path;
    }

    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return "failed to read file: " + path;
    }

    if (content.starts_with(UTF8_BOM)) {
        content.erase(0, UTF8_BOM.size());
    }
    return Source(path, std::move(content));
}

auto Source::from_string(std::string content, std::string name) -> Source {
    return Source(std::move(name), std::move(content));
}

} // namespace pdl::lexer

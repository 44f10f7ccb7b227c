// seda/basic/source_manager.cpp
#include "seda/basic/source_manager.hpp"

#include <algorithm>

namespace seda
{

SourceManager::SourceManager(std::string text) : text_(std::move(text)) { index_lines(); }

SourceManager::SourceManager(std::filesystem::path path, std::string text)
: path_(std::move(path)), text_(std::move(text))
{
  index_lines();
}

std::string SourceManager::get_display_name() const
{
  if (!has_path()) {
    return "<input>";
  }
  std::error_code ec;
  const auto relative = std::filesystem::relative(path_, std::filesystem::current_path(), ec);
  if (ec || relative.empty() || *relative.begin() == "..") {
    return path_.string();
  }
  return relative.string();
}

LineColumn SourceManager::get_line_column(uint32_t offset) const noexcept
{
  if (line_starts_.empty()) {
    return {};
  }
  offset = std::min<uint32_t>(offset, text_.size());

  // line_starts_ begins with 0, so the predecessor of upper_bound always exists.
  const auto next = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto index = static_cast<uint32_t>(next - line_starts_.begin()) - 1;
  return {index + 1, offset - line_starts_[index] + 1};
}

LineColumn SourceManager::get_line_column(SourceLocation loc) const noexcept
{
  if (!loc.is_valid()) {
    return {};
  }
  return get_line_column(loc.get_offset());
}

uint32_t SourceManager::get_offset(uint32_t line, uint32_t column) const noexcept
{
  if (line == 0 || line_starts_.empty()) {
    return 0;
  }
  const auto index = std::min<size_t>(line, line_starts_.size()) - 1;
  const uint32_t offset = line_starts_[index] + (column > 0 ? column - 1 : 0);
  return std::min<uint32_t>(offset, text_.size());
}

std::string_view SourceManager::get_line(uint32_t index) const noexcept
{
  if (index >= line_starts_.size()) {
    return {};
  }
  const uint32_t begin = line_starts_[index];
  uint32_t end =
    index + 1 < line_starts_.size() ? line_starts_[index + 1] - 1 : static_cast<uint32_t>(text_.size());
  if (end > begin && text_[end - 1] == '\r') {
    --end;
  }
  return std::string_view(text_).substr(begin, end - begin);
}

std::string_view SourceManager::get_slice(SourceRange range) const noexcept
{
  if (range.is_invalid() || range.get_begin().get_offset() >= text_.size()) {
    return {};
  }
  const uint32_t begin = range.get_begin().get_offset();
  const uint32_t end = std::min<uint32_t>(range.get_end().get_offset(), text_.size());
  return std::string_view(text_).substr(begin, end > begin ? end - begin : 0);
}

FullSourceRange SourceManager::get_full_range(SourceRange range) const noexcept
{
  FullSourceRange out;
  if (range.is_invalid()) {
    return out;
  }
  out.start_byte = range.get_begin().get_offset();
  out.end_byte = range.get_end().get_offset();

  const LineColumn start = get_line_column(out.start_byte);
  const LineColumn end = get_line_column(out.end_byte);
  out.start_line = start.line;
  out.start_column = start.column;
  out.end_line = end.line;
  out.end_column = end.column;
  return out;
}

void SourceManager::index_lines()
{
  line_starts_.assign(1, 0);
  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      line_starts_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

}  // namespace seda

// seda/basic/source_manager.hpp - Byte positions in a script and their line/column form
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace seda
{

/// Byte offset into the script text. Default-constructed locations are invalid.
class SourceLocation
{
public:
  constexpr SourceLocation() noexcept = default;
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_none; }
  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  constexpr bool operator==(SourceLocation other) const noexcept { return offset_ == other.offset_; }
  constexpr bool operator!=(SourceLocation other) const noexcept { return offset_ != other.offset_; }

private:
  static constexpr uint32_t k_none = UINT32_MAX;
  uint32_t offset_ = k_none;
};

/// Half-open [begin, end). Tokens and nodes carry one; nodes span their first
/// to their last token.
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(SourceLocation begin, SourceLocation end) noexcept : begin_(begin), end_(end)
  {
  }
  constexpr SourceRange(uint32_t begin, uint32_t end) noexcept
  : begin_(SourceLocation(begin)), end_(SourceLocation(end))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }
  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  constexpr bool operator==(SourceRange other) const noexcept
  {
    return begin_ == other.begin_ && end_ == other.end_;
  }
  constexpr bool operator!=(SourceRange other) const noexcept { return !(*this == other); }

private:
  SourceLocation begin_;
  SourceLocation end_;
};

/// From the start of `first` to the end of `last`; an invalid side yields the other.
[[nodiscard]] constexpr SourceRange join_ranges(SourceRange first, SourceRange last) noexcept
{
  if (first.is_invalid()) {
    return last;
  }
  if (last.is_invalid()) {
    return first;
  }
  return {first.get_begin(), last.get_end()};
}

/// 1-based line and byte column, the form parse errors are reported in.
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line != 0; }
};

/// Both ends of a range resolved to line/column, plus the raw offsets.
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line != 0; }
};

/**
 * Holds one script and the offsets where its lines begin.
 *
 * Tokens already carry their own line and column. The table serves the
 * diagnostic printer, which needs whole lines for its snippets.
 */
class SourceManager
{
public:
  SourceManager() = default;
  explicit SourceManager(std::string text);
  SourceManager(std::filesystem::path path, std::string text);

  [[nodiscard]] bool has_path() const noexcept { return !path_.empty(); }

  /// Relative path when the file is below the working directory, "<input>"
  /// for in-memory text.
  [[nodiscard]] std::string get_display_name() const;

  [[nodiscard]] std::string_view get_source() const noexcept { return text_; }
  [[nodiscard]] size_t get_line_count() const noexcept { return line_starts_.size(); }

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;
  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept;

  /// Offset of a 1-based line/column, clamped to the text.
  [[nodiscard]] uint32_t get_offset(uint32_t line, uint32_t column) const noexcept;

  /// 0-based line without its "\n" or "\r\n".
  [[nodiscard]] std::string_view get_line(uint32_t index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void index_lines();

  std::filesystem::path path_;
  std::string text_;
  std::vector<uint32_t> line_starts_;
};

}  // namespace seda

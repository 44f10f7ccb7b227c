// seda/basic/diagnostic.hpp - Diagnostics shown to the user of sedac
//
// The parser keeps its own ParseError list (see syntax/parse_error.hpp).
// Those are converted into Diagnostics once parsing is done, so that the
// printer can underline the offending token and attach help text.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "seda/basic/source_manager.hpp"

namespace seda
{

enum class Severity : uint8_t {
  Error,
  Warning,
  Note,
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

enum class LabelStyle : uint8_t {
  Primary,    // underlined with '^'
  Secondary,  // underlined with '-'
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // "P001".."P008" for parse errors
  std::string message;
  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] bool is_error() const noexcept { return severity == Severity::Error; }

  /// First primary label, else the first label, else null.
  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

/// Chains extra detail onto a reported diagnostic. The diagnostic lands in
/// the bag when the builder goes out of scope.
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;
  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(DiagnosticBuilder &&) = delete;
  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string message);
  DiagnosticBuilder & with_help(std::string help);

private:
  DiagnosticBag * bag_;  // null once moved from
  Diagnostic diag_;
};

class DiagnosticBag
{
public:
  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string label = {});

  DiagnosticBuilder report_error(SourceRange range, std::string message, std::string label = {})
  {
    return report(Severity::Error, range, std::move(message), std::move(label));
  }
  DiagnosticBuilder report_warning(SourceRange range, std::string message, std::string label = {})
  {
    return report(Severity::Warning, range, std::move(message), std::move(label));
  }
  DiagnosticBuilder report_note(SourceRange range, std::string message, std::string label = {})
  {
    return report(Severity::Note, range, std::move(message), std::move(label));
  }

  void add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }
  void merge(const DiagnosticBag & other);
  void clear() noexcept { diagnostics_.clear(); }

  [[nodiscard]] const std::vector<Diagnostic> & all() const noexcept { return diagnostics_; }
  [[nodiscard]] bool empty() const noexcept { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return diagnostics_.size(); }
  [[nodiscard]] size_t error_count() const noexcept;
  [[nodiscard]] bool has_errors() const noexcept { return error_count() != 0; }

  [[nodiscard]] auto begin() const noexcept { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const noexcept { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace seda

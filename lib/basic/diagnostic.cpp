// seda/basic/diagnostic.cpp
#include "seda/basic/diagnostic.hpp"

#include <utility>

namespace seda
{

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Note:
      return "note";
  }
  return "error";
}

const Label * Diagnostic::primary_label() const noexcept
{
  if (labels.empty()) {
    return nullptr;
  }
  for (const Label & label : labels) {
    if (label.style == LabelStyle::Primary) {
      return &label;
    }
  }
  return &labels.front();
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * label = primary_label();
  return label ? label->range : SourceRange();
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(&bag), diag_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(std::exchange(other.bag_, nullptr)), diag_(std::move(other.diag_))
{
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (bag_) {
    bag_->add(std::move(diag_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diag_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(SourceRange range, std::string message)
{
  diag_.labels.push_back(Label{range, std::move(message), LabelStyle::Secondary});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help)
{
  diag_.help_message = std::move(help);
  return *this;
}

DiagnosticBuilder DiagnosticBag::report(
  Severity severity, SourceRange range, std::string message, std::string label)
{
  Diagnostic diag;
  diag.severity = severity;
  diag.message = std::move(message);
  diag.labels.push_back(Label{range, std::move(label), LabelStyle::Primary});
  return DiagnosticBuilder(*this, std::move(diag));
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

size_t DiagnosticBag::error_count() const noexcept
{
  size_t count = 0;
  for (const Diagnostic & diag : diagnostics_) {
    if (diag.is_error()) {
      ++count;
    }
  }
  return count;
}

}  // namespace seda

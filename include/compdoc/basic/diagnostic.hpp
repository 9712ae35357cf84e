// compdoc/basic/diagnostic.hpp - Diagnostic types for resolution and validation
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "compdoc/basic/source_range.hpp"

namespace compdoc
{

// ============================================================================
// Diagnostic Codes
// ============================================================================

namespace diag_code
{

inline constexpr const char * k_unresolved_token = "W001";
inline constexpr const char * k_empty_group = "W002";
inline constexpr const char * k_missing_document = "W003";
inline constexpr const char * k_circular_reference = "W004";
inline constexpr const char * k_depth_limit = "W005";
inline constexpr const char * k_expansion_budget = "W006";
inline constexpr const char * k_malformed_reference = "W007";

inline constexpr const char * k_cyclic_dependency = "E001";
inline constexpr const char * k_unknown_document = "E002";
inline constexpr const char * k_load_failure = "E003";

}  // namespace diag_code

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

enum class LabelStyle {
  Primary,    // the occurrence that caused the diagnostic
  Secondary,  // related location
};

/**
 * A location attached to a diagnostic: a byte range in the body of a
 * specific document. An empty document id means "no location".
 */
struct Label
{
  std::string document_id;
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g., "W003"
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and registers it in the bag when destroyed (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_label(
    std::string document_id, SourceRange range, std::string msg,
    LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(
    std::string document_id, SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters. Pass an empty document id for diagnostics without a location.
  DiagnosticBuilder report_error(
    std::string document_id, SourceRange range, std::string message,
    std::string label_message = "");
  DiagnosticBuilder report_warning(
    std::string document_id, SourceRange range, std::string message,
    std::string label_message = "");
  DiagnosticBuilder report_info(
    std::string document_id, SourceRange range, std::string message,
    std::string label_message = "");

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  /// Number of diagnostics carrying the given code
  [[nodiscard]] size_t count(std::string_view code) const;
  [[nodiscard]] bool contains(std::string_view code) const { return count(code) > 0; }

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  DiagnosticBuilder report(
    Severity severity, std::string document_id, SourceRange range, std::string message,
    std::string label_message);

  std::vector<Diagnostic> diagnostics_;
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

}  // namespace compdoc

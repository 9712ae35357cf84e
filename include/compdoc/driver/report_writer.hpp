// compdoc/driver/report_writer.hpp - JSON serialization of engine results
//
// Produces the machine-readable output of the CLI's --json mode.
//
#pragma once

#include <nlohmann/json.hpp>

#include "compdoc/basic/diagnostic.hpp"
#include "compdoc/driver/context_assembler.hpp"
#include "compdoc/driver/engine.hpp"
#include "compdoc/sema/cycle_validator.hpp"

namespace compdoc
{

[[nodiscard]] nlohmann::json to_json(const Diagnostic & diag);
[[nodiscard]] nlohmann::json to_json(const DiagnosticBag & diags);

[[nodiscard]] nlohmann::json to_json(const ResolveResult & result);

/// Validation outcome; `diags` carries the validator's diagnostics, if any.
[[nodiscard]] nlohmann::json to_json(
  const ValidationResult & result, const DiagnosticBag & diags = {});

[[nodiscard]] nlohmann::json to_json(const GroupResolution & result);
[[nodiscard]] nlohmann::json to_json(const AssembledContext & result);

}  // namespace compdoc

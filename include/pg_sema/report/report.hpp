// pg_sema/report/report.hpp - JSON reports of analysis results
//
// Machine-readable output of `pg-sema infer` and `pg-sema query`.
//
#pragma once

#include <gsl/span>
#include <nlohmann/json.hpp>

#include "pg_sema/driver/analyzer.hpp"
#include "pg_sema/sema/field.hpp"
#include "pg_sema/sema/json_type.hpp"
#include "pg_sema/sema/metadata.hpp"

namespace pg_sema
{

/**
 * Structural JSON shape, e.g.
 * `{"kind":"object","nullable":false,"fields":[{"name":"a","type":{...}}]}`.
 */
[[nodiscard]] nlohmann::json to_json(const JsonType * type);

/**
 * Output columns: name, type name, OID, nullability, dimensions, the
 * rendered client-side type and the structural shape.
 */
[[nodiscard]] nlohmann::json fields_to_json(
  gsl::span<const Field> fields, MetadataResolver & metadata, JsonTypeContext & json);

/**
 * Whole-run report: success flags, execution order, cycles, per-object
 * results (qualified name, kind, dependencies, fields), failed objects and
 * diagnostics.
 */
[[nodiscard]] nlohmann::json to_json(const AnalysisResult & result);

}  // namespace pg_sema

// pg_sema/driver/analyzer.hpp - Analysis driver
//
// Single entry point for the analysis pipeline.
// Used by the CLI and can be integrated into other tools.
//
#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pg_sema/ast/ast_context.hpp"
#include "pg_sema/basic/diagnostic.hpp"
#include "pg_sema/basic/source_manager.hpp"
#include "pg_sema/catalog/catalog.hpp"
#include "pg_sema/project/project_config.hpp"
#include "pg_sema/sema/field.hpp"
#include "pg_sema/sema/json_type.hpp"
#include "pg_sema/sema/metadata.hpp"

namespace pg_sema
{

struct AnalysisResult;

/// Runs after inference; may edit the result (e.g. drop objects from the output).
using AnalysisHook = std::function<void(AnalysisResult &)>;

// ============================================================================
// Analyze Options
// ============================================================================

struct AnalyzeOptions
{
  /// Polled between objects; when set, the run stops and reports `cancelled`.
  const std::atomic<bool> * cancel = nullptr;

  /// Routines dropped from the output (unqualified or schema-qualified names)
  std::vector<std::string> exclude_routines;

  /// Run the built-in hook that drops `_`-prefixed and excluded routines
  bool builtin_hooks = true;

  /// Extra hooks, run in order after the built-in one
  std::vector<AnalysisHook> hooks;
};

// ============================================================================
// Analysis Result
// ============================================================================

/// Inferred result of one schema object.
struct ObjectResult
{
  const SchemaObject * object = nullptr;
  std::vector<Field> fields;
};

/// Named SQL text for Analyzer::analyze_sources.
struct SourceInput
{
  std::filesystem::path path;
  std::string text;
};

struct AnalysisResult
{
  /// Whether the run produced no errors and was not cancelled
  bool success = false;

  /// Whether AnalyzeOptions::cancel stopped the run
  bool cancelled = false;

  /// Collected diagnostics; per-object ones carry the object's qualified name
  DiagnosticBag diagnostics;

  /// Execution order computed by the Linker (cycle members excluded)
  std::vector<const SchemaObject *> order;

  /// Dependency cycles, members in dependency order
  std::vector<std::vector<const SchemaObject *>> cycles;

  /// Successfully analysed objects, in execution order
  std::vector<ObjectResult> objects;

  /// Objects whose analysis failed (including cycle members)
  std::vector<const SchemaObject *> failed;

  // Storage backing the pointers above.
  std::unique_ptr<SourceRegistry> sources;
  std::unique_ptr<AstContext> ast;
  std::unique_ptr<Catalog> catalog;
  std::unique_ptr<JsonTypeContext> json;
  std::unique_ptr<CatalogMetadata> metadata;

  [[nodiscard]] const ObjectResult * find(const Identifier & id) const;
  [[nodiscard]] bool is_failed(const SchemaObject * obj) const;
};

// ============================================================================
// Analyzer
// ============================================================================

/**
 * Analysis driver that orchestrates the full pipeline.
 *
 * The pipeline consists of:
 * 1. Parsing (a syntax error stops the run)
 * 2. Catalog building (a duplicate object stops the run)
 * 3. Linking (cycle members are reported and not analysed)
 * 4. Inference of every object in execution order, each in isolation
 * 5. Post-analysis hooks
 */
class Analyzer
{
public:
  /**
   * Analyse SQL files.
   *
   * @param files Paths to .sql files, in declaration order
   * @param options Analyze options
   * @return AnalysisResult with success status, diagnostics and results
   */
  [[nodiscard]] static AnalysisResult analyze_files(
    const std::vector<std::filesystem::path> & files, const AnalyzeOptions & options);

  /// Analyse in-memory SQL texts.
  [[nodiscard]] static AnalysisResult analyze_sources(
    std::vector<SourceInput> sources, const AnalyzeOptions & options);

  /**
   * Analyse the schema files of a project.
   *
   * `schema.exclude_routines` is added to the options' exclusion list.
   */
  [[nodiscard]] static AnalysisResult analyze_project(
    const ProjectConfig & config, const AnalyzeOptions & options);

  /**
   * Infer the result columns of an ad-hoc SELECT against an analysed catalog.
   *
   * @param result A completed analysis (its catalog must have been built)
   * @param sql Query text
   * @param diags Receives syntax and inference errors
   * @return Result fields, or std::nullopt on error
   */
  [[nodiscard]] static std::optional<std::vector<Field>> infer_query(
    AnalysisResult & result, const std::string & sql, DiagnosticBag & diags);

  /// Hook that drops `_`-prefixed routines and routines named in `exclude`.
  [[nodiscard]] static AnalysisHook exclude_routines_hook(std::vector<std::string> exclude);

private:
  static bool analyze_object(
    AnalysisResult & result, const SchemaObject * obj, DiagnosticBag & diags);
};

}  // namespace pg_sema

// pg_sema/driver/analyzer.cpp - Analysis driver implementation
//
#include "pg_sema/driver/analyzer.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

#include "pg_sema/basic/casting.hpp"
#include "pg_sema/basic/diagnostic_codes.hpp"
#include "pg_sema/catalog/object_builder.hpp"
#include "pg_sema/linker/linker.hpp"
#include "pg_sema/sema/query_inferrer.hpp"
#include "pg_sema/sema/scope.hpp"
#include "pg_sema/syntax/frontend.hpp"

namespace pg_sema
{

namespace
{

std::optional<std::string> read_file(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace

// ============================================================================
// AnalysisResult
// ============================================================================

const ObjectResult * AnalysisResult::find(const Identifier & id) const
{
  for (const auto & r : objects) {
    if (r.object->id() == id) return &r;
  }
  return nullptr;
}

bool AnalysisResult::is_failed(const SchemaObject * obj) const
{
  return std::find(failed.begin(), failed.end(), obj) != failed.end();
}

// ============================================================================
// Pipeline
// ============================================================================

AnalysisResult Analyzer::analyze_files(
  const std::vector<std::filesystem::path> & files, const AnalyzeOptions & options)
{
  std::vector<SourceInput> sources;
  DiagnosticBag io_errors;
  for (const auto & file : files) {
    auto text = read_file(file);
    if (!text) {
      io_errors.report_error(SourceRange{}, "cannot read file: " + file.string());
      continue;
    }
    sources.push_back(SourceInput{file, std::move(*text)});
  }

  if (io_errors.has_errors()) {
    AnalysisResult result;
    result.diagnostics = std::move(io_errors);
    return result;
  }
  return analyze_sources(std::move(sources), options);
}

AnalysisResult Analyzer::analyze_project(
  const ProjectConfig & config, const AnalyzeOptions & options)
{
  std::vector<std::string> missing;
  const auto files = collect_schema_files(config, missing);

  if (!missing.empty() || files.empty()) {
    AnalysisResult result;
    for (const auto & entry : missing) {
      result.diagnostics.report_error(SourceRange{}, "schema.include entry matched no files: " + entry);
    }
    if (missing.empty()) {
      result.diagnostics.report_error(SourceRange{}, "no schema files in project");
    }
    return result;
  }

  AnalyzeOptions project_options = options;
  project_options.exclude_routines.insert(
    project_options.exclude_routines.end(), config.schema.exclude_routines.begin(),
    config.schema.exclude_routines.end());
  return analyze_files(files, project_options);
}

AnalysisResult Analyzer::analyze_sources(
  std::vector<SourceInput> sources, const AnalyzeOptions & options)
{
  AnalysisResult result;
  result.sources = std::make_unique<SourceRegistry>();
  result.ast = std::make_unique<AstContext>();
  result.catalog = std::make_unique<Catalog>();
  result.json = std::make_unique<JsonTypeContext>();
  DiagnosticBag & diags = result.diagnostics;

  // 1. Parse every file; syntax errors stop the run.
  std::vector<const Script *> scripts;
  for (auto & src : sources) {
    ParseOutput parsed =
      parse_source(*result.sources, src.path, std::move(src.text), *result.ast, diags);
    scripts.push_back(parsed.script);
  }
  if (diags.has_errors()) {
    return result;
  }

  // 2. Catalog; a duplicate declaration stops the run.
  ObjectBuilder builder(*result.catalog, diags);
  for (const Script * script : scripts) {
    builder.build(script);
  }
  if (diags.has_code(diag_code::k_duplicate_object)) {
    return result;
  }

  // 3. Link and order.
  Linker linker(*result.catalog, diags);
  LinkResult link = linker.link();
  result.order.assign(link.order.begin(), link.order.end());
  for (const auto & cycle : link.cycles) {
    result.cycles.emplace_back(cycle.begin(), cycle.end());
  }

  // 4. Infer each object against the results of its dependencies.
  result.metadata = std::make_unique<CatalogMetadata>(*result.catalog, *result.json);
  for (const auto & cycle : link.cycles) {
    for (const SchemaObject * member : cycle) {
      result.metadata->mark_failed(member);
      result.failed.push_back(member);
    }
  }

  for (const SchemaObject * obj : result.order) {
    if (options.cancel && options.cancel->load()) {
      result.cancelled = true;
      break;
    }

    DiagnosticBag object_diags;
    if (analyze_object(result, obj, object_diags)) {
      result.metadata->commit_fields(obj, result.objects.back().fields);
    } else {
      result.metadata->mark_failed(obj);
      result.failed.push_back(obj);
    }
    object_diags.attribute_to(obj->qualified_name());
    diags.merge(std::move(object_diags));
  }

  // 5. Post-analysis hooks.
  if (options.builtin_hooks) {
    exclude_routines_hook(options.exclude_routines)(result);
  }
  for (const auto & hook : options.hooks) {
    if (hook) hook(result);
  }

  result.success = !diags.has_errors() && !result.cancelled;
  return result;
}

bool Analyzer::analyze_object(
  AnalysisResult & result, const SchemaObject * obj, DiagnosticBag & diags)
{
  CatalogMetadata & metadata = *result.metadata;
  QueryInferrer inferrer(metadata, *result.json, diags);

  std::optional<std::vector<Field>> fields;
  switch (obj->get_kind()) {
    case ObjectKind::Table:
    case ObjectKind::CompositeType: {
      const auto & columns = isa<TableObject>(obj) ? cast<TableObject>(obj)->columns
                                                   : cast<CompositeTypeObject>(obj)->columns;
      if (!inferrer.check_columns(obj, columns)) break;
      std::vector<Field> columns_out;
      for (const auto & col : columns) columns_out.push_back(metadata.column_field(col));
      fields = std::move(columns_out);
      break;
    }
    case ObjectKind::EnumType:
      fields = std::vector<Field>{};
      break;
    case ObjectKind::View:
      fields = inferrer.infer_view(cast<ViewObject>(obj));
      break;
    case ObjectKind::Routine:
      fields = inferrer.infer_routine(cast<RoutineObject>(obj));
      break;
  }

  if (!fields || diags.has_errors()) return false;
  result.objects.push_back(ObjectResult{obj, std::move(*fields)});
  return true;
}

// ============================================================================
// Hooks
// ============================================================================

AnalysisHook Analyzer::exclude_routines_hook(std::vector<std::string> exclude)
{
  return [exclude = std::move(exclude)](AnalysisResult & result) {
    const auto excluded = [&](const ObjectResult & r) {
      if (r.object->get_kind() != ObjectKind::Routine) return false;
      const Identifier & id = r.object->id();
      if (!id.name.empty() && id.name.front() == '_') return true;
      for (const auto & name : exclude) {
        if (name == id.name || name == id.qualified()) return true;
      }
      return false;
    };
    result.objects.erase(
      std::remove_if(result.objects.begin(), result.objects.end(), excluded),
      result.objects.end());
  };
}

// ============================================================================
// Ad-hoc queries
// ============================================================================

std::optional<std::vector<Field>> Analyzer::infer_query(
  AnalysisResult & result, const std::string & sql, DiagnosticBag & diags)
{
  if (!result.metadata || !result.ast || !result.sources || !result.json) {
    diags.report_error(SourceRange{}, "no analysed catalog to query against");
    return std::nullopt;
  }

  const size_t query_number = result.sources->size() + 1;
  ParseOutput parsed = parse_source(
    *result.sources, "<query " + std::to_string(query_number) + ">", sql, *result.ast, diags);
  if (diags.has_errors()) return std::nullopt;

  const auto & stmts = parsed.script->statements;
  const SelectStmt * select = stmts.size() == 1 ? dyn_cast<SelectStmt>(stmts[0]) : nullptr;
  if (!select) {
    diags.report_error(
        parsed.script->get_range(), "expected exactly one SELECT statement", "not a query")
      .with_code(diag_code::k_unsupported_construct);
    return std::nullopt;
  }

  QueryInferrer inferrer(*result.metadata, *result.json, diags);
  Scope scope(*result.metadata);
  return inferrer.infer_select(select, scope);
}

}  // namespace pg_sema

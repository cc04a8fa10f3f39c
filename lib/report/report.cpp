// pg_sema/report/report.cpp - JSON reports of analysis results
#include "pg_sema/report/report.hpp"

#include <string>
#include <vector>

#include "pg_sema/sema/query_inferrer.hpp"
#include "pg_sema/sema/scope.hpp"

namespace pg_sema
{

namespace
{

using json = nlohmann::json;

std::string_view severity_name(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

json names_of(gsl::span<const SchemaObject * const> objects)
{
  json arr = json::array();
  for (const SchemaObject * obj : objects) arr.push_back(obj->qualified_name());
  return arr;
}

std::string type_name_of(const Field & f, Scope & scope)
{
  auto info = scope.get_type_name(f.type_oid);
  if (!info) return "unknown";
  return describe_type(TypeRef{info->id, f.dims});
}

}  // namespace

json to_json(const JsonType * type)
{
  if (!type) return nullptr;

  json j;
  j["kind"] = std::string(to_string(type->kind));
  j["nullable"] = type->is_nullable();
  switch (type->kind) {
    case JsonKind::Primitive:
      j["primitive"] = std::string(to_string(type->primitive));
      break;
    case JsonKind::Array:
      j["element"] = to_json(type->element);
      break;
    case JsonKind::Object: {
      json fields = json::array();
      for (const auto & f : type->fields) {
        fields.push_back({{"name", f.name}, {"type", to_json(f.type)}});
      }
      j["fields"] = std::move(fields);
      break;
    }
    case JsonKind::Union: {
      json members = json::array();
      for (const JsonType * m : type->members) members.push_back(to_json(m));
      j["members"] = std::move(members);
      break;
    }
  }
  return j;
}

json fields_to_json(
  gsl::span<const Field> fields, MetadataResolver & metadata, JsonTypeContext & json_types)
{
  DiagnosticBag scratch;
  QueryInferrer inferrer(metadata, json_types, scratch);
  Scope scope(metadata);

  json arr = json::array();
  for (const Field & f : fields) {
    const JsonType * shape = inferrer.json_of_field(f, scope);
    json j;
    j["name"] = f.name;
    j["type"] = type_name_of(f, scope);
    j["oid"] = f.type_oid;
    j["nullable"] = f.nullable;
    j["dims"] = f.dims;
    j["ts_type"] = render_json_type(shape);
    j["shape"] = to_json(shape);
    arr.push_back(std::move(j));
  }
  return arr;
}

json to_json(const AnalysisResult & result)
{
  json report;
  report["success"] = result.success;
  report["cancelled"] = result.cancelled;
  report["order"] = names_of(result.order);

  json cycles = json::array();
  for (const auto & cycle : result.cycles) cycles.push_back(names_of(cycle));
  report["cycles"] = std::move(cycles);

  json objects = json::array();
  if (result.metadata && result.json) {
    for (const ObjectResult & r : result.objects) {
      const std::vector<const SchemaObject *> deps(
        r.object->dependencies().begin(), r.object->dependencies().end());
      json obj;
      obj["name"] = r.object->qualified_name();
      obj["kind"] = std::string(to_string(r.object->get_kind()));
      obj["dependencies"] = names_of(deps);
      obj["fields"] = fields_to_json(r.fields, *result.metadata, *result.json);
      objects.push_back(std::move(obj));
    }
  }
  report["objects"] = std::move(objects);
  report["failed"] = names_of(result.failed);

  json diagnostics = json::array();
  for (const Diagnostic & d : result.diagnostics) {
    json dj;
    dj["severity"] = std::string(severity_name(d.severity));
    dj["code"] = d.code;
    dj["message"] = d.message;
    dj["object"] = d.object ? json(*d.object) : json(nullptr);
    if (d.help_message) dj["help"] = *d.help_message;
    diagnostics.push_back(std::move(dj));
  }
  report["diagnostics"] = std::move(diagnostics);
  return report;
}

}  // namespace pg_sema

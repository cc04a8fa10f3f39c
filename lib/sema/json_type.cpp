// pg_sema/sema/json_type.cpp - JSON shape interning and rendering
#include "pg_sema/sema/json_type.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>

namespace pg_sema
{

namespace
{

// `structural` drops nullability at every level; otherwise nulls are marked
// with a trailing '?'.
std::string compute_key(const JsonType & t, bool structural)
{
  const auto child = [structural](const JsonType * c) -> const std::string & {
    return structural ? c->shape : c->key;
  };

  std::string key;
  switch (t.kind) {
    case JsonKind::Primitive:
      key = std::string(to_string(t.primitive));
      break;
    case JsonKind::Array:
      key = "<" + child(t.element) + ">";
      break;
    case JsonKind::Object: {
      std::vector<const JsonField *> sorted;
      sorted.reserve(t.fields.size());
      for (const auto & f : t.fields) sorted.push_back(&f);
      std::sort(sorted.begin(), sorted.end(), [](const JsonField * a, const JsonField * b) {
        return a->name < b->name;
      });
      key = "#";
      for (const JsonField * f : sorted) {
        key += f->name;
        key += ':';
        key += child(f->type);
        key += ',';
      }
      break;
    }
    case JsonKind::Union: {
      std::vector<std::string_view> keys;
      keys.reserve(t.members.size());
      for (const JsonType * m : t.members) keys.push_back(child(m));
      std::sort(keys.begin(), keys.end());
      for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) key += '|';
        key += keys[i];
      }
      break;
    }
  }
  if (!structural && t.nullable) key += '?';
  return key;
}

}  // namespace

const JsonType * JsonType::find_field(std::string_view name) const noexcept
{
  for (const auto & f : fields) {
    if (f.name == name) return f.type;
  }
  return nullptr;
}

uint64_t fnv1a_64(std::string_view data) noexcept
{
  uint64_t h = 0xcbf29ce484222325ULL;
  for (const char c : data) {
    h ^= static_cast<uint8_t>(c);
    h *= 0x100000001b3ULL;
  }
  return h;
}

// ============================================================================
// JsonTypeContext
// ============================================================================

const JsonType * JsonTypeContext::intern(JsonType t)
{
  t.key = compute_key(t, false);
  if (auto it = by_key_.find(t.key); it != by_key_.end()) {
    return it->second;
  }
  t.shape = compute_key(t, true);
  t.hash = fnv1a_64(t.key);
  types_.push_back(std::move(t));
  const JsonType * stored = &types_.back();
  by_key_.emplace(stored->key, stored);
  return stored;
}

const JsonType * JsonTypeContext::primitive(JsonPrimitive p, bool nullable)
{
  JsonType t;
  t.kind = JsonKind::Primitive;
  t.primitive = p;
  t.nullable = nullable;
  return intern(std::move(t));
}

const JsonType * JsonTypeContext::array(const JsonType * element, bool nullable)
{
  JsonType t;
  t.kind = JsonKind::Array;
  t.element = element ? element : primitive(JsonPrimitive::Json);
  t.nullable = nullable;
  return intern(std::move(t));
}

const JsonType * JsonTypeContext::object(std::vector<JsonField> fields, bool nullable)
{
  JsonType t;
  t.kind = JsonKind::Object;
  t.nullable = nullable;
  for (auto & f : fields) {
    if (!f.type) f.type = primitive(JsonPrimitive::Json);
    auto it = std::find_if(t.fields.begin(), t.fields.end(), [&](const JsonField & existing) {
      return existing.name == f.name;
    });
    if (it != t.fields.end()) {
      it->type = f.type;
    } else {
      t.fields.push_back(std::move(f));
    }
  }
  return intern(std::move(t));
}

const JsonType * JsonTypeContext::with_nullable(const JsonType * t, bool nullable)
{
  if (!t || t->nullable == nullable) return t;
  JsonType copy;
  copy.kind = t->kind;
  copy.primitive = t->primitive;
  copy.element = t->element;
  copy.fields = t->fields;
  copy.members = t->members;
  copy.nullable = nullable;
  return intern(std::move(copy));
}

const JsonType * JsonTypeContext::make_union(
  std::vector<const JsonType *> members, bool nullable)
{
  JsonType t;
  t.kind = JsonKind::Union;
  t.members = std::move(members);
  t.nullable = nullable;
  return intern(std::move(t));
}

const JsonType * JsonTypeContext::merge(const JsonType * a, const JsonType * b)
{
  if (a == b) return a;
  const bool nullable = a->nullable || b->nullable;
  switch (a->kind) {
    case JsonKind::Primitive:
      return with_nullable(a, nullable);
    case JsonKind::Array:
      return array(merge(a->element, b->element), nullable);
    case JsonKind::Object: {
      std::vector<JsonField> fields = a->fields;
      for (auto & f : fields) {
        if (const JsonType * other = b->find_field(f.name)) f.type = merge(f.type, other);
      }
      return object(std::move(fields), nullable);
    }
    case JsonKind::Union:
      // Members pair up by shape, so unite() merges them one by one.
      return unite(a, b);
  }
  return a;
}

const JsonType * JsonTypeContext::unite(const JsonType * a, const JsonType * b)
{
  if (!a) return b;
  if (!b) return a;

  bool union_nullable = false;
  std::vector<const JsonType *> flat;
  for (const JsonType * side : {a, b}) {
    if (side->is_union()) {
      union_nullable = union_nullable || side->nullable;
      flat.insert(flat.end(), side->members.begin(), side->members.end());
    } else {
      flat.push_back(side);
    }
  }

  // Collapse structurally equal members, ignoring nullability at any depth.
  std::vector<const JsonType *> members;
  std::unordered_map<std::string_view, size_t> index;
  for (const JsonType * m : flat) {
    auto [it, inserted] = index.emplace(m->shape_key(), members.size());
    if (inserted) {
      members.push_back(m);
    } else {
      members[it->second] = merge(members[it->second], m);
    }
  }

  if (members.size() == 1) {
    return union_nullable ? with_nullable(members.front(), true) : members.front();
  }
  return make_union(std::move(members), union_nullable);
}

const JsonType * JsonTypeContext::unite(gsl::span<const JsonType * const> types)
{
  const JsonType * result = nullptr;
  for (const JsonType * t : types) {
    result = unite(result, t);
  }
  return result;
}

// ============================================================================
// Rendering
// ============================================================================

std::string render_json_type(const JsonType * t, bool include_nulls)
{
  if (!t) return std::string(to_string(JsonPrimitive::Json));

  const auto null_suffix = [&](bool nullable) {
    return include_nulls && nullable ? std::string(" | null") : std::string();
  };

  switch (t->kind) {
    case JsonKind::Primitive:
      return std::string(to_string(t->primitive)) + null_suffix(t->nullable);

    case JsonKind::Array: {
      std::string element = render_json_type(t->element, include_nulls);
      if (t->element->is_union() || t->element->nullable) {
        element = "(" + element + ")";
      }
      return element + "[]" + null_suffix(t->nullable);
    }

    case JsonKind::Object: {
      if (t->fields.empty()) return "{}" + null_suffix(t->nullable);
      std::string out = "{ ";
      for (size_t i = 0; i < t->fields.size(); ++i) {
        if (i > 0) out += ", ";
        out += t->fields[i].name;
        out += ": ";
        out += render_json_type(t->fields[i].type, include_nulls);
      }
      out += " }";
      return out + null_suffix(t->nullable);
    }

    case JsonKind::Union: {
      std::string out;
      for (size_t i = 0; i < t->members.size(); ++i) {
        if (i > 0) out += " | ";
        out += render_json_type(t->members[i], false);
      }
      return out + null_suffix(t->is_nullable());
    }
  }
  return std::string(to_string(JsonPrimitive::Json));
}

}  // namespace pg_sema

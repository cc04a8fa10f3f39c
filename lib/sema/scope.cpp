// pg_sema/sema/scope.cpp - Scope bindings and cached metadata lookups
#include "pg_sema/sema/scope.hpp"

#include <algorithm>

namespace pg_sema
{

Scope::Scope(MetadataResolver & metadata)
: metadata_(&metadata), owned_cache_(std::make_unique<TypeNameCache>())
{
  cache_ = owned_cache_.get();
}

Scope::Scope(MetadataResolver & metadata, const Scope * parent, TypeNameCache * cache)
: metadata_(&metadata), parent_(parent), cache_(cache)
{
}

Scope Scope::fork() const
{
  return Scope(*metadata_, this, cache_);
}

void Scope::bind(std::string name, RelationBinding binding)
{
  for (auto & ref : references_) {
    if (ref.name == name) {
      ref.binding = std::move(binding);
      return;
    }
  }
  references_.push_back(Reference{std::move(name), std::move(binding)});
}

const RelationBinding * Scope::find(std::string_view name) const
{
  for (const auto & ref : references_) {
    if (ref.name == name) return &ref.binding;
  }
  return nullptr;
}

RelationBinding * Scope::find(std::string_view name)
{
  for (auto & ref : references_) {
    if (ref.name == name) return &ref.binding;
  }
  return nullptr;
}

void Scope::add_merged_field(Field field, size_t first, size_t last)
{
  merged_.erase(
    std::remove_if(
      merged_.begin(), merged_.end(),
      [&](const MergedField & m) {
        return m.field.name == field.name && m.first >= first && m.last <= last;
      }),
    merged_.end());
  merged_.push_back(MergedField{std::move(field), first, last});
}

const Field * Scope::find_merged(std::string_view name, size_t first, size_t last) const
{
  for (const auto & m : merged_) {
    if (m.field.name == name && m.first >= first && m.last <= last) return &m.field;
  }
  return nullptr;
}

void Scope::mark_nullable(size_t first, size_t last)
{
  for (size_t i = first; i < last && i < references_.size(); ++i) {
    for (auto & f : references_[i].binding.fields) f.nullable = true;
  }
  for (auto & m : merged_) {
    if (m.first >= first && m.last <= last) m.field.nullable = true;
  }
}

bool Scope::is_merged(std::string_view name, size_t reference) const
{
  return std::any_of(merged_.begin(), merged_.end(), [&](const MergedField & m) {
    return m.field.name == name && m.covers(reference);
  });
}

FieldIndex Scope::unique_fields() const
{
  FieldIndex index;
  const auto expose = [&index](const Field & field) {
    const std::string_view name = field.name;
    if (index.ambiguous.count(name) > 0) return;
    auto [it, inserted] = index.unique.emplace(name, &field);
    if (!inserted) {
      index.unique.erase(it);
      index.ambiguous.insert(name);
    }
  };

  for (size_t i = 0; i < references_.size(); ++i) {
    for (const auto & field : references_[i].binding.fields) {
      if (!is_merged(field.name, i)) expose(field);
    }
  }
  for (const auto & m : merged_) expose(m.field);
  return index;
}

void Scope::register_cte(std::string name, RelationBinding binding)
{
  for (auto & cte : ctes_) {
    if (cte.name == name) {
      cte.binding = std::move(binding);
      return;
    }
  }
  ctes_.push_back(Reference{std::move(name), std::move(binding)});
}

const RelationBinding * Scope::find_cte(std::string_view name) const
{
  for (const Scope * s = this; s != nullptr; s = s->parent_) {
    for (const auto & cte : s->ctes_) {
      if (cte.name == name) return &cte.binding;
    }
  }
  return nullptr;
}

std::optional<TypeInfo> Scope::get_type_name(uint32_t type_oid)
{
  if (auto it = cache_->names.find(type_oid); it != cache_->names.end()) {
    return it->second;
  }
  auto info = metadata_->get_type_name(type_oid);
  cache_->names.emplace(type_oid, info);
  return info;
}

std::optional<uint32_t> Scope::get_type_oid(const Identifier & id, bool array)
{
  auto key = std::make_pair(id, array);
  if (auto it = cache_->oids.find(key); it != cache_->oids.end()) {
    return it->second;
  }
  auto oid = metadata_->get_type_oid(id, array);
  cache_->oids.emplace(std::move(key), oid);
  return oid;
}

}  // namespace pg_sema

// pg_sema/project/project_config.cpp - Project configuration implementation
//
#include "pg_sema/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <set>
#include <system_error>

namespace pg_sema
{

namespace
{

namespace fs = std::filesystem;

/// Parse a list of strings; a scalar counts as a one-element list.
bool parse_string_list(
  const YAML::Node & node, const char * what, std::vector<std::string> & out, std::string & error)
{
  if (node.IsScalar()) {
    out.push_back(node.as<std::string>());
    return true;
  }
  if (!node.IsSequence()) {
    error = std::string(what) + " must be a list";
    return false;
  }
  for (const auto & item : node) {
    if (!item.IsScalar()) {
      error = std::string(what) + " entries must be strings";
      return false;
    }
    out.push_back(item.as<std::string>());
  }
  return true;
}

bool ends_with(const std::string & s, const std::string & suffix)
{
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// Files below `dir` whose name ends in `suffix`, sorted.
std::vector<fs::path> files_below(const fs::path & dir, const std::string & suffix)
{
  std::vector<fs::path> files;
  std::error_code ec;
  for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec) && ends_with(it->path().filename().string(), suffix)) {
      files.push_back(it->path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    // Parse 'package' section
    if (root["package"]) {
      const auto & pkg = root["package"];
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
      if (pkg["version"]) {
        config.package.version = pkg["version"].as<std::string>();
      }
    }

    // Parse 'schema' section
    if (root["schema"]) {
      const auto & schema = root["schema"];
      if (!schema.IsMap()) {
        return ConfigLoadResult::fail("schema must be a map");
      }
      std::string error;
      if (schema["include"] &&
          !parse_string_list(schema["include"], "schema.include", config.schema.include, error)) {
        return ConfigLoadResult::fail(error);
      }
      if (schema["exclude_routines"] &&
          !parse_string_list(
            schema["exclude_routines"], "schema.exclude_routines", config.schema.exclude_routines,
            error)) {
        return ConfigLoadResult::fail(error);
      }
    }

    // Parse 'output' section
    if (root["output"]) {
      const auto & output = root["output"];
      if (output["report"]) {
        config.output.report = output["report"].as<std::string>();
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  if (config.schema.include.empty()) {
    return ConfigLoadResult::fail("schema.include must name at least one file or directory");
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  fs::path current = fs::absolute(start_dir);

  // If startDir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::vector<std::filesystem::path> collect_schema_files(
  const ProjectConfig & config, std::vector<std::string> & missing)
{
  std::vector<fs::path> result;
  std::set<fs::path> seen;

  for (const auto & entry : config.schema.include) {
    std::vector<fs::path> files;
    const auto star = entry.find('*');
    if (star != std::string::npos) {
      // `dir/**.sql`, `dir/*.sql`: the directory part, then a name suffix.
      const auto slash = entry.rfind('/', star);
      const fs::path dir =
        config.project_root / (slash == std::string::npos ? std::string(".") : entry.substr(0, slash));
      const std::string suffix = entry.substr(entry.find_last_of('*') + 1);
      files = files_below(dir, suffix);
    } else {
      const fs::path path = config.project_root / entry;
      if (fs::is_directory(path)) {
        files = files_below(path, ".sql");
      } else if (fs::is_regular_file(path)) {
        files.push_back(path);
      }
    }

    if (files.empty()) {
      missing.push_back(entry);
      continue;
    }
    for (auto & f : files) {
      fs::path normal = f.lexically_normal();
      if (seen.insert(normal).second) result.push_back(std::move(normal));
    }
  }
  return result;
}

}  // namespace pg_sema

// cfgc/project/project_config.cpp - Project configuration implementation
//
#include "cfgc/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace cfgc
{

std::optional<EmitFormat> parse_emit_format(std::string_view name)
{
  if (name == "text") {
    return EmitFormat::Text;
  }
  if (name == "json") {
    return EmitFormat::Json;
  }
  return std::nullopt;
}

std::string_view to_string(EmitFormat format) noexcept
{
  switch (format) {
    case EmitFormat::Text:
      return "text";
    case EmitFormat::Json:
      return "json";
  }
  return "text";
}

namespace
{

/// Fill `config.compiler` from the `compiler` map. Returns an error message
/// or an empty string.
std::string parse_compiler_section(const YAML::Node & comp, CompilerConfig & out)
{
  if (!comp.IsMap()) {
    return "compiler must be a map";
  }

  if (comp["entry_points"]) {
    const YAML::Node eps = comp["entry_points"];
    if (!eps.IsSequence()) {
      return "compiler.entry_points must be a list";
    }
    for (const auto & ep : eps) {
      if (!ep.IsScalar()) {
        return "compiler.entry_points must contain file paths";
      }
      out.entry_points.emplace_back(ep.as<std::string>());
    }
  }

  if (comp["output_dir"]) {
    out.output_dir = comp["output_dir"].as<std::string>();
  }

  if (comp["emit"]) {
    const std::string emit = comp["emit"].as<std::string>();
    const auto format = parse_emit_format(emit);
    if (!format) {
      return "invalid compiler.emit: '" + emit + "' (must be 'text' or 'json')";
    }
    out.emit = *format;
  }

  return {};
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    if (root["package"]) {
      const auto & pkg = root["package"];
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
      if (pkg["version"]) {
        config.package.version = pkg["version"].as<std::string>();
      }
    }

    if (root["compiler"]) {
      std::string error = parse_compiler_section(root["compiler"], config.compiler);
      if (!error.empty()) {
        return ConfigLoadResult::fail(std::move(error));
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::string default_project_config(std::string_view project_name)
{
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "package" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << std::string(project_name);
  out << YAML::Key << "version" << YAML::Value << "0.1.0";
  out << YAML::EndMap;
  out << YAML::Key << "compiler" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "entry_points" << YAML::Value << YAML::BeginSeq << "src/main.c"
      << YAML::EndSeq;
  out << YAML::Key << "output_dir" << YAML::Value << "generated";
  out << YAML::Key << "emit" << YAML::Value << "text";
  out << YAML::EndMap;
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

}  // namespace cfgc

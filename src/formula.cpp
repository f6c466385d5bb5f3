#include "formula.h"

#include "anvil_home.h"
#include "config.h"
#include "errors.h"
#include "extract.h"
#include "sol_util.h"
#include "util.h"

#include <cmath>
#include <utility>

namespace anvil {
namespace {

using json = nlohmann::json;

std::string require_string(json const &value, std::string const &context, char const *key) {
  if (!value.is_string()) {
    throw formula_parse_error(context, std::string{ key } + " must be a string");
  }
  return value.get<std::string>();
}

std::optional<std::string> optional_string(json const &doc,
                                           std::string const &context,
                                           char const *key) {
  auto const it{ doc.find(key) };
  if (it == doc.end() || it->is_null()) { return std::nullopt; }
  return require_string(*it, context, key);
}

std::vector<std::string> string_list(json const &value,
                                     std::string const &context,
                                     std::string const &key) {
  if (!value.is_array()) {
    throw formula_parse_error(context, key + " must be a list of strings");
  }
  std::vector<std::string> out;
  for (auto const &item : value) {
    if (!item.is_string()) {
      throw formula_parse_error(context, key + " must contain only strings");
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

std::map<std::string, std::vector<std::string>> parse_build(json const &value,
                                                            std::string const &context) {
  std::map<std::string, std::vector<std::string>> build;
  if (value.is_array()) {  // shorthand for {"common": [...]}
    build["common"] = string_list(value, context, "build");
    return build;
  }
  if (!value.is_object()) {
    throw formula_parse_error(context, "build must be an object of command lists");
  }
  for (auto const &[platform, commands] : value.items()) {
    build[platform] = string_list(commands, context, "build." + platform);
  }
  return build;
}

formula_source parse_source(json const &doc, std::string const &context) {
  auto const url{ optional_string(doc, context, "url") };
  auto const path{ optional_string(doc, context, "path") };
  if (url && path) { throw formula_parse_error(context, "url and path are exclusive"); }

  std::string const locator{ url ? *url : *path };
  if (util_trim(locator).empty()) {
    throw formula_parse_error(context, url ? "url is empty" : "path is empty");
  }

  if (auto const type{ optional_string(doc, context, "type") }) {
    auto const lowered{ util_to_lower(*type) };
    if (lowered == "git") { return { source_kind::GIT, locator }; }
    if (lowered == "local") { return { source_kind::LOCAL, locator }; }
    if (lowered == "archive") { return { source_kind::ARCHIVE, locator }; }
    throw formula_parse_error(context, "type must be git, local or archive, got '" + *type +
                                           "'");
  }

  return { formula_infer_source_kind(locator, path.has_value()), locator };
}

// Lua tables become JSON: a table whose keys are exactly 1..n is an array, anything else
// an object with string keys.
json lua_to_json(sol::object const &obj,
                 std::string const &context,
                 std::string const &where) {
  switch (obj.get_type()) {
    case sol::type::lua_nil: return nullptr;
    case sol::type::boolean: return obj.as<bool>();
    case sol::type::string: return obj.as<std::string>();
    case sol::type::number: {
      double const d{ obj.as<double>() };
      if (std::floor(d) == d) { return static_cast<long long>(d); }
      return d;
    }
    case sol::type::table: {
      sol::table table{ obj.as<sol::table>() };
      std::size_t const n{ table.size() };
      std::size_t count{ 0 };
      bool all_string_keys{ true };
      for (auto const &[k, v] : table) {
        ++count;
        if (k.get_type() != sol::type::string) { all_string_keys = false; }
      }

      if (count == 0) { return json::array(); }

      if (count == n) {
        json arr = json::array();
        for (std::size_t i{ 1 }; i <= n; ++i) {
          arr.push_back(lua_to_json(table.get<sol::object>(i),
                                    context,
                                    where + "[" + std::to_string(i) + "]"));
        }
        return arr;
      }

      if (!all_string_keys) {
        throw formula_parse_error(context, where + " mixes list and key entries");
      }
      json out = json::object();
      for (auto const &[k, v] : table) {
        auto const key{ k.as<std::string>() };
        out[key] = lua_to_json(v, context, where.empty() ? key : where + "." + key);
      }
      return out;
    }
    default:
      throw formula_parse_error(context,
                                (where.empty() ? std::string{ "value" } : where) +
                                    " has unsupported type " +
                                    std::string{ sol_util_type_name(obj.get_type()) });
  }
}

}  // namespace

bool formula::has_build_plan() const {
  for (auto const &[platform, commands] : build) {
    if (!commands.empty()) { return true; }
  }
  return false;
}

char const *source_kind_name(source_kind kind) {
  switch (kind) {
    case source_kind::GIT: return "git";
    case source_kind::LOCAL: return "local";
    case source_kind::ARCHIVE: return "archive";
  }
  return "git";
}

source_kind formula_infer_source_kind(std::string_view locator, bool from_path_key) {
  std::string const lowered{ util_to_lower(locator) };
  if (extract_is_archive_extension(std::filesystem::path{ lowered })) {
    return source_kind::ARCHIVE;
  }
  if (from_path_key) { return source_kind::LOCAL; }
  return source_kind::GIT;
}

formula formula_from_json(json const &doc,
                          std::string const &context,
                          std::optional<std::string> const &default_name) {
  if (!doc.is_object()) { throw formula_parse_error(context, "formula must be an object"); }

  formula f{};

  if (auto name{ optional_string(doc, context, "name") }) {
    f.name = std::move(*name);
  } else if (default_name) {
    f.name = *default_name;
  } else {
    throw formula_parse_error(context, "name is required");
  }
  try {
    validate_component_name("formula", f.name);
  } catch (anvil_error const &e) { throw formula_parse_error(context, e.what()); }

  f.version = optional_string(doc, context, "version").value_or("");
  f.description = optional_string(doc, context, "description").value_or("");

  if (doc.contains("url") || doc.contains("path")) { f.source = parse_source(doc, context); }

  if (auto const it{ doc.find("dependencies") }; it != doc.end() && !it->is_null()) {
    f.dependencies = string_list(*it, context, "dependencies");
    for (auto const &dep : f.dependencies) {
      if (dep == f.name) {
        throw formula_parse_error(context, "formula '" + f.name + "' depends on itself");
      }
    }
  }

  if (auto const it{ doc.find("build") }; it != doc.end() && !it->is_null()) {
    f.build = parse_build(*it, context);
  }

  if (auto const mode{ optional_string(doc, context, "platform_mode") }) {
    auto const lowered{ util_to_lower(*mode) };
    if (lowered == "append") {
      f.mode = platform_mode::APPEND;
    } else if (lowered == "replace") {
      f.mode = platform_mode::REPLACE;
    } else {
      throw formula_parse_error(context,
                                "platform_mode must be append or replace, got '" + *mode +
                                    "'");
    }
  }

  if (auto const it{ doc.find("binaries") }; it != doc.end() && !it->is_null()) {
    f.binaries = string_list(*it, context, "binaries");
  }

  if (auto const runtime{ optional_string(doc, context, "msvc_runtime") }) {
    try {
      f.msvc_runtime = config_parse_msvc_runtime(*runtime);
    } catch (std::runtime_error const &e) { throw formula_parse_error(context, e.what()); }
  }

  if (auto const it{ doc.find("force_pic") }; it != doc.end() && !it->is_null()) {
    if (!it->is_boolean()) { throw formula_parse_error(context, "force_pic must be a boolean"); }
    f.force_pic = it->get<bool>();
  }

  return f;
}

formula formula_parse_json(std::string_view text,
                           std::string const &context,
                           std::optional<std::string> const &default_name) {
  json doc;
  try {
    doc = json::parse(text);
  } catch (json::parse_error const &e) { throw formula_parse_error(context, e.what()); }
  return formula_from_json(doc, context, default_name);
}

formula formula_parse_lua(std::filesystem::path const &script,
                          std::optional<std::string> const &default_name) {
  std::string const context{ script.string() };
  auto lua{ sol_util_make_lua_state() };

  auto result{ lua->safe_script_file(script.string(), sol::script_pass_on_error) };
  if (!result.valid()) {
    sol::error err = result;
    throw formula_parse_error(context, err.what());
  }

  sol::object const returned{ result.get<sol::object>() };
  if (returned.get_type() != sol::type::table) {
    throw formula_parse_error(context,
                              "script must return a table, got " +
                                  std::string{ sol_util_type_name(returned.get_type()) });
  }

  return formula_from_json(lua_to_json(returned, context, ""), context, default_name);
}

formula formula_load_file(std::filesystem::path const &path,
                          std::optional<std::string> const &default_name) {
  if (path.extension() == ".lua") { return formula_parse_lua(path, default_name); }

  std::string text;
  try {
    text = util_load_text(path);
  } catch (std::runtime_error const &e) { throw formula_parse_error(path.string(), e.what()); }
  return formula_parse_json(text, path.string(), default_name);
}

json formula_to_json(formula const &f) {
  json doc = json::object();
  doc["name"] = f.name;
  if (!f.version.empty()) { doc["version"] = f.version; }
  if (!f.description.empty()) { doc["description"] = f.description; }
  if (f.source) {
    doc[f.source->kind == source_kind::LOCAL ? "path" : "url"] = f.source->locator;
    doc["type"] = source_kind_name(f.source->kind);
  }
  if (!f.dependencies.empty()) { doc["dependencies"] = f.dependencies; }
  if (!f.build.empty()) { doc["build"] = f.build; }
  if (f.mode == platform_mode::REPLACE) { doc["platform_mode"] = "replace"; }
  if (!f.binaries.empty()) { doc["binaries"] = f.binaries; }
  if (f.msvc_runtime) { doc["msvc_runtime"] = *f.msvc_runtime; }
  if (f.force_pic) { doc["force_pic"] = *f.force_pic; }
  return doc;
}

std::vector<std::string> formula_commands_for(formula const &f, std::string_view platform) {
  auto const platform_it{ f.build.find(std::string{ platform }) };
  bool const has_platform{ platform_it != f.build.end() && platform != "common" };

  std::vector<std::string> commands;
  if (!(has_platform && f.mode == platform_mode::REPLACE)) {
    if (auto const common{ f.build.find("common") }; common != f.build.end()) {
      commands = common->second;
    }
  }
  if (has_platform) {
    commands.insert(commands.end(), platform_it->second.begin(), platform_it->second.end());
  }
  return commands;
}

}  // namespace anvil

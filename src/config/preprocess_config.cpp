#include "diffbudget/config/preprocess_config.h"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace diffbudget::config {

namespace {

using ConfigResult = core::Result<PreprocessConfig, std::string>;

template <typename Int>
std::optional<Int> parse_integer(const std::string& text) {
  Int value{};
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last || text.empty()) {
    return std::nullopt;
  }
  return value;
}

std::string type_error(const char* key, const char* expected) {
  return std::string{"config: '"} + key + "' must be " + expected;
}

}  // namespace

EnvLookup process_environment() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string{value};
  };
}

ConfigResult apply_json(const nlohmann::json& j, PreprocessConfig base) {
  if (!j.is_object()) {
    return ConfigResult::err("config: top-level JSON value must be an object");
  }

  if (j.contains("token_limit")) {
    if (!j["token_limit"].is_number_integer()) {
      return ConfigResult::err(type_error("token_limit", "an integer"));
    }
    base.token_limit = j["token_limit"].get<int>();
  }
  if (j.contains("model")) {
    if (!j["model"].is_string()) {
      return ConfigResult::err(type_error("model", "a string"));
    }
    base.model = j["model"].get<std::string>();
  }
  if (j.contains("max_workers")) {
    if (!j["max_workers"].is_number_integer()) {
      return ConfigResult::err(type_error("max_workers", "an integer"));
    }
    base.max_workers = j["max_workers"].get<int>();
  }
  if (j.contains("include_all_threshold")) {
    if (!j["include_all_threshold"].is_number_integer()) {
      return ConfigResult::err(type_error("include_all_threshold", "an integer"));
    }
    base.include_all_threshold = j["include_all_threshold"].get<int>();
  }
  if (j.contains("cheap_path_ratio")) {
    if (!j["cheap_path_ratio"].is_number()) {
      return ConfigResult::err(type_error("cheap_path_ratio", "a number"));
    }
    base.cheap_path_ratio = j["cheap_path_ratio"].get<double>();
  }
  if (j.contains("summarize_excluded")) {
    if (!j["summarize_excluded"].is_boolean()) {
      return ConfigResult::err(type_error("summarize_excluded", "a boolean"));
    }
    base.summarize_excluded = j["summarize_excluded"].get<bool>();
  }
  if (j.contains("cache_path")) {
    const auto& value = j["cache_path"];
    if (value.is_null()) {
      base.cache_path.reset();
    } else if (value.is_string()) {
      base.cache_path = value.get<std::string>();
    } else {
      return ConfigResult::err(type_error("cache_path", "a string or null"));
    }
  }
  if (j.contains("cache_ttl_seconds")) {
    if (!j["cache_ttl_seconds"].is_number_integer()) {
      return ConfigResult::err(type_error("cache_ttl_seconds", "an integer"));
    }
    base.cache_ttl_seconds = j["cache_ttl_seconds"].get<std::int64_t>();
  }

  return ConfigResult::ok(std::move(base));
}

ConfigResult load_config_file(const std::string& path, PreprocessConfig base) {
  std::ifstream in(path);
  if (!in) {
    return ConfigResult::err("config: cannot open " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  const auto j = nlohmann::json::parse(buffer.str(), nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    return ConfigResult::err("config: invalid JSON in " + path);
  }
  return apply_json(j, std::move(base));
}

ConfigResult apply_env_overrides(PreprocessConfig config, const EnvLookup& lookup) {
  if (const auto value = lookup(kEnvTokenLimit)) {
    const auto parsed = parse_integer<int>(*value);
    if (!parsed.has_value()) {
      return ConfigResult::err(std::string{kEnvTokenLimit} + " is not an integer: " + *value);
    }
    config.token_limit = *parsed;
  }
  if (const auto value = lookup(kEnvModel)) {
    config.model = *value;
  }
  if (const auto value = lookup(kEnvMaxWorkers)) {
    const auto parsed = parse_integer<int>(*value);
    if (!parsed.has_value()) {
      return ConfigResult::err(std::string{kEnvMaxWorkers} + " is not an integer: " + *value);
    }
    config.max_workers = *parsed;
  }
  if (const auto value = lookup(kEnvCachePath)) {
    if (value->empty()) {
      config.cache_path.reset();
    } else {
      config.cache_path = *value;
    }
  }
  if (const auto value = lookup(kEnvCacheTtl)) {
    const auto parsed = parse_integer<std::int64_t>(*value);
    if (!parsed.has_value()) {
      return ConfigResult::err(std::string{kEnvCacheTtl} + " is not an integer: " + *value);
    }
    config.cache_ttl_seconds = *parsed;
  }
  return ConfigResult::ok(std::move(config));
}

std::string validate_config(const PreprocessConfig& config) {
  if (config.token_limit <= 0) {
    return "token_limit must be positive";
  }
  if (config.model.empty()) {
    return "model must not be empty";
  }
  if (config.max_workers < 1) {
    return "max_workers must be at least 1";
  }
  if (config.include_all_threshold < 0) {
    return "include_all_threshold must not be negative";
  }
  if (!(config.cheap_path_ratio > 0.0 && config.cheap_path_ratio <= 1.0)) {
    return "cheap_path_ratio must be in (0, 1]";
  }
  if (config.cache_ttl_seconds < 0) {
    return "cache_ttl_seconds must not be negative";
  }
  if (config.cache_path.has_value() && config.cache_path->empty()) {
    return "cache_path must not be empty when set";
  }
  return "";
}

preprocess::PreprocessOptions to_preprocess_options(const PreprocessConfig& config) {
  preprocess::PreprocessOptions options;
  options.model = config.model;
  options.max_workers = static_cast<std::size_t>(config.max_workers);
  options.include_all_threshold = config.include_all_threshold;
  options.cheap_path_ratio = config.cheap_path_ratio;
  options.summarize_excluded = config.summarize_excluded;
  return options;
}

std::string config_to_log_string(const PreprocessConfig& config) {
  std::ostringstream out;
  out << "token_limit=" << config.token_limit << " model=" << config.model
      << " max_workers=" << config.max_workers
      << " include_all_threshold=" << config.include_all_threshold
      << " cheap_path_ratio=" << config.cheap_path_ratio
      << " summarize_excluded=" << (config.summarize_excluded ? "true" : "false")
      << " cache=" << config.cache_path.value_or("off")
      << " cache_ttl_seconds=" << config.cache_ttl_seconds;
  return out.str();
}

}  // namespace diffbudget::config

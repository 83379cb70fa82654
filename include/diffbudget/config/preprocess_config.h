#pragma once

#include "diffbudget/core/result.h"
#include "diffbudget/preprocess/preprocessor.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace diffbudget::config {

// PreprocessConfig holds every tunable of a preprocessing run.
// Every field has an explicit default; optional fields mean "not configured".
struct PreprocessConfig {
  int token_limit{preprocess::kDefaultTokenLimit};   // NOLINT(readability-identifier-naming)
  std::string model{preprocess::kDefaultModel};      // NOLINT(readability-identifier-naming)
  int max_workers{4};                                // NOLINT(readability-identifier-naming)
  int include_all_threshold{1000};                   // NOLINT(readability-identifier-naming)
  double cheap_path_ratio{0.8};                      // NOLINT(readability-identifier-naming)
  bool summarize_excluded{false};                    // NOLINT(readability-identifier-naming)
  std::optional<std::string> cache_path;             // NOLINT(readability-identifier-naming)
  std::int64_t cache_ttl_seconds{24 * 60 * 60};      // NOLINT(readability-identifier-naming)
};

// Environment variable names, highest-precedence non-CLI source.
inline constexpr const char* kEnvTokenLimit = "DIFFBUDGET_TOKEN_LIMIT";
inline constexpr const char* kEnvModel = "DIFFBUDGET_MODEL";
inline constexpr const char* kEnvMaxWorkers = "DIFFBUDGET_MAX_WORKERS";
inline constexpr const char* kEnvCachePath = "DIFFBUDGET_CACHE_PATH";
inline constexpr const char* kEnvCacheTtl = "DIFFBUDGET_CACHE_TTL";

// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// EnvLookup backed by the process environment.
[[nodiscard]] EnvLookup process_environment();

// Overlay the keys present in `j` onto `base`. Unknown keys are ignored; a known key with the
// wrong JSON type is an error naming the key.
[[nodiscard]] core::Result<PreprocessConfig, std::string> apply_json(const nlohmann::json& j,
                                                                     PreprocessConfig base);

// Read and apply a JSON config file.
[[nodiscard]] core::Result<PreprocessConfig, std::string> load_config_file(const std::string& path,
                                                                           PreprocessConfig base);

// Overlay DIFFBUDGET_* variables. Unparsable numbers are an error naming the variable.
[[nodiscard]] core::Result<PreprocessConfig, std::string> apply_env_overrides(
    PreprocessConfig config, const EnvLookup& lookup);

// Returns "" when valid, otherwise the first violated precondition.
[[nodiscard]] std::string validate_config(const PreprocessConfig& config);

[[nodiscard]] preprocess::PreprocessOptions to_preprocess_options(const PreprocessConfig& config);

// Deterministic one-line summary for --verbose startup diagnostics.
[[nodiscard]] std::string config_to_log_string(const PreprocessConfig& config);

}  // namespace diffbudget::config

#include "preprocess.h"

#include "diffbudget/config/preprocess_config.h"
#include "diffbudget/core/clock.h"
#include "diffbudget/storage/sqlite/sqlite_db.h"
#include "diffbudget/storage/sqlite/sqlite_preprocess_cache.h"

#include "cli_common.h"
#include "preprocess_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

// Flags are recorded as overrides and layered last: defaults, config file, environment, flags.
struct PreprocessCliConfig {
  InputOptions input;
  std::optional<std::string> config_path;
  std::optional<int> token_limit;
  std::optional<std::string> model;
  std::optional<std::string> cache_path;
  std::optional<int> max_workers;
  std::string tokenizer{"encoding"};
  bool summarize_excluded{false};
  bool json{false};
  bool verbose{false};
};

std::vector<diffbudget::apps::Option<PreprocessCliConfig>> preprocess_options() {
  std::vector<diffbudget::apps::Option<PreprocessCliConfig>> options =
      input_options<PreprocessCliConfig>();
  const std::vector<diffbudget::apps::Option<PreprocessCliConfig>> own = {
      {"--token-limit", true, "Token budget for the output",
       [](PreprocessCliConfig& c, const std::string& v) {
         int parsed = 0;
         if (!diffbudget::apps::parse_int_flag("--token-limit", v, parsed)) {
           return false;
         }
         c.token_limit = parsed;
         return true;
       }},
      {"--model", true, "Model name used to pick the tokenizer encoding",
       [](PreprocessCliConfig& c, const std::string& v) {
         c.model = v;
         return true;
       }},
      {"--max-workers", true, "Maximum classification worker threads",
       [](PreprocessCliConfig& c, const std::string& v) {
         int parsed = 0;
         if (!diffbudget::apps::parse_int_flag("--max-workers", v, parsed)) {
           return false;
         }
         c.max_workers = parsed;
         return true;
       }},
      {"--config", true, "JSON config file",
       [](PreprocessCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--cache", true, "SQLite result cache file",
       [](PreprocessCliConfig& c, const std::string& v) {
         c.cache_path = v;
         return true;
       }},
      {"--tokenizer", true, "Token counter (encoding|heuristic)",
       [](PreprocessCliConfig& c, const std::string& v) {
         if (v == "encoding" || v == "heuristic") {
           c.tokenizer = v;
           return true;
         }
         std::cerr << "Invalid --tokenizer: " << v << " (valid: encoding, heuristic)\n";
         return false;
       }},
      {"--summaries", false, "Emit header stubs for filtered-out sections",
       [](PreprocessCliConfig& c, const std::string& /*v*/) {
         c.summarize_excluded = true;
         return true;
       }},
      {"--json", false, "Print a JSON report instead of the processed diff",
       [](PreprocessCliConfig& c, const std::string& /*v*/) {
         c.json = true;
         return true;
       }},
      {"--verbose", false, "Report exclusions and the chosen path on stderr",
       [](PreprocessCliConfig& c, const std::string& /*v*/) {
         c.verbose = true;
         return true;
       }},
  };
  options.insert(options.end(), own.begin(), own.end());
  return options;
}

// Layers config file and environment under the CLI flags. Prints the failure and returns
// nullopt on any error.
std::optional<diffbudget::config::PreprocessConfig> resolve_config(
    const PreprocessCliConfig& cli) {
  diffbudget::config::PreprocessConfig config;

  if (cli.config_path.has_value()) {
    auto loaded = diffbudget::config::load_config_file(cli.config_path.value(), config);
    if (!loaded.has_value()) {
      std::cerr << "Failed to load config: " << loaded.error() << "\n";
      return std::nullopt;
    }
    config = loaded.value();
  }

  auto with_env =
      diffbudget::config::apply_env_overrides(config, diffbudget::config::process_environment());
  if (!with_env.has_value()) {
    std::cerr << "Invalid environment: " << with_env.error() << "\n";
    return std::nullopt;
  }
  config = with_env.value();

  if (cli.token_limit.has_value()) {
    config.token_limit = cli.token_limit.value();
  }
  if (cli.model.has_value()) {
    config.model = cli.model.value();
  }
  if (cli.max_workers.has_value()) {
    config.max_workers = cli.max_workers.value();
  }
  if (cli.cache_path.has_value()) {
    config.cache_path = cli.cache_path;
  }
  if (cli.summarize_excluded) {
    config.summarize_excluded = true;
  }

  const std::string problem = diffbudget::config::validate_config(config);
  if (!problem.empty()) {
    std::cerr << "Invalid configuration: " << problem << "\n";
    return std::nullopt;
  }
  return config;
}

}  // namespace

int cmd_preprocess(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = preprocess_options();
  const auto parsed = diffbudget::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || !parsed.positionals.empty()) {
    if (!parsed.positionals.empty()) {
      std::cerr << "Unexpected argument: " << parsed.positionals.front() << "\n";
    }
    std::cerr << "Usage: diffbudget_cli preprocess [options] < diff\n"
              << diffbudget::apps::format_options(options);
    return 1;
  }
  const PreprocessCliConfig& cli = parsed.config;

  const auto config = resolve_config(cli);
  if (!config.has_value()) {
    return 1;
  }
  if (cli.verbose) {
    std::cerr << "Config: " << diffbudget::config::config_to_log_string(config.value()) << "\n";
  }

  const auto counter = make_token_counter(cli.tokenizer);
  if (counter == nullptr) {
    std::cerr << "Unknown tokenizer: " << cli.tokenizer << "\n";
    return 1;
  }

  auto diff = read_diff_input(cli.input);
  if (!diff.has_value()) {
    std::cerr << diff.error() << "\n";
    return 1;
  }

  diffbudget::core::SystemClock clock;

  if (config->cache_path.has_value()) {
    auto db_result = diffbudget::storage::sqlite::SqliteDb::open(config->cache_path.value());
    if (!db_result.has_value()) {
      std::cerr << "Failed to open cache database: " << db_result.error() << "\n";
      return 1;
    }

    auto db = db_result.value();
    auto schema_result = db->ensure_schema_v2();
    if (!schema_result.has_value()) {
      std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
      return 1;
    }

    diffbudget::storage::sqlite::SqlitePreprocessCache cache(db, clock,
                                                             config->cache_ttl_seconds);
    return execute_preprocess(diff.value(), config.value(), *counter, &cache, clock, cli.json,
                              cli.verbose);
  }

  return execute_preprocess(diff.value(), config.value(), *counter, nullptr, clock, cli.json,
                            cli.verbose);
}

#pragma once

#include <charconv>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace diffbudget::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
// handler returns false when the value is invalid; it reports the reason itself.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParseOutcome is the populated config plus everything that was not a known flag.
// ok is false when any flag was unknown, lacked its value, or was rejected by its handler.
template <typename Config>
struct ParseOutcome {
  Config config;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // NOLINT(readability-identifier-naming)
  bool ok{true};                         // NOLINT(readability-identifier-naming)
};

// parse_options walks argv[start..argc-1] and dispatches each recognised flag to its handler.
// Usage problems are reported to stderr and recorded in ParseOutcome::ok; parsing continues so
// that every problem is reported in one run.
template <typename Config>
ParseOutcome<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                   const std::vector<Option<Config>>& options, int start = 2,
                                   Config default_config = {}) {
  ParseOutcome<Config> outcome{std::move(default_config), {}, true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (arg.size() > 1 && arg[0] == '-') {
        std::cerr << "Unknown option: " << arg << "\n";
        outcome.ok = false;
      } else {
        outcome.positionals.push_back(std::move(arg));
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        std::cerr << "Option " << arg << " requires a value\n";
        outcome.ok = false;
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
    if (!opt->handler(outcome.config, value)) {
      outcome.ok = false;
    }
  }

  return outcome;
}

// format_options renders one "  --flag <value>  description" line per option.
template <typename Config>
std::string format_options(const std::vector<Option<Config>>& options) {
  std::ostringstream out;
  for (const auto& opt : options) {
    std::string flag = opt.name + (opt.requires_value ? " <value>" : "");
    out << "  " << flag;
    for (std::size_t pad = flag.size(); pad < 24; ++pad) {
      out << ' ';
    }
    out << "  " << opt.description << "\n";
  }
  return out.str();
}

// parse_int_flag parses a decimal flag value, reporting failures as "Invalid <flag>: <value>".
inline bool parse_int_flag(const std::string& flag, const std::string& value, int& out) {
  int parsed = 0;
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), last, parsed);
  if (value.empty() || ec != std::errc{} || ptr != last) {
    std::cerr << "Invalid " << flag << ": " << value << " (expected an integer)\n";
    return false;
  }
  out = parsed;
  return true;
}

}  // namespace diffbudget::apps

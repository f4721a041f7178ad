#ifndef CASCADE_HELPERS_ARGS_HPP
#define CASCADE_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Fixed-arity command line parsing for the cascade tools.
 *
 * Flags are declared up front in an ArgMap keyed by a small integer. A matched
 * flag consumes exactly `nargs` following tokens. Unknown tokens are ignored.
 *
 * @note Cold-path only. Allocates.
 */

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <fmt/core.h>

namespace cascade {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Declaration of one accepted flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--port"
  std::uint8_t nargs;      ///< Values consumed after the flag
  bool required;           ///< Parse fails when absent
  std::string_view desc{}; ///< Help text
};

/// Key -> flag declaration.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Key -> values captured for that flag (views into the caller's tokens).
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Collect argv[1..argc) as string views.
 * @note Views reference argv and live as long as it does.
 */
[[nodiscard]] inline std::vector<std::string_view> collectArgs(int argc, char* argv[]) {
  std::vector<std::string_view> out;
  if (argc > 1) {
    out.reserve(static_cast<std::size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) {
      out.emplace_back(argv[i]);
    }
  }
  return out;
}

/**
 * @brief Parse tokens against a flag map.
 *
 * An empty token list is valid and yields an empty result; required flags are
 * still enforced.
 *
 * @param args  Tokens (must outlive pargs).
 * @param map   Accepted flags.
 * @param pargs Output; entries for matched keys are overwritten.
 * @param error Receives a message on failure (optional).
 * @return true on success.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, std::string* error = nullptr) {
  std::unordered_map<std::string_view, std::uint8_t> byFlag;
  byFlag.reserve(map.size());
  for (const auto& [KEY, DEF] : map) {
    byFlag.emplace(DEF.flag, KEY);
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto IT = byFlag.find(args[i]);
    if (IT == byFlag.end()) {
      continue;
    }

    const ArgDef& DEF = map.at(IT->second);
    if (i + DEF.nargs >= args.size()) {
      if (error != nullptr) {
        *error = fmt::format("flag '{}' expects {} value(s)", DEF.flag, DEF.nargs);
      }
      return false;
    }

    std::vector<std::string_view>& values = pargs[IT->second];
    values.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
                  args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));
    i += DEF.nargs;
  }

  for (const auto& [KEY, DEF] : map) {
    if (DEF.required && pargs.count(KEY) == 0) {
      if (error != nullptr) {
        *error = fmt::format("missing required flag '{}'", DEF.flag);
      }
      return false;
    }
  }
  return true;
}

/// True when the flag for key was given.
[[nodiscard]] inline bool has(const ParsedArgs& pargs, std::uint8_t key) noexcept {
  return pargs.count(key) != 0;
}

/// First value captured for key, if any.
[[nodiscard]] inline std::optional<std::string_view> value(const ParsedArgs& pargs,
                                                           std::uint8_t key) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::nullopt;
  }
  return IT->second.front();
}

/**
 * @brief Print generated usage text to stdout.
 * @note Flags are listed alphabetically.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }

  std::vector<const ArgDef*> defs;
  defs.reserve(map.size());
  for (const auto& KV : map) {
    defs.push_back(&KV.second);
  }
  std::sort(defs.begin(), defs.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  fmt::print("Options:\n");
  for (const ArgDef* def : defs) {
    const std::string LHS = def->nargs == 0 ? std::string(def->flag)
                                            : fmt::format("{} <value>", def->flag);
    fmt::print("  {:<22}  {}{}\n", LHS, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace cascade

#endif // CASCADE_HELPERS_ARGS_HPP

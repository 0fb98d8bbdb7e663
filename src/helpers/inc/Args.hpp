#ifndef BLKREF_HELPERS_ARGS_HPP
#define BLKREF_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Fixed-arity command-line flag parsing for the blkref tools.
 * @note Cold path: allocates.
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace blkref {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--device"
  std::uint8_t nargs;      ///< Number of values consumed after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Help text (optional)
};

/// Map from key to flag definition. Ordered so help output is stable.
using ArgMap = std::map<std::uint8_t, ArgDef>;

/// Map from key to the values that followed the flag.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse arguments according to a flag map.
 *
 * A matched flag consumes the next nargs tokens literally. A repeated flag
 * overwrites its earlier values. Any other token is rejected.
 *
 * @param args  Argument list (views must outlive pargs).
 * @param map   Accepted flags.
 * @param pargs Output values per key.
 * @param error Receives a message on failure.
 * @return true on success.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, std::string& error) {
  std::unordered_map<std::string_view, std::pair<std::uint8_t, const ArgDef*>> byFlag;
  byFlag.reserve(map.size());
  for (const auto& [KEY, DEF] : map) {
    byFlag.emplace(DEF.flag, std::make_pair(KEY, &DEF));
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view TOK = args[i];
    const auto IT = byFlag.find(TOK);
    if (IT == byFlag.end()) {
      error = fmt::format("Unexpected argument '{}'", TOK);
      return false;
    }

    const std::uint8_t KEY = IT->second.first;
    const ArgDef& DEF = *IT->second.second;
    if (i + DEF.nargs >= args.size()) {
      error = fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs);
      return false;
    }

    std::vector<std::string_view>& values = pargs[KEY];
    values.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
                  args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));
    i += DEF.nargs;
  }

  for (const auto& [KEY, DEF] : map) {
    if (DEF.required && pargs.count(KEY) == 0) {
      error = fmt::format("Missing required flag '{}'", DEF.flag);
      return false;
    }
  }
  return true;
}

/// @brief True if the flag for key was given.
[[nodiscard]] inline bool hasFlag(const ParsedArgs& pargs, std::uint8_t key) {
  return pargs.count(key) != 0;
}

/// @brief Value at index of the flag for key, if given.
[[nodiscard]] inline std::optional<std::string_view> value(const ParsedArgs& pargs,
                                                           std::uint8_t key,
                                                           std::size_t index = 0) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || index >= IT->second.size()) {
    return std::nullopt;
  }
  return IT->second[index];
}

/**
 * @brief Print usage information generated from the flag map.
 * @param progName    Program name (typically argv[0]).
 * @param description One-line tool description.
 * @param map         Flags to document.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<std::pair<std::string, const ArgDef*>> rows;
  rows.reserve(map.size());
  std::size_t width = 16;
  for (const auto& [KEY, DEF] : map) {
    std::string left(DEF.flag);
    for (std::uint8_t k = 0; k < DEF.nargs; ++k) {
      left += " <value>";
    }
    width = std::max(width, left.size());
    rows.emplace_back(std::move(left), &DEF);
  }
  width = std::min<std::size_t>(width, 36);

  for (const auto& [LEFT, DEF] : rows) {
    fmt::print("  {:<{}}  {}{}\n", LEFT, width, DEF->desc, DEF->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace blkref

#endif // BLKREF_HELPERS_ARGS_HPP

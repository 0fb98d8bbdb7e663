/**
 * @file AliasPrioritizer.cpp
 * @brief Alias classification and selection.
 */

#include "src/storage/inc/AliasPrioritizer.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm>

namespace blkref {

namespace storage {

using blkref::helpers::strings::naturalCompare;

AliasCandidate AliasCandidate::from(std::string_view name) noexcept {
  return AliasCandidate{name, storage::classRank(name)};
}

int classRank(std::string_view name) noexcept {
  if (name.empty()) {
    return OTHER_ALIAS_RANK;
  }
  switch (name.front()) {
  case 'a':
    return 0;
  case 'w':
    return 1;
  case 's':
    return 2;
  default:
    return OTHER_ALIAS_RANK;
  }
}

bool aliasLess(std::string_view a, std::string_view b) noexcept {
  const int RANK_A = classRank(a);
  const int RANK_B = classRank(b);
  if (RANK_A != RANK_B) {
    return RANK_A < RANK_B;
  }
  return naturalCompare(a, b) < 0;
}

namespace {

std::string joinAlias(std::string_view dir, std::string_view name) {
  std::string path(dir);
  path.push_back('/');
  path += name;
  return path;
}

} // namespace

std::optional<std::string> selectBest(const std::vector<std::string>& names,
                                      std::string_view dir) {
  std::optional<AliasCandidate> best;
  for (const std::string& NAME : names) {
    if (NAME.empty()) {
      continue;
    }
    const AliasCandidate CAND = AliasCandidate::from(NAME);
    if (!best || CAND.classRank < best->classRank ||
        (CAND.classRank == best->classRank && naturalCompare(CAND.name, best->name) < 0)) {
      best = CAND;
    }
  }

  if (!best) {
    return std::nullopt;
  }
  return joinAlias(dir, best->name);
}

std::optional<std::string> selectFirstNatural(const std::vector<std::string>& names,
                                              std::string_view dir) {
  const std::string* first = nullptr;
  for (const std::string& NAME : names) {
    if (NAME.empty()) {
      continue;
    }
    if (first == nullptr || naturalCompare(NAME, *first) < 0) {
      first = &NAME;
    }
  }

  if (first == nullptr) {
    return std::nullopt;
  }
  return joinAlias(dir, *first);
}

std::vector<std::string> orderByPriority(std::vector<std::string> names) {
  std::sort(names.begin(), names.end(),
            [](const std::string& a, const std::string& b) { return aliasLess(a, b); });
  return names;
}

} // namespace storage

} // namespace blkref

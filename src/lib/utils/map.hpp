#pragma once

#include <map>
#include <vector>

namespace stratus {

// Returns the keys of @param before that are absent from @param after.
template <typename K, typename V>
std::vector<K> RemovedMapKeys(const std::map<K, V>& before, const std::map<K, V>& after) {
  std::vector<K> removed_keys;

  for (const auto& entry : before) {
    if (after.find(entry.first) == after.cend()) {
      removed_keys.emplace_back(entry.first);
    }
  }

  return removed_keys;
}

}  // namespace stratus

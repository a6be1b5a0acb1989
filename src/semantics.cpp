#include "semantics.h"
#include <string>
#include <unordered_set>

namespace tp {

namespace {
  const std::unordered_set<std::string>& outdoor_categories() {
    static const std::unordered_set<std::string> k{"outdoor", "beach", "park", "garden"};
    return k;
  }
  const std::unordered_set<std::string>& indoor_categories() {
    static const std::unordered_set<std::string> k{"indoor", "museum", "shopping", "temple"};
    return k;
  }
} // namespace

bool is_outdoor(const Spot& s) { return outdoor_categories().count(s.category) > 0; }

bool is_indoor(const Spot& s) { return indoor_categories().count(s.category) > 0; }

} // namespace tp

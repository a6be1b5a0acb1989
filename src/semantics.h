// semantics.h
#pragma once
#include "types.h"

namespace tp {

// Two fixed, disjoint category sets. Unknown categories are neither.
bool is_outdoor(const Spot& s);
bool is_indoor(const Spot& s);

} // namespace tp

// validation.h
#pragma once
#include <string>
#include <vector>
#include "types.h"

namespace tp {

// Hard errors throw std::runtime_error; soft warnings go to std::cerr.
void validate_spots(const std::vector<Spot>& spots);

// ---- Field checks (throw on the first offending spot) ----
void validate_spot_fields(const std::vector<Spot>& spots);
void validate_unique_identity(const std::vector<Spot>& spots);

// ---- Soft warnings; return the number of warnings printed ----
int warn_shared_coordinates(const std::vector<Spot>& spots);
int warn_suspicious_names(const std::vector<Spot>& spots);

// Every input spot appears in exactly one day, exactly once.
bool is_partition_of(const Itinerary& it, const std::vector<Spot>& spots);

} // namespace tp

#include "validation.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <tuple>

namespace tp
{

    inline bool is_blank(const std::string &s)
    {
        return std::all_of(s.begin(), s.end(), [](unsigned char c)
                           { return std::isspace(c); });
    }

    [[noreturn]] void fail(const std::string &msg)
    {
        throw std::runtime_error(msg);
    }

    using SpotKey = std::tuple<std::string, double, double>;

    static SpotKey key_of(const Spot &s)
    {
        return SpotKey{s.name, s.lat, s.lon};
    }

    void validate_spots(const std::vector<Spot> &spots)
    {
        // 1) Per-spot fields
        validate_spot_fields(spots);

        // 2) Identity must be unique for the partition to be well defined
        validate_unique_identity(spots);

        // 3) Soft data-quality warnings
        warn_shared_coordinates(spots);
        warn_suspicious_names(spots);
    }

    void validate_spot_fields(const std::vector<Spot> &spots)
    {
        for (std::size_t i = 0; i < spots.size(); ++i)
        {
            const Spot &s = spots[i];

            if (s.name.empty() || is_blank(s.name))
                fail("Spot " + std::to_string(i) + " missing required field: name");
            if (!std::isfinite(s.lat) || !std::isfinite(s.lon))
                fail("Spot " + s.name + " has non-finite coordinates.");
            if (s.lat < -90.0 || s.lat > 90.0 || s.lon < -180.0 || s.lon > 180.0)
            {
                std::ostringstream oss;
                oss << "Spot " << s.name << " has invalid coordinates (" << s.lat << ", " << s.lon << ").";
                fail(oss.str());
            }
            if (s.category.empty())
                fail("Spot " + s.name + " missing required field: category");
            if (s.duration_minutes && *s.duration_minutes <= 0)
                fail("Spot " + s.name + " has invalid duration_minutes (<=0).");
            if (s.rating && (!std::isfinite(*s.rating) || *s.rating < 1.0 || *s.rating > 5.0))
            {
                std::ostringstream oss;
                oss << "Spot " << s.name << " has rating " << *s.rating << " outside [1, 5].";
                fail(oss.str());
            }
        }
    }

    void validate_unique_identity(const std::vector<Spot> &spots)
    {
        std::map<SpotKey, std::size_t> seen;
        for (std::size_t i = 0; i < spots.size(); ++i)
        {
            auto [it, inserted] = seen.emplace(key_of(spots[i]), i);
            if (!inserted)
                fail("Duplicate spot '" + spots[i].name + "' at indices " +
                     std::to_string(it->second) + " and " + std::to_string(i) + ".");
        }
    }

    int warn_shared_coordinates(const std::vector<Spot> &spots)
    {
        // rounded to 4 decimals, about 11 m
        std::map<std::pair<long long, long long>, std::vector<const Spot *>> by_coord;
        for (const auto &s : spots)
            by_coord[{std::llround(s.lat * 1e4), std::llround(s.lon * 1e4)}].push_back(&s);

        int warnings = 0;
        for (const auto &[coord, group] : by_coord)
        {
            if (group.size() < 2)
                continue;
            ++warnings;
            std::cerr << "⚠️ Coordinates (" << std::fixed << std::setprecision(4)
                      << group.front()->lat << ", " << group.front()->lon << ") shared by "
                      << group.size() << " spots: " << group[0]->name << " and " << group[1]->name << "\n";
        }
        return warnings;
    }

    int warn_suspicious_names(const std::vector<Spot> &spots)
    {
        int warnings = 0;
        for (const auto &s : spots)
        {
            if (s.name.find('"') != std::string::npos || s.name.find('\\') != std::string::npos)
            {
                ++warnings;
                std::cerr << "⚠️ Suspicious spot name (quotes or escapes): " << s.name << "\n";
            }
        }
        return warnings;
    }

    bool is_partition_of(const Itinerary &it, const std::vector<Spot> &spots)
    {
        std::map<SpotKey, int> need;
        for (const auto &s : spots)
            need[key_of(s)]++;

        std::size_t placed = 0;
        for (const auto &day : it.days)
        {
            for (const auto &s : day.spots)
            {
                auto f = need.find(key_of(s));
                if (f == need.end() || f->second == 0)
                    return false; // unknown or duplicated
                f->second--;
                ++placed;
            }
        }
        return placed == spots.size();
    }

} // namespace tp

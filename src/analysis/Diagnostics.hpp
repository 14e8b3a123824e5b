#ifndef DIAGNOSTICS_HPP
#define DIAGNOSTICS_HPP
#include "core/FilterReport.hpp"
#include <string>
#include <vector>

struct Settings;

/**
 * @brief Turns the final filter report into the warning and info lines shown to the user.
 * Nothing here changes the matrix.
 */
namespace Diagnostics {
    const double BALANCE_GOAL = 0.5;
    const double BALANCE_TOLERANCE = 0.01;

    bool isUnbalanced(const FilterReport& report);
    std::vector<std::string> warnings(const FilterReport& report, const Settings& settings);
    std::string info(const FilterReport& report, const Settings& settings, int numSites);
}

#endif

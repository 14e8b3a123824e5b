#ifndef SPECIES_FILTER_HPP
#define SPECIES_FILTER_HPP
#include "core/Alignment.hpp"
#include "core/FilterReport.hpp"
#include <string>
#include <vector>

class SpeciesTable;

/**
 * @brief Drops every column at which at least one species has nothing but gaps.
 * SNAPP can't use such sites.
 */
class SpeciesFilter {
    public:
        SpeciesFilter(void)=delete;
        SpeciesFilter(const SpeciesTable& t);

        Alignment operator()(const Alignment& matrix, FilterReport& report) const;
    private:
        std::vector<std::vector<int>> groupTaxa(const Alignment& matrix) const; // Row indices of each species

        const SpeciesTable& table;
};

#endif

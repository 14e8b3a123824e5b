#include "SpeciesFilter.hpp"
#include "core/Nucleotides.hpp"
#include "core/SpeciesTable.hpp"
#include <boost/dynamic_bitset.hpp>

SpeciesFilter::SpeciesFilter(const SpeciesTable& t) : table(t) {}

std::vector<std::vector<int>> SpeciesFilter::groupTaxa(const Alignment& matrix) const {
    const auto& speciesNames = table.getSpeciesNames();
    std::vector<std::vector<int>> groups(speciesNames.size());

    const auto& taxaNames = matrix.getTaxaNames();
    for(int t = 0; t < matrix.getNumTaxa(); t++){
        const std::string& species = table.getSpecies(taxaNames[t]);
        for(size_t g = 0; g < speciesNames.size(); g++){
            if(speciesNames[g] == species){
                groups[g].push_back(t);
                break;
            }
        }
    }

    return groups;
}

Alignment SpeciesFilter::operator()(const Alignment& matrix, FilterReport& report) const {
    std::vector<std::vector<int>> groups = groupTaxa(matrix);
    boost::dynamic_bitset<> keep(matrix.getNumChar());

    for(int s = 0; s < matrix.getNumChar(); s++){
        bool speciesMissing = false;
        for(const auto& group : groups){
            // A species without any specimen counts as missing
            bool allGaps = true;
            for(int t : group){
                if(matrix(t, s) != Nucleotides::GAP){
                    allGaps = false;
                    break;
                }
            }

            if(allGaps){
                speciesMissing = true;
                break;
            }
        }

        if(speciesMissing)
            report.exclude(SPECIES_INCOMPLETE);
        else
            keep.set(s);
    }

    return matrix.keepColumns(keep);
}

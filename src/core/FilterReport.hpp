#ifndef FILTER_REPORT_HPP
#define FILTER_REPORT_HPP
#include <array>

/**
 * @brief The reasons a site can be left out of the SNP matrix
 */
enum ExclusionType{
    MISSING = 0,
    MONOMORPHIC = 1,
    TRIALLELIC = 2,
    TETRAALLELIC = 3,
    INDEL = 4,
    EXCLUDED_TRANSITION = 5,
    EXCLUDED_TRANSVERSION = 6,
    SPECIES_INCOMPLETE = 7,
    OVER_CAP = 8,
    NUM_EXCLUSION_TYPES = 9
};

/**
 * @brief Bookkeeping shared by every stage of the pipeline. Counts only ever go up.
 */
struct FilterReport {
    void exclude(ExclusionType t, int n = 1){ excluded[t] += n; }
    int getExcluded(ExclusionType t) const { return excluded[t]; }

    std::array<int, NUM_EXCLUSION_TYPES> excluded{};
    int halfCalledSites = 0;   // VCF records with at least one half missing genotype
    int recoderSites = 0;      // Columns that entered the site recoder
    long numZeroStates = 0;    // Count of '0' over retained binary columns
    long numTwoStates = 0;     // Count of '2' over retained binary columns
    bool balanceChecked = false;
    bool capExceedsSites = false;
};

#endif

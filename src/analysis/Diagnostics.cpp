#include "Diagnostics.hpp"
#include "core/Settings.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace {

    std::string plural(int n, const std::string& word){
        return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
    }

    void addExclusion(std::vector<std::string>& lines, int n, const std::string& kind, const std::string& detail = ""){
        if(n <= 0)
            return;

        std::string what = kind.empty() ? plural(n, "site") : std::to_string(n) + " " + kind + (n == 1 ? " site" : " sites");
        lines.push_back("Excluded " + what + detail + ".");
    }
}

/**
 * @brief Check if the '0' and '2' states of a binary input are roughly equally frequent
 */
bool Diagnostics::isUnbalanced(const FilterReport& report){
    long total = report.numZeroStates + report.numTwoStates;
    if(!report.balanceChecked || total == 0)
        return false;

    double proportion = static_cast<double>(report.numZeroStates) / total;
    return std::fabs(proportion - BALANCE_GOAL) > BALANCE_TOLERANCE;
}

std::vector<std::string> Diagnostics::warnings(const FilterReport& report, const Settings& settings){
    std::vector<std::string> lines;

    if(isUnbalanced(report)){
        std::ostringstream tolerance;
        tolerance << std::fixed << std::setprecision(1) << BALANCE_TOLERANCE * 100;
        lines.push_back("The number of '0' and '2' in the data set is expected to be similar, however, they differ by more than " +
                        tolerance.str() + " percent.");
    }

    if(settings.hasCap() && report.capExceedsSites){
        lines.push_back("The maximum number of SNPs has been set to " + std::to_string(settings.maxSnps) + 
                        ", which is not smaller than the number of bi-allelic SNPs with sufficient information for SNAPP.");
    }

    if(report.halfCalledSites > 0){
        lines.push_back("Found " + plural(report.halfCalledSites, "site") + " with genotypes that were half missing. These genotypes were ignored.");
    }

    addExclusion(lines, report.getExcluded(SPECIES_INCOMPLETE), "", " with only missing data in one or more species");
    addExclusion(lines, report.getExcluded(MISSING), "", " with only missing data");
    addExclusion(lines, report.getExcluded(MONOMORPHIC), "monomorphic");
    addExclusion(lines, report.getExcluded(EXCLUDED_TRANSITION), "transition");
    addExclusion(lines, report.getExcluded(EXCLUDED_TRANSVERSION), "transversion");
    addExclusion(lines, report.getExcluded(TRIALLELIC), "tri-allelic");
    addExclusion(lines, report.getExcluded(TETRAALLELIC), "tetra-allelic");
    addExclusion(lines, report.getExcluded(INDEL), "indel");

    return lines;
}

std::string Diagnostics::info(const FilterReport& report, const Settings& settings, int numSites){
    if(settings.hasCap()){
        return "Removed " + std::to_string(report.getExcluded(OVER_CAP)) + " bi-allelic sites due to specified maximum number of " +
               std::to_string(settings.maxSnps) + " sites.";
    }

    switch(settings.getSiteMode()){
        case SiteMode::TRANSVERSIONS_ONLY:
            return "Retained " + std::to_string(numSites) + " bi-allelic transversion sites.";
        case SiteMode::TRANSITIONS_ONLY:
            return "Retained " + std::to_string(numSites) + " bi-allelic transition sites.";
        default:
            return "Retained " + std::to_string(numSites) + " bi-allelic sites.";
    }
}

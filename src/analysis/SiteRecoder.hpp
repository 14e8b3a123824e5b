#ifndef SITE_RECODER_HPP
#define SITE_RECODER_HPP
#include "core/Alignment.hpp"
#include "core/FilterReport.hpp"
#include "core/Settings.hpp"
#include <boost/random/mersenne_twister.hpp>
#include <functional>
#include <string>
#include <vector>

/**
 * @brief Turns every column of an alignment into a column of SNAPP's ternary code or an exclusion.
 * 
 * Binary alignments keep their variable columns verbatim. For nucleotide alignments only
 * bi-allelic columns are kept: one base becomes "0", the other "2", heterozygotes "1" and missing data "-".
 * Which base becomes "0" is decided per column by the polarity chooser.
 */
class SiteRecoder {
    public:
        SiteRecoder(void)=delete;
        SiteRecoder(boost::random::mt19937& rng, SiteMode m=SiteMode::ALL); // rng must outlive the recoder
        SiteRecoder(std::function<bool(void)> chooser, SiteMode m=SiteMode::ALL); // chooser returns true to give "0" to the larger base

        Alignment operator()(const Alignment& aln, SequenceFormat format, FilterReport& report) const;
    private:
        Alignment recodeBinary(const Alignment& aln, FilterReport& report) const;
        Alignment recodeNucleotide(const Alignment& aln, FilterReport& report) const;

        std::function<bool(void)> swapPolarity;
        SiteMode mode;
};

#endif

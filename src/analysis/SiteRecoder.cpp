#include "SiteRecoder.hpp"
#include "core/Msg.hpp"
#include "core/Nucleotides.hpp"
#include <boost/random/uniform_int_distribution.hpp>
#include <set>
#include <utility>

SiteRecoder::SiteRecoder(boost::random::mt19937& rng, SiteMode m) : mode(m) {
    swapPolarity = [&rng](){
        boost::random::uniform_int_distribution<int> coin(0, 1);
        return coin(rng) == 1;
    };
}

SiteRecoder::SiteRecoder(std::function<bool(void)> chooser, SiteMode m) : swapPolarity(std::move(chooser)), mode(m) {}

Alignment SiteRecoder::operator()(const Alignment& aln, SequenceFormat format, FilterReport& report) const {
    report.recoderSites += aln.getNumChar();

    if(format == SequenceFormat::BINARY)
        return recodeBinary(aln, report);
    if(format == SequenceFormat::NUCLEOTIDE)
        return recodeNucleotide(aln, report);

    Msg::error("Cannot recode an alignment with an unknown sequence format!");
}

Alignment SiteRecoder::recodeBinary(const Alignment& aln, FilterReport& report) const {
    int numTaxa = aln.getNumTaxa();
    std::vector<std::string> recoded(numTaxa);

    for(int s = 0; s < aln.getNumChar(); s++){
        std::set<char> states;
        for(int t = 0; t < numTaxa; t++){
            if(Nucleotides::isBinary(aln(t, s)))
                states.insert(aln(t, s));
        }

        if(states.empty()){
            report.exclude(MISSING);
            continue;
        }
        if(states.size() == 1){
            report.exclude(MONOMORPHIC);
            continue;
        }

        for(int t = 0; t < numTaxa; t++){
            char c = aln(t, s);
            recoded[t].push_back(c);
            if(c == '0')
                report.numZeroStates++;
            else if(c == '2')
                report.numTwoStates++;
        }
    }

    report.balanceChecked = true;
    return Alignment(aln.getTaxaNames(), std::move(recoded), SequenceFormat::BINARY);
}

Alignment SiteRecoder::recodeNucleotide(const Alignment& aln, FilterReport& report) const {
    int numTaxa = aln.getNumTaxa();
    std::vector<std::string> recoded(numTaxa);

    for(int s = 0; s < aln.getNumChar(); s++){
        // Collect all bases at this position
        std::set<char> bases;
        for(int t = 0; t < numTaxa; t++){
            char c = aln(t, s);
            if(Nucleotides::isMissing(c))
                continue;

            std::pair<char, char> pair;
            if(!Nucleotides::expand(c, pair)){
                Msg::error("Found unexpected base at position " + std::to_string(s + 1) + ": " + c + "!");
            }
            bases.insert(pair.first);
            bases.insert(pair.second);
        }

        switch(bases.size()){
            case 0:
                report.exclude(MISSING);
                continue;
            case 1:
                report.exclude(MONOMORPHIC);
                continue;
            case 2:
                break;
            case 3:
                report.exclude(TRIALLELIC);
                continue;
            case 4:
                report.exclude(TETRAALLELIC);
                continue;
            default:
                Msg::error("Found unexpected number of alleles at position " + std::to_string(s + 1) + "!");
        }

        char low = *bases.begin();
        char high = *bases.rbegin();
        bool transition = Nucleotides::isTransition(low, high);
        if(!transition && !Nucleotides::isTransversion(low, high)){
            Msg::error("Unexpected combination of unique bases at position " + std::to_string(s + 1) + ": " + low + ", " + high);
        }

        if(mode == SiteMode::TRANSVERSIONS_ONLY && transition){
            report.exclude(EXCLUDED_TRANSITION);
            continue;
        }
        if(mode == SiteMode::TRANSITIONS_ONLY && !transition){
            report.exclude(EXCLUDED_TRANSVERSION);
            continue;
        }

        char zeroBase = low;
        char twoBase = high;
        if(swapPolarity())
            std::swap(zeroBase, twoBase);

        for(int t = 0; t < numTaxa; t++){
            char c = aln(t, s);
            if(c == zeroBase){
                recoded[t].push_back('0');
            }
            else if(c == twoBase){
                recoded[t].push_back('2');
            }
            else if(Nucleotides::isMissing(c)){
                recoded[t].push_back(Nucleotides::GAP);
            }
            else if(Nucleotides::isAmbiguous(c)){
                recoded[t].push_back('1');
            }
            else{
                Msg::error("Found unexpected base at position " + std::to_string(s + 1) + ": " + c + "!");
            }
        }
    }

    return Alignment(aln.getTaxaNames(), std::move(recoded), SequenceFormat::BINARY);
}

#ifndef ALIGNMENT_HPP
#define ALIGNMENT_HPP
#include "Nucleotides.hpp"
#include <boost/dynamic_bitset.hpp>
#include <string>
#include <vector>

/**
 * @brief Holds one row of symbols per specimen. Every row has the same length, which is checked on construction.
 * Used both for the normalized input and for the recoded SNP matrix.
 */
class Alignment {
    public:
        Alignment(void) = delete;
        Alignment(std::vector<std::string> names, std::vector<std::string> rows, SequenceFormat f = SequenceFormat::UNKNOWN);
        char operator()(int t, int s) const {return sequences[t][s];}
        int getNumChar() const {return numChar;}
        int getNumTaxa() const {return numTaxa;}
        SequenceFormat getFormat() const {return format;}
        const std::vector<std::string>& getTaxaNames() const {return taxaNames;}
        const std::string& getSequence(int t) const {return sequences[t];}

        Alignment keepColumns(const boost::dynamic_bitset<>& keep) const; // Returns a copy with only the flagged columns
    private:
        int numChar;
        int numTaxa;
        SequenceFormat format;
        std::vector<std::string> taxaNames;
        std::vector<std::string> sequences;
};

#endif

#include "FormatClassifier.hpp"
#include "core/Alignment.hpp"
#include "core/Msg.hpp"
#include <set>

SequenceFormat FormatClassifier::classify(const Alignment& aln){
    // Alignments built from a vcf already know their format
    if(aln.getFormat() != SequenceFormat::UNKNOWN)
        return aln.getFormat();

    std::set<char> symbols;
    for(int t = 0; t < aln.getNumTaxa(); t++){
        for(char c : aln.getSequence(t)){
            if(!Nucleotides::isMissing(c))
                symbols.insert(c);
        }
    }

    bool isBinary = true;
    bool isNucleotide = true;
    for(char c : symbols){
        if(!Nucleotides::isBinary(c))
            isBinary = false;
        if(!Nucleotides::isNucleotide(c))
            isNucleotide = false;
    }

    if(isBinary)
        return SequenceFormat::BINARY;
    if(isNucleotide)
        return SequenceFormat::NUCLEOTIDE;

    Msg::error("Sequence format could not be recognized as either 'nucleotide' or 'binary'!");
}

#ifndef NUCLEOTIDES_HPP
#define NUCLEOTIDES_HPP
#include <map>
#include <string>
#include <utility>

/**
 * @brief The format of the symbols held by an alignment
 */
enum class SequenceFormat {
    UNKNOWN = 0,
    NUCLEOTIDE = 1,
    BINARY = 2
};

/**
 * @brief Lookup tables for the nucleotide, IUPAC ambiguity, missing and ternary alphabets.
 * Base pairs are always keyed in sorted order so that {A,G} and {G,A} resolve identically.
 */
namespace Nucleotides {

    const char GAP = '-';

    // Ambiguity code -> the unordered pair of bases it stands for
    inline const std::map<char, std::pair<char, char>>& ambiguityBases(){
        static const std::map<char, std::pair<char, char>> table{
            {'R', {'A', 'G'}},
            {'Y', {'C', 'T'}},
            {'S', {'C', 'G'}},
            {'W', {'A', 'T'}},
            {'K', {'G', 'T'}},
            {'M', {'A', 'C'}},
        };
        return table;
    }

    // Sorted base pair -> genotype code (plain base for homozygotes)
    inline const std::map<std::pair<char, char>, char>& genotypeCodes(){
        static const std::map<std::pair<char, char>, char> table{
            {{'A', 'A'}, 'A'},
            {{'A', 'C'}, 'M'},
            {{'A', 'G'}, 'R'},
            {{'A', 'T'}, 'W'},
            {{'C', 'C'}, 'C'},
            {{'C', 'G'}, 'S'},
            {{'C', 'T'}, 'Y'},
            {{'G', 'G'}, 'G'},
            {{'G', 'T'}, 'K'},
            {{'T', 'T'}, 'T'},
        };
        return table;
    }

    // Sorted base pair -> true if the substitution is a transition
    inline const std::map<std::pair<char, char>, bool>& transitionPairs(){
        static const std::map<std::pair<char, char>, bool> table{
            {{'A', 'C'}, false},
            {{'A', 'G'}, true},
            {{'A', 'T'}, false},
            {{'C', 'G'}, false},
            {{'C', 'T'}, true},
            {{'G', 'T'}, false},
        };
        return table;
    }

    inline std::pair<char, char> sortedPair(char a, char b){
        return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
    }

    inline bool isBase(char c){ return c == 'A' || c == 'C' || c == 'G' || c == 'T'; }
    inline bool isAmbiguous(char c){ return ambiguityBases().count(c) > 0; }
    inline bool isMissing(char c){ return c == '-' || c == '?' || c == 'N'; }
    inline bool isBinary(char c){ return c == '0' || c == '1' || c == '2'; }
    inline bool isNucleotide(char c){ return isBase(c) || isAmbiguous(c); }

    /**
     * @brief Resolve two called alleles into a single genotype symbol.
     * @return The genotype code, or '\0' if the pair has no code
     */
    inline char genotypeCode(char a, char b){
        auto it = genotypeCodes().find(sortedPair(a, b));
        return it == genotypeCodes().end() ? '\0' : it->second;
    }

    /**
     * @brief Split a symbol into its constituent bases (a plain base is duplicated).
     * @return false if the symbol is neither a base nor an ambiguity code
     */
    inline bool expand(char c, std::pair<char, char>& bases){
        if(isBase(c)){
            bases = {c, c};
            return true;
        }

        auto it = ambiguityBases().find(c);
        if(it == ambiguityBases().end())
            return false;

        bases = it->second;
        return true;
    }

    inline bool isTransition(char a, char b){
        auto it = transitionPairs().find(sortedPair(a, b));
        return it != transitionPairs().end() && it->second;
    }

    inline bool isTransversion(char a, char b){
        auto it = transitionPairs().find(sortedPair(a, b));
        return it != transitionPairs().end() && !it->second;
    }
}

#endif

#ifndef FORMAT_CLASSIFIER_HPP
#define FORMAT_CLASSIFIER_HPP
#include "core/Nucleotides.hpp"

class Alignment;

/**
 * @brief Decides whether an alignment already holds SNAPP's 0/1/2 code or nucleotides
 */
namespace FormatClassifier {
    SequenceFormat classify(const Alignment& aln); // Exits if the symbols fit neither alphabet
}

#endif

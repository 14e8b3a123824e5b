#ifndef NEXUS_WRITER_HPP
#define NEXUS_WRITER_HPP
#include "Nucleotides.hpp"
#include <iosfwd>
#include <string>

class Alignment;
class SpeciesTable;

/**
 * @brief Writes the recoded matrix as a NEXUS data block that SNAPP can read.
 * Rows are labelled "<specimen>_<species>" and kept in input order.
 */
namespace NexusWriter {
    std::string provenance(SequenceFormat inputFormat, const std::string& inputFile);
    void write(std::ostream& out, const Alignment& matrix, const SpeciesTable& table, const std::string& comment);
    void write(const std::string& path, const Alignment& matrix, const SpeciesTable& table, const std::string& comment);
}

#endif

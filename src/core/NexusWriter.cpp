#include "NexusWriter.hpp"
#include "Alignment.hpp"
#include "Msg.hpp"
#include "SpeciesTable.hpp"
#include <fstream>
#include <iostream>

/**
 * @brief Build the bracketed comment that records where the matrix came from
 */
std::string NexusWriter::provenance(SequenceFormat inputFormat, const std::string& inputFile){
    if(inputFormat == SequenceFormat::BINARY)
        return "[The SNP data matrix, taken from file " + inputFile + ".]";

    return "[The SNP data matrix, converted to binary format from file " + inputFile + ".]";
}

/**
 * @brief Write the NEXUS data block
 * @param comment Provenance comment placed before the data block. Skipped if empty.
 */
void NexusWriter::write(std::ostream& out, const Alignment& matrix, const SpeciesTable& table, const std::string& comment){
    out << "#NEXUS\n";
    out << "\n";
    if(!comment.empty()){
        out << "\n";
        out << comment << "\n";
        out << "\n";
    }
    out << "Begin data;\n";
    out << "\tDimensions ntax=" << matrix.getNumTaxa() << " nchar=" << matrix.getNumChar() << ";\n";
    out << "\tFormat datatype=integerdata symbols='012' gap=-;\n";
    out << "\tMatrix\n";

    const auto& names = matrix.getTaxaNames();
    for(int i = 0; i < matrix.getNumTaxa(); i++){
        out << names[i] << "_" << table.getSpecies(names[i]) << "\t" << matrix.getSequence(i) << "\n";
    }

    out << "\t;\n";
    out << "End;\n";
}

void NexusWriter::write(const std::string& path, const Alignment& matrix, const SpeciesTable& table, const std::string& comment){
    std::ofstream file(path);
    if(!file.is_open()){
        Msg::error("Unable to open output file " + path + " for writing!");
    }

    write(file, matrix, table, comment);
    file.close();

    if(file.fail()){
        Msg::error("Failed while writing output file " + path + "!");
    }
}

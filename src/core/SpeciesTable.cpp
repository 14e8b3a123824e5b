#include "SpeciesTable.hpp"
#include "Miscellaneous.hpp"
#include "Msg.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace {

    bool isHeaderLine(const std::vector<std::string>& tokens){
        std::string first = boost::algorithm::to_lower_copy(tokens[0]);
        std::string second = boost::algorithm::to_lower_copy(tokens[1]);
        if(first != "species")
            return false;

        return second == "specimen" || second == "specimens" || second == "sample" || second == "samples";
    }
}

SpeciesTable::SpeciesTable(std::string path){
    std::ifstream file(path);
    if(!file.is_open()){
        Msg::error("Unable to open species table " + path + "!");
    }

    read(file);
}

SpeciesTable::SpeciesTable(std::istream& in){
    read(in);
}

void SpeciesTable::read(std::istream& in){
    std::string line;
    int lineNumber = 0;
    while(std::getline(in, line)){
        lineNumber++;
        if(isBlank(line))
            continue;

        std::vector<std::string> tokens = tokenize(line);
        if(tokens.size() < 2){
            Msg::error("Expected a species id and a specimen id on line " + std::to_string(lineNumber) + " of the species table!");
        }

        if(isHeaderLine(tokens))
            continue;

        const std::string& species = tokens[0];
        const std::string& specimen = tokens[1];
        if(std::find(speciesNames.begin(), speciesNames.end(), species) == speciesNames.end()){
            speciesNames.push_back(species);
        }

        specimens.push_back(specimen);
        speciesOf[specimen] = species;
    }
}

const std::string& SpeciesTable::getSpecies(const std::string& specimen) const {
    auto it = speciesOf.find(specimen);
    if(it == speciesOf.end()){
        Msg::error("Specimen " + specimen + " is not listed in the species table!");
    }
    return it->second;
}

/**
 * @brief Make sure the specimens in the table and those in the input are the same, ignoring order
 * @param specimenIds The specimen ids found in the sequence input
 * @param tableName Name of the table used in the error message
 */
void SpeciesTable::checkSpecimens(const std::vector<std::string>& specimenIds, const std::string& tableName) const {
    std::vector<std::string> fromTable = specimens;
    std::vector<std::string> fromInput = specimenIds;
    std::sort(fromTable.begin(), fromTable.end());
    std::sort(fromInput.begin(), fromInput.end());

    if(fromTable != fromInput){
        Msg::error("The specimens listed in " + tableName + " and those included in the input file are not identical!");
    }
}

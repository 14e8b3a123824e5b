#ifndef SPECIES_TABLE_HPP
#define SPECIES_TABLE_HPP
#include <iosfwd>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Links every specimen to the species it belongs to. Loaded from a table of "<species> <specimen>" lines.
 */
class SpeciesTable {
    public:
        SpeciesTable(void) = delete;
        SpeciesTable(std::string path);
        SpeciesTable(std::istream& in);

        const std::string& getSpecies(const std::string& specimen) const;
        const std::vector<std::string>& getSpeciesNames() const {return speciesNames;} // In order of first appearance
        const std::vector<std::string>& getSpecimens() const {return specimens;}
        int getNumSpecimens() const {return specimens.size();}

        void checkSpecimens(const std::vector<std::string>& specimenIds, const std::string& tableName = "the species table") const;
    private:
        void read(std::istream& in);

        std::vector<std::string> specimens;
        std::vector<std::string> speciesNames;
        std::unordered_map<std::string, std::string> speciesOf;
};

#endif

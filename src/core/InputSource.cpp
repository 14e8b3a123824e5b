#include "InputSource.hpp"
#include "Miscellaneous.hpp"
#include "Msg.hpp"
#include "Nucleotides.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace {

    std::ifstream openInput(const std::string& path){
        std::ifstream file(path);
        if(!file.is_open()){
            Msg::error("Unable to open input file " + path + "!");
        }
        return file;
    }

    // Turn one allele index of a genotype into a base, 'N' when the allele is missing
    char resolveAllele(const std::string& index, char ref, char alt){
        if(index == "0")
            return ref;
        if(index == "1")
            return alt;
        return 'N';
    }

    bool isAlleleIndex(const std::string& index){
        return index == "0" || index == "1" || index == ".";
    }

    // Tally a record that can't be recoded. Returns without touching the sequences.
    void tallyComplexRecord(const std::string& ref, const std::string& alt, FilterReport& report){
        bool refHasComma = ref.find(',') != std::string::npos;
        bool altHasComma = alt.find(',') != std::string::npos;

        if(ref.size() > 1 && !refHasComma){
            report.exclude(INDEL);
        }
        else if(alt.size() > 1 && !altHasComma){
            report.exclude(INDEL);
        }
        else{
            int numAlleles = std::count(ref.begin(), ref.end(), ',') + std::count(alt.begin(), alt.end(), ',') + 2;
            if(numAlleles == 3){
                report.exclude(TRIALLELIC);
            }
            else if(numAlleles == 4){
                report.exclude(TETRAALLELIC);
            }
            else{
                Msg::error("Unexpected combination of REF and ALT alleles (REF: " + ref + "; ALT: " + alt + ")!");
            }
        }
    }
}

Alignment PhylipSource::normalize(FilterReport& /*report*/) const {
    std::ifstream file = openInput(path);
    return parse(file);
}

Alignment PhylipSource::parse(std::istream& in){
    std::vector<std::string> names;
    std::vector<std::string> sequences;

    std::string line;
    bool readHeader = false;
    int lineNumber = 0;
    while(std::getline(in, line)){
        lineNumber++;
        if(!readHeader){ // The first line only holds the dimensions
            readHeader = true;
            continue;
        }

        if(isBlank(line))
            continue;

        std::vector<std::string> tokens = tokenize(line);
        if(tokens.size() < 2){
            Msg::error("Expected a specimen id and a sequence on line " + std::to_string(lineNumber) + " of the phylip file!");
        }

        names.push_back(tokens[0]);
        sequences.push_back(boost::algorithm::to_upper_copy(tokens[1]));
    }

    return Alignment(std::move(names), std::move(sequences));
}

Alignment VcfSource::normalize(FilterReport& report) const {
    std::ifstream file = openInput(path);
    return parse(file, report);
}

Alignment VcfSource::parse(std::istream& in, FilterReport& report){
    std::vector<std::string> names;
    std::vector<std::string> sequences;
    bool foundHeader = false;

    std::string line;
    while(std::getline(in, line)){
        if(line.compare(0, 2, "##") == 0 || isBlank(line))
            continue;

        if(!foundHeader){
            if(line[0] != '#'){
                Msg::error("Expected a vcf header line beginning with '#CHROM' but could not find it!");
            }

            std::vector<std::string> header = tokenize(line);
            names.assign(header.begin() + std::min<size_t>(9, header.size()), header.end());
            sequences.assign(names.size(), "");
            foundHeader = true;
            continue;
        }

        std::vector<std::string> fields = tokenize(line);
        if(fields.size() != 9 + names.size()){
            Msg::error("Expected " + std::to_string(9 + names.size()) + " columns in vcf record but found " + std::to_string(fields.size()) + ":\n" + line);
        }

        std::string ref = boost::algorithm::to_upper_copy(fields[3]);
        std::string alt = boost::algorithm::to_upper_copy(fields[4]);
        if(ref.size() != 1 || alt.size() != 1){
            tallyComplexRecord(ref, alt, report);
            continue;
        }

        std::vector<std::string> formatKeys = splitField(fields[8], ':');
        auto gtIter = std::find(formatKeys.begin(), formatKeys.end(), "GT");
        if(gtIter == formatKeys.end()){
            Msg::error("Expected 'GT' in FORMAT field but could not find it!");
        }
        size_t gtIndex = gtIter - formatKeys.begin();

        bool foundHalfCall = false;
        for(size_t i = 0; i < names.size(); i++){
            std::vector<std::string> subfields = splitField(fields[9 + i], ':');
            if(gtIndex >= subfields.size()){
                Msg::error("Expected a 'GT' entry for specimen " + names[i] + " but found " + fields[9 + i] + "!");
            }
            const std::string& gt = subfields[gtIndex];

            std::vector<std::string> alleles;
            if(gt.find('/') != std::string::npos){
                alleles = splitField(gt, '/');
            }
            else if(gt.find('|') != std::string::npos){
                alleles = splitField(gt, '|');
            }
            else{
                Msg::error("Expected alleles to be separated by '/' or '|' but did not find such separators in " + gt + "!");
            }

            if(!isAlleleIndex(alleles[0]) || !isAlleleIndex(alleles[1])){
                Msg::error("Expected genotypes to be bi-allelic and contain only 0s and/or 1s or missing data marked with '.', but found " +
                           alleles[0] + " and " + alleles[1] + "!");
            }

            char base1 = resolveAllele(alleles[0], ref[0], alt[0]);
            char base2 = resolveAllele(alleles[1], ref[0], alt[0]);
            if(base1 == 'N' || base2 == 'N'){
                if(base1 != base2)
                    foundHalfCall = true;
                sequences[i].push_back('N');
                continue;
            }

            char code = Nucleotides::genotypeCode(base1, base2);
            if(code == '\0'){
                Msg::error(std::string("Unexpected genotype: ") + base1 + " and " + base2 + "!");
            }
            sequences[i].push_back(code);
        }

        if(foundHalfCall)
            report.halfCalledSites++;
    }

    if(!foundHeader){
        Msg::error("Expected a vcf header line beginning with '#CHROM' but could not find it!");
    }

    return Alignment(std::move(names), std::move(sequences), SequenceFormat::NUCLEOTIDE);
}

Alignment normalizeInput(const InputSource& source, FilterReport& report){
    return std::visit([&report](const auto& s){ return s.normalize(report); }, source);
}

const std::string& inputPath(const InputSource& source){
    return std::visit([](const auto& s) -> const std::string& { return s.path; }, source);
}

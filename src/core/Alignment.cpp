#include "Alignment.hpp"
#include "Msg.hpp"
#include <utility>

Alignment::Alignment(std::vector<std::string> names, std::vector<std::string> rows, SequenceFormat f) : 
    numChar(0), numTaxa(0), format(f), taxaNames(std::move(names)), sequences(std::move(rows)) {

    if(taxaNames.size() != sequences.size()){
        Msg::error("Found " + std::to_string(taxaNames.size()) + " specimen names but " + std::to_string(sequences.size()) + " sequences!");
    }

    if(taxaNames.empty()){
        Msg::error("No specimens were found in the input!");
    }

    numTaxa = taxaNames.size();
    numChar = sequences[0].size();
    for(int i = 1; i < numTaxa; i++){
        int currentLength = sequences[i].size();
        if(currentLength != numChar){
            Msg::error("Sequences have different lengths! Sequence 1 (" + taxaNames[0] + ") had length " + std::to_string(numChar) + 
                       " but sequence " + std::to_string(i + 1) + " (" + taxaNames[i] + ") had length " + std::to_string(currentLength));
        }
    }
}

Alignment Alignment::keepColumns(const boost::dynamic_bitset<>& keep) const {
    std::vector<std::string> kept(numTaxa);
    for(int i = 0; i < numTaxa; i++){
        kept[i].reserve(keep.count());
    }

    for(auto s = keep.find_first(); s != boost::dynamic_bitset<>::npos && s < static_cast<size_t>(numChar); s = keep.find_next(s)){
        for(int i = 0; i < numTaxa; i++){
            kept[i].push_back(sequences[i][s]);
        }
    }

    return Alignment(taxaNames, std::move(kept), format);
}

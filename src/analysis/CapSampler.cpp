#include "CapSampler.hpp"
#include <boost/dynamic_bitset.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <numeric>
#include <utility>
#include <vector>

CapSampler::CapSampler(boost::random::mt19937& r, int m) : rng(r), maxSites(m) {}

Alignment CapSampler::operator()(const Alignment& matrix, FilterReport& report){
    int numSites = matrix.getNumChar();
    if(maxSites >= numSites){
        report.capExceedsSites = true;
        return matrix;
    }

    // Partial Fisher-Yates shuffle, the first maxSites entries are the sample
    std::vector<int> positions(numSites);
    std::iota(positions.begin(), positions.end(), 0);
    for(int i = 0; i < maxSites; i++){
        boost::random::uniform_int_distribution<int> pick(i, numSites - 1);
        std::swap(positions[i], positions[pick(rng)]);
    }

    // The bitset puts the chosen columns back in their original order
    boost::dynamic_bitset<> keep(numSites);
    for(int i = 0; i < maxSites; i++){
        keep.set(positions[i]);
    }

    report.exclude(OVER_CAP, numSites - maxSites);
    return matrix.keepColumns(keep);
}

#ifndef CAP_SAMPLER_HPP
#define CAP_SAMPLER_HPP
#include "core/Alignment.hpp"
#include "core/FilterReport.hpp"
#include <boost/random/mersenne_twister.hpp>

/**
 * @brief Reduces a matrix to at most maxSites columns, chosen uniformly without replacement.
 * The chosen columns keep their original order.
 */
class CapSampler {
    public:
        CapSampler(void)=delete;
        CapSampler(boost::random::mt19937& r, int m);

        Alignment operator()(const Alignment& matrix, FilterReport& report);
    private:
        boost::random::mt19937& rng;
        int maxSites;
};

#endif

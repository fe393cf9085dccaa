#include "Sampler.h"
#include "Error.h"

#include <algorithm>
#include <random>
#include <stdexcept>

using namespace ensemble;

std::vector<int> LatinHypercubeSampler::shuffledIndices(const int n) {
    std::vector<int> idx(n);
    for (int i = 0; i < n; ++i) idx[i] = i;
    if (scramble_) {
        std::shuffle(idx.begin(), idx.end(), std::mt19937(rng_.nextUInt32()));
    }
    return idx;
}

std::vector<double> LatinHypercubeSampler::sortedPercentiles(const int n) {
    if (n < 0) throw std::invalid_argument("LatinHypercubeSampler: negative trial count");

    std::vector<double> out(n);
    for (int stratum = 0; stratum < n; ++stratum)
        out[stratum] = (stratum + rng_.uniform()) / static_cast<double>(n);
    return out;
}

std::vector<double> LatinHypercubeSampler::percentiles(const int n) {
    const auto strata = sortedPercentiles(n);
    const auto perm = shuffledIndices(n);

    std::vector<double> out(n);
    for (int i = 0; i < n; ++i) out[i] = strata[perm[i]];
    return out;
}

std::vector<double> SimpleRandomSampler::percentiles(const int n) {
    if (n < 0) throw std::invalid_argument("SimpleRandomSampler: negative trial count");

    std::vector<double> out(n);
    for (auto& u : out) u = rng_.uniform();
    return out;
}

std::vector<double> SimpleRandomSampler::sortedPercentiles(const int n) {
    auto out = percentiles(n);
    std::sort(out.begin(), out.end());
    return out;
}

std::unique_ptr<Sampler> ensemble::makeSampler(const std::string& method, const RngEngine& rng) {
    if (method == "lhs") return std::make_unique<LatinHypercubeSampler>(rng, true);
    if (method == "random" || method == "montecarlo") return std::make_unique<SimpleRandomSampler>(rng);
    throw ConfigurationError("Unknown sampling method '" + method + "' (expected lhs or random)");
}

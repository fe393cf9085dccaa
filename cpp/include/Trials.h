#pragma once
/**
 * @file Trials.h
 * @brief Trial-number strings and per-trial directory layout.
 */
#include <cstdint>
#include <string>
#include <vector>

namespace ensemble {
    /**
     * @brief Parse "4,7,9-12,42" into sorted, unique trial numbers.
     * @throws ConfigurationError on malformed input or negative numbers
     */
    std::vector<int> parseTrialString(const std::string& text);

    /**
     * @brief Inverse of parseTrialString: collapse runs of consecutive numbers into ranges.
     */
    std::string createTrialString(std::vector<int> trials);

    /**
     * @brief Directory of one trial: `<simsDir>/s<simId:03>/<n / M>/<n % M>`.
     *
     * Each level is zero-padded to log10(M) digits, where M = maxSimDirs.
     * @throws ConfigurationError unless maxSimDirs is a power of 10 >= 10
     */
    std::string trialDirectory(const std::string& simsDir, int64_t simId, int trialNum, int maxSimDirs = 1000);
}

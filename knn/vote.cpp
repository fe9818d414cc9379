#include "vote.h"
#include <stdexcept>
#include <string>

int majorityVote(const std::vector<int>& labels, int k) {
    if (k < 1) {
        throw std::invalid_argument("k must be positive");
    }
    if (labels.size() < static_cast<size_t>(k)) {
        throw std::runtime_error("Insufficient neighbors: need " + std::to_string(k) +
                                 ", have " + std::to_string(labels.size()));
    }

    int ones = 0;
    int zeros = 0;
    for (int i = 0; i < k; ++i) {
        if (labels[i] == 1) {
            ones++;
        } else if (labels[i] == 0) {
            zeros++;
        } else {
            throw std::invalid_argument("Labels must be 0 or 1");
        }
    }

    // При нечётном k ничьей быть не может
    return ones > zeros ? 1 : 0;
}

#include "rank.h"
#include <algorithm>
#include <numeric>

RankedDistances sortAndArgsort(const std::vector<double>& values) {
    RankedDistances result;
    result.indices.resize(values.size());
    std::iota(result.indices.begin(), result.indices.end(), 0);

    // stable_sort сохраняет исходный порядок равных элементов,
    // поэтому при совпадении расстояний первым идёт меньший индекс
    std::stable_sort(result.indices.begin(), result.indices.end(),
        [&values](size_t a, size_t b) {
            return values[a] < values[b];
        });

    result.sorted.reserve(values.size());
    for (size_t idx : result.indices) {
        result.sorted.push_back(values[idx]);
    }

    return result;
}

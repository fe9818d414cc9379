#include "knn.h"
#include "distance.h"
#include "rank.h"
#include "vote.h"
#include <omp.h>
#include <stdexcept>

KNN::KNN(int k, std::ostream& log) : k(k), logStream(&log) {
    if (k < MIN_K || k > MAX_K || k % 2 == 0) {
        throw std::invalid_argument("k must be positive and odd between " + std::to_string(MIN_K) +
                                    " and " + std::to_string(MAX_K) + ", got " + std::to_string(k));
    }
}

int KNN::getK() const {
    return k;
}

std::optional<int> KNN::classify(const std::string& datasetName, const std::vector<double>& query) const {
    const Dataset* dataset = DatasetRegistry::find(datasetName);
    if (dataset == nullptr) {
        *logStream << "Data can either be: 'cancer' or 'customer' data. Re-specify." << std::endl;
        return std::nullopt;
    }

    *logStream << "Working with " << dataset->name << " dataset." << std::endl;
    return predict(*dataset, query);
}

int KNN::predict(const Dataset& dataset, const std::vector<double>& query) const {
    // Набор может прийти не из реестра: метки должны совпадать с точками
    validateDataset(dataset);

    std::vector<double> distances = computeDistances(dataset.points, query);
    RankedDistances ranked = sortAndArgsort(distances);

    // Метки в порядке возрастания расстояния
    std::vector<int> sortedLabels;
    sortedLabels.reserve(ranked.indices.size());
    for (size_t idx : ranked.indices) {
        sortedLabels.push_back(dataset.labels[idx]);
    }

    return majorityVote(sortedLabels, k);
}

std::vector<int> KNN::predictBatch(const Dataset& dataset, const std::vector<std::vector<double>>& queries) const {
    std::vector<int> predictions;
    predictions.reserve(queries.size());
    for (const auto& query : queries) {
        predictions.push_back(predict(dataset, query));
    }
    return predictions;
}

void KNN::setNumThreads(int num_threads) {
    if (num_threads > 0) {
        omp_set_num_threads(num_threads);
    }
}

int KNN::getNumThreads() {
    return omp_get_max_threads();
}

#include "dataset.h"
#include <stdexcept>
#include <utility>

namespace {

Dataset makeDataset(const std::string& name,
                    std::vector<std::vector<double>> points,
                    std::vector<int> labels) {
    Dataset dataset{name, std::move(points), std::move(labels)};
    validateDataset(dataset);
    return dataset;
}

// Игрушечные наборы 10x2 с бинарными классами
const std::vector<Dataset> REGISTRY = {
    makeDataset("cancer",
        {{1.4, 14.2}, {7.3, 3.6}, {15.8, 2.0}, {7.0, 9.1}, {13.9, 5.7},
         {16.6, 2.1}, {18.1, 4.5}, {8.1, 11.1}, {11.9, 1.9}, {12.8, 15.7}},
        {0, 1, 1, 1, 0, 0, 1, 0, 1, 0}),
    makeDataset("customer",
        {{11.4, 4.2}, {17.3, 13.6}, {5.8, 22.0}, {7.0, 1.1}, {13.9, 5.7},
         {16.6, 9.1}, {8.1, 1.5}, {1.1, 11.1}, {2.9, 19.9}, {22.8, 15.7}},
        {1, 0, 0, 1, 1, 0, 1, 1, 1, 0}),
};

} // namespace

size_t Dataset::dimension() const {
    return points.empty() ? 0 : points[0].size();
}

void validateDataset(const Dataset& dataset) {
    if (dataset.points.size() != dataset.labels.size()) {
        throw std::invalid_argument("Dataset '" + dataset.name +
                                    "': points and labels must have the same size");
    }

    const size_t dim = dataset.dimension();
    for (const auto& point : dataset.points) {
        if (point.size() != dim) {
            throw std::invalid_argument("Dataset '" + dataset.name +
                                        "': all points must have the same dimension");
        }
    }

    for (int label : dataset.labels) {
        if (label != 0 && label != 1) {
            throw std::invalid_argument("Dataset '" + dataset.name +
                                        "': labels must be 0 or 1");
        }
    }
}

const Dataset* DatasetRegistry::find(const std::string& name) {
    for (const auto& dataset : REGISTRY) {
        if (dataset.name == name) {
            return &dataset;
        }
    }
    return nullptr;
}

std::vector<std::string> DatasetRegistry::names() {
    std::vector<std::string> result;
    result.reserve(REGISTRY.size());
    for (const auto& dataset : REGISTRY) {
        result.push_back(dataset.name);
    }
    return result;
}

#include "distance.h"
#include <cmath>
#include <stdexcept>

double euclideanDistance(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("Input dimension mismatch");
    }

    double sum = 0.0;
    for (size_t j = 0; j < a.size(); ++j) {
        double diff = a[j] - b[j];
        sum += diff * diff;
    }
    return std::sqrt(sum);
}

std::vector<double> computeDistances(const std::vector<std::vector<double>>& train,
                                     const std::vector<double>& query) {
    const size_t n = train.size();
    const size_t dim = query.size();

    // Проверка размерности до параллельной области:
    // исключение не должно покидать omp parallel
    for (const auto& point : train) {
        if (point.size() != dim) {
            throw std::invalid_argument("Input dimension mismatch");
        }
    }

    // Каждый поток пишет только в свой элемент
    std::vector<double> distances(n);

    #pragma omp parallel for schedule(static) default(none) \
        shared(distances, train, query, n, dim)
    for (size_t i = 0; i < n; ++i) {
        const std::vector<double>& train_point = train[i];

        double dist = 0.0;
        for (size_t j = 0; j < dim; ++j) {
            double diff = train_point[j] - query[j];
            dist += diff * diff;
        }
        distances[i] = std::sqrt(dist);
    }

    return distances;
}

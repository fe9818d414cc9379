#include "knn.h"
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// stoi/stod останавливаются на первом лишнем символе, "3x" надо отвергнуть
int parseInt(const std::string& text) {
    size_t pos = 0;
    int value = std::stoi(text, &pos);
    if (pos != text.size()) {
        throw std::invalid_argument("not an integer: '" + text + "'");
    }
    return value;
}

double parseDouble(const std::string& text) {
    size_t pos = 0;
    double value = std::stod(text, &pos);
    if (pos != text.size()) {
        throw std::invalid_argument("not a number: '" + text + "'");
    }
    return value;
}

} // namespace

int main(int argc, char* argv[]) {
    // Аргументы: ./knn_classifier [k] [набор] [x y ...]
    try {
        int k = (argc > 1) ? parseInt(argv[1]) : KNN::DEFAULT_K;
        std::string dataset = (argc > 2) ? argv[2] : "cancer";

        std::vector<double> query;
        for (int i = 3; i < argc; ++i) {
            query.push_back(parseDouble(argv[i]));
        }
        if (query.empty()) {
            query = {13.9, 1.9};
        }

        // Количество потоков OpenMP из окружения
        if (const char* threads = std::getenv("KNN_NUM_THREADS")) {
            KNN::setNumThreads(std::atoi(threads));
        }

        KNN knn(k);
        std::optional<int> prediction = knn.classify(dataset, query);

        if (prediction) {
            std::cout << "Класс тестовой точки: " << *prediction << std::endl;
        } else {
            std::cout << "Классификация не выполнена. Доступные наборы:";
            for (const auto& name : DatasetRegistry::names()) {
                std::cout << " " << name;
            }
            std::cout << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Ошибка: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

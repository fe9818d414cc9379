#ifndef KNN_H
#define KNN_H

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "dataset.h"

class KNN {
private:
    int k;
    std::ostream* logStream;

public:
    static constexpr int MIN_K = 1;
    static constexpr int MAX_K = 15;
    static constexpr int DEFAULT_K = 5;

    // k должно быть нечётным в диапазоне [1, 15], иначе std::invalid_argument.
    // Диагностика classify() пишется в log. Поток общий для всех вызовов:
    // параллельный classify() безопасен для std::cout, а для своего потока
    // (например, std::ostringstream) вызывающий должен сам синхронизировать доступ.
    explicit KNN(int k = DEFAULT_K, std::ostream& log = std::cout);

    int getK() const;

    // Классификация по имени встроенного набора.
    // Неизвестное имя - сообщение в лог и std::nullopt, без исключения.
    std::optional<int> classify(const std::string& datasetName, const std::vector<double>& query) const;

    // Предсказание для одного образца на произвольном наборе.
    // Набор проверяется validateDataset(): std::invalid_argument при нарушении.
    int predict(const Dataset& dataset, const std::vector<double>& query) const;

    // Предсказание для набора образцов, порядок сохраняется
    std::vector<int> predictBatch(const Dataset& dataset, const std::vector<std::vector<double>>& queries) const;

    // Настройка количества потоков OpenMP
    static void setNumThreads(int num_threads);
    static int getNumThreads();
};

#endif // KNN_H

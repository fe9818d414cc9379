#ifndef DATASET_H
#define DATASET_H

#include <cstddef>
#include <string>
#include <vector>

// Размеченный набор обучающих точек
struct Dataset {
    std::string name;
    std::vector<std::vector<double>> points;
    std::vector<int> labels;   // 0 или 1, по одной метке на точку

    std::size_t dimension() const;
};

// Проверка инвариантов набора: одинаковое число точек и меток,
// одна размерность у всех точек, метки только 0 или 1.
// Бросает std::invalid_argument при нарушении.
void validateDataset(const Dataset& dataset);

// Закрытый реестр встроенных наборов данных (только чтение)
class DatasetRegistry {
public:
    // nullptr, если набора с таким именем нет
    static const Dataset* find(const std::string& name);

    // Имена в порядке регистрации
    static std::vector<std::string> names();
};

#endif // DATASET_H

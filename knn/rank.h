#ifndef RANK_H
#define RANK_H

#include <cstddef>
#include <vector>

// Результат сортировки: sorted[i] == values[indices[i]]
struct RankedDistances {
    std::vector<std::size_t> indices;   // argsort
    std::vector<double> sorted;    // значения по возрастанию
};

// Сортировка по возрастанию вместе с argsort.
// Равные значения получают индексы в порядке их исходных позиций,
// один исходный индекс никогда не используется дважды.
RankedDistances sortAndArgsort(const std::vector<double>& values);

#endif // RANK_H

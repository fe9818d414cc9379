#ifndef DISTANCE_H
#define DISTANCE_H

#include <vector>

// Евклидово расстояние между двумя точками одной размерности
double euclideanDistance(const std::vector<double>& a, const std::vector<double>& b);

// Расстояния от query до каждой обучающей точки, порядок совпадает с train.
// При несовпадении размерностей - std::invalid_argument.
std::vector<double> computeDistances(const std::vector<std::vector<double>>& train,
                                     const std::vector<double>& query);

#endif // DISTANCE_H

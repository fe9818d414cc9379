#ifndef VOTE_H
#define VOTE_H

#include <vector>

// Голосование большинством среди первых k меток (метки уже упорядочены
// по расстоянию). Возвращает 1, если единиц больше, чем нулей, иначе 0.
// Меньше k меток - std::runtime_error, обрезать молча нельзя.
int majorityVote(const std::vector<int>& labels, int k);

#endif // VOTE_H

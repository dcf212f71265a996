#pragma once

#include <cmath>
#include <numeric>
#include <vector>

namespace ivsurf::math {

template<typename T>
class FastStatistics {
public:
    static T mean(const std::vector<T>& data) {
        if (data.empty()) return T{0};
        return std::accumulate(data.begin(), data.end(), T{0}) / static_cast<T>(data.size());
    }

    static T variance(const std::vector<T>& data, bool sample = true) {
        if (data.size() <= 1) return T{0};

        const T mu = mean(data);
        const T sum_sq_diff = std::accumulate(data.begin(), data.end(), T{0},
            [mu](T acc, T val) {
                const T diff = val - mu;
                return acc + diff * diff;
            });

        const T denominator = sample ? static_cast<T>(data.size() - 1) : static_cast<T>(data.size());
        return sum_sq_diff / denominator;
    }

    static T standard_deviation(const std::vector<T>& data, bool sample = true) {
        return std::sqrt(variance(data, sample));
    }
};

}

#include "Statistics.h"
#include <numeric>   // For std::accumulate
#include <cmath>     // For std::sqrt, std::ceil
#include <algorithm> // For std::upper_bound
#include <stdexcept> // For std::invalid_argument
#include <map>

namespace Statistics {

    double calculateMean(const std::vector<double>& data) {
        if (data.empty()) return 0.0;
        long double sum = std::accumulate(data.begin(), data.end(), 0.0L);
        return static_cast<double>(sum / data.size());
    }

    double calculateVariance(const std::vector<double>& data, double mean) {
        if (data.size() < 2) return 0.0;
        long double squaredDiffSum = 0.0;
        for (const double val : data) {
            squaredDiffSum += (val - mean) * (val - mean);
        }
        return static_cast<double>(squaredDiffSum / (data.size() - 1));
    }

    double calculateStdDev(double variance) {
        return std::sqrt(variance);
    }

    double findValueAtPercentile(const std::vector<double>& sortedData, double percentile) {
        if (sortedData.empty() || percentile <= 0.0 || percentile > 100.0) {
            throw std::invalid_argument("Data cannot be empty and percentile must be in (0, 100].");
        }

        // Nearest rank, 1-based. The epsilon keeps p * n / 100 from rounding
        // up past an exact integer (0.95 * 20 is not exactly 19 in binary).
        const double n = static_cast<double>(sortedData.size());
        long long rank = static_cast<long long>(std::ceil(percentile * n / 100.0 - 1e-9));
        if (rank < 1) rank = 1;
        if (rank > static_cast<long long>(sortedData.size())) rank = sortedData.size();
        return sortedData[rank - 1];
    }

    double findFractionAtOrBelow(const std::vector<double>& sortedData, double value) {
        if (sortedData.empty()) {
            throw std::invalid_argument("Data cannot be empty.");
        }
        auto it = std::upper_bound(sortedData.begin(), sortedData.end(), value);
        size_t count = std::distance(sortedData.begin(), it);
        return static_cast<double>(count) / sortedData.size();
    }


    // Implementation of the t-value finder
    double findTValue(double confidence_level, int df) {
        if (df < 1) {
            // Degrees of freedom must be at least 1.
            return std::nan("");
        }

        // For larger degrees of freedom the t-distribution is very close to
        // the normal distribution, so Z-scores are used.
        if (df > 100) {
            if (confidence_level == 90.0) return 1.645;
            if (confidence_level == 95.0) return 1.960;
            if (confidence_level == 99.0) return 2.576;
            return std::nan("");
        }

        // Map key: degrees of freedom
        // Map value: {t-value for 90%, 95%, 99%}, two-tailed.
        static const std::map<int, std::vector<double>> t_table = {
            {1,  {6.314, 12.706, 63.657}},
            {2,  {2.920, 4.303,  9.925}},
            {3,  {2.353, 3.182,  5.841}},
            {4,  {2.132, 2.776,  4.604}},
            {5,  {2.015, 2.571,  4.032}},
            {6,  {1.943, 2.447,  3.707}},
            {7,  {1.895, 2.365,  3.499}},
            {8,  {1.860, 2.306,  3.355}},
            {9,  {1.833, 2.262,  3.250}},
            {10, {1.812, 2.228,  3.169}},
            {15, {1.753, 2.131,  2.947}},
            {20, {1.725, 2.086,  2.845}},
            {25, {1.708, 2.060,  2.787}},
            {30, {1.697, 2.042,  2.750}},
            {40, {1.684, 2.021,  2.704}},
            {50, {1.676, 2.009,  2.678}},
            {60, {1.671, 2.000,  2.660}},
            {80, {1.664, 1.990,  2.639}},
            {100,{1.660, 1.984,  2.626}}
        };

        auto it = t_table.lower_bound(df);
        if (it == t_table.end()) {
            it--; // Use the largest available entry if df is between map keys
        }

        if (confidence_level == 90.0) return it->second[0];
        if (confidence_level == 95.0) return it->second[1];
        if (confidence_level == 99.0) return it->second[2];

        return std::nan(""); // Return NaN if confidence level is not supported
    }

} // namespace Statistics

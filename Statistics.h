#ifndef STATISTICS_H
#define STATISTICS_H

#include <vector>

namespace Statistics {

    /**
     * @brief Calculates the mean (average) of a dataset.
     * @param data The vector of data points.
     * @return The mean of the data.
     */
    double calculateMean(const std::vector<double>& data);

    /**
     * @brief Calculates the sample variance (n - 1 denominator) of a dataset.
     * @param data The vector of data points.
     * @param mean The pre-calculated mean of the data.
     * @return The variance of the data.
     */
    double calculateVariance(const std::vector<double>& data, double mean);

    /**
     * @brief Calculates the standard deviation.
     * @param variance The pre-calculated variance of the data.
     * @return The standard deviation.
     */
    double calculateStdDev(double variance);

    /**
     * @brief Finds the value at a given percentile using the nearest-rank rule.
     * @note The smallest value v such that at least `percentile`% of the data
     *       is <= v. Ties resolve toward the lower value.
     * @param sortedData The vector of data points, which MUST be pre-sorted.
     * @param percentile The percentile to find (e.g., 50.0 for median). Must be in (0, 100].
     * @return The value at the specified percentile.
     */
    double findValueAtPercentile(const std::vector<double>& sortedData, double percentile);

    /**
     * @brief Finds the fraction of a sorted dataset that is <= value.
     * @param sortedData The vector of data points, which MUST be pre-sorted.
     * @param value The threshold.
     * @return The fraction in [0, 1].
     */
    double findFractionAtOrBelow(const std::vector<double>& sortedData, double value);

    /**
     * @brief Finds the critical value from a Student's t-distribution.
     * @param confidence_level The level of confidence percentage we want. Currently accepts only 90, 95, 99
     * @param degrees_of_freedom Typically the sample size minus one. When large enough, the function returns the normal value.
     * @return The corresponding critical value for a t-distribution
     */
    double findTValue(double confidence_level, int degrees_of_freedom);

} // namespace Statistics

#endif // STATISTICS_H

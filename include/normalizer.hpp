#pragma once
#include "types.hpp"
#include <utility>

/**
 * @brief Mean and standard deviation of the feature and the target.
 *
 * Standard deviations are population values and are never zero: a computed
 * value of exactly 0 is stored as 1.0.
 */
struct NormalizationStats {
    double x_mean = 0.0;
    double x_std = 1.0;
    double y_mean = 0.0;
    double y_std = 1.0;
};

/**
 * @brief Z-score normalization for a single feature and target.
 *
 * Statistics are computed once in the constructor and frozen. Training runs
 * in the normalized space; predictions and fitted parameters are mapped back
 * to the original units with denormalize_predictions() and
 * get_original_scale_parameters().
 */
class DataNormalizer {
  public:
    /**
     * @brief Computes the statistics of x and y.
     * @throws std::invalid_argument if either series is empty
     * @throws std::runtime_error if a value is not finite
     */
    DataNormalizer(const Series& x, const Series& y);

    /**
     * @brief Normalizes both series with the stored statistics.
     * @return (x_norm, y_norm)
     */
    std::pair<Series, Series> normalize(const Series& x, const Series& y) const;

    /// Normalizes feature values only, for prediction.
    Series normalize_input(const Series& x) const;

    /// y_norm * y_std + y_mean
    Series denormalize_predictions(const Series& predictions_norm) const;

    /**
     * @brief Maps normalized linear parameters to the original scale.
     *
     * theta1 = theta1_norm * (y_std / x_std)
     * theta0 = theta0_norm * y_std + y_mean - theta1 * x_mean
     */
    LinearParameters get_original_scale_parameters(double theta0_norm, double theta1_norm) const;

    const NormalizationStats& stats() const { return stats_; }

  private:
    NormalizationStats stats_;
};

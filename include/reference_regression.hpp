#pragma once
#include "types.hpp"
#include <string>

struct ReferenceFit {
    double intercept = 0.0;
    double slope = 0.0;
    Series predictions;
    double rmse = 0.0;
    double mae = 0.0;
    double r2 = 0.0;
    std::string equation;
};

/**
 * @brief Closed-form ordinary least squares for one feature.
 *
 * Serves as the reference the gradient-descent result is compared against:
 * slope = Sxy / Sxx, intercept = mean(y) - slope * mean(x). A constant x
 * gives slope 0 and intercept mean(y).
 */
class ReferenceRegression {
  public:
    /**
     * @brief Fits on the given data and scores the fit on the same data.
     * @throws std::invalid_argument on empty or mismatched series
     * @throws std::runtime_error if the sums of squares are not finite
     */
    static ReferenceFit fit(const Series& x, const Series& y);
};

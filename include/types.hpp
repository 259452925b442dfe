#pragma once
#include <cstddef>
#include <vector>

/**
 * @file types.hpp
 * @brief Common type definitions shared by the regression components.
 *
 * Everything numeric is carried as double so that normalization round trips
 * and de-normalized parameters stay within floating-point tolerance.
 */

/// Sample column (one value per row).
using Series = std::vector<double>;

/**
 * @brief Intercept and slope of y = theta0 + theta1 * x.
 *
 * Used both for the normalized-space parameters the optimizer updates and
 * for the same parameters mapped back to original units.
 */
struct LinearParameters {
    double theta0 = 0.0;
    double theta1 = 0.0;
};

/// Partial derivatives of the cost with respect to theta0 and theta1.
struct Gradients {
    double theta0 = 0.0;
    double theta1 = 0.0;
};

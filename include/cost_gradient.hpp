#pragma once
#include "types.hpp"

/**
 * @brief Mean-squared cost and gradients for h(x) = theta0 + theta1 * x.
 *
 * Works on normalized data with an implicit design matrix [1, x]. Both
 * computations are pure functions of the stored data and the given theta.
 */
class CostGradientEngine {
  public:
    /// Sample count from which the sums are split across OpenMP threads
    static constexpr size_t PARALLEL_THRESHOLD = 16384;

    /**
     * @brief Stores the normalized training data.
     * @throws std::invalid_argument if the series are empty or differ in length
     */
    CostGradientEngine(Series x_norm, Series y_norm);

    /**
     * @brief J(theta) = (1 / 2m) * sum((h(x_i) - y_i)^2)
     */
    double compute_cost(const LinearParameters& theta) const;

    /**
     * @brief Partial derivatives of J.
     *
     * g0 = (1 / m) * sum(h(x_i) - y_i)
     * g1 = (1 / m) * sum((h(x_i) - y_i) * x_i)
     */
    Gradients compute_gradients(const LinearParameters& theta) const;

    size_t size() const { return m; }

  private:
    Series x_data;
    Series y_data;
    size_t m;
};

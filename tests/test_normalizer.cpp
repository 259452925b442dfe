#include "test_framework.hpp"
#include "../include/normalizer.hpp"
#include <cmath>
#include <limits>

TEST(Normalizer, round_trip_restores_targets) {
    Series x = {1.0, 4.0, 9.0, 16.0, 25.0};
    Series y = {-3.5, 0.25, 7.0, 12.5, 40.0};
    DataNormalizer normalizer(x, y);

    auto [x_norm, y_norm] = normalizer.normalize(x, y);
    Series restored = normalizer.denormalize_predictions(y_norm);

    TEST_ASSERT(restored.size() == y.size());
    for (size_t i = 0; i < y.size(); ++i) {
        TEST_APPROX(restored[i], y[i], 1e-9);
    }
}

TEST(Normalizer, normalized_series_have_zero_mean_unit_std) {
    Series x = {2.0, 4.0, 6.0, 8.0};
    Series y = {1.0, 3.0, 2.0, 10.0};
    DataNormalizer normalizer(x, y);
    auto [x_norm, y_norm] = normalizer.normalize(x, y);

    double mean = 0.0, sq = 0.0;
    for (double v : x_norm) mean += v;
    mean /= x_norm.size();
    for (double v : x_norm) sq += (v - mean) * (v - mean);

    TEST_APPROX(mean, 0.0, 1e-12);
    TEST_APPROX(std::sqrt(sq / x_norm.size()), 1.0, 1e-12);
    // population standard deviation of 2,4,6,8
    TEST_APPROX(normalizer.stats().x_std, std::sqrt(5.0), 1e-12);
}

TEST(Normalizer, constant_target_uses_unit_std) {
    Series x = {1.0, 2.0, 3.0};
    Series y = {7.0, 7.0, 7.0};
    DataNormalizer normalizer(x, y);

    TEST_APPROX(normalizer.stats().y_std, 1.0, 1e-15);
    TEST_APPROX(normalizer.stats().y_mean, 7.0, 1e-15);

    auto [x_norm, y_norm] = normalizer.normalize(x, y);
    for (double v : y_norm) {
        TEST_APPROX(v, 0.0, 1e-15);
    }
}

TEST(Normalizer, original_scale_parameters_match_normalized_predictions) {
    Series x = {10.0, 12.0, 15.0, 21.0, 30.0};
    Series y = {3.0, 5.0, 4.0, 9.0, 11.0};
    DataNormalizer normalizer(x, y);

    const double t0 = 0.37, t1 = -1.25;
    LinearParameters original = normalizer.get_original_scale_parameters(t0, t1);

    Series x_norm = normalizer.normalize_input(x);
    Series preds_norm;
    for (double v : x_norm) preds_norm.push_back(t0 + t1 * v);
    Series via_normalized = normalizer.denormalize_predictions(preds_norm);

    for (size_t i = 0; i < x.size(); ++i) {
        TEST_APPROX(via_normalized[i], original.theta0 + original.theta1 * x[i], 1e-9);
    }
}

TEST(Normalizer, rejects_empty_and_non_finite_input) {
    TEST_THROWS(DataNormalizer(Series{}, Series{1.0}), std::invalid_argument);
    TEST_THROWS(DataNormalizer(Series{1.0}, Series{}), std::invalid_argument);

    Series bad = {1.0, std::numeric_limits<double>::quiet_NaN()};
    TEST_THROWS(DataNormalizer(bad, Series{1.0, 2.0}), std::runtime_error);

    DataNormalizer normalizer(Series{1.0, 2.0}, Series{3.0, 4.0});
    TEST_THROWS(normalizer.normalize_input(Series{std::numeric_limits<double>::infinity()}),
                std::runtime_error);
    TEST_THROWS(normalizer.get_original_scale_parameters(std::nan(""), 1.0), std::runtime_error);
}

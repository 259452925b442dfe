#include "../include/normalizer.hpp"
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

namespace {

void compute_mean_std(const Series& values, double& mean, double& std_dev) {
    mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();

    double sum_sq = 0.0;
    for (double v : values) {
        double diff = v - mean;
        sum_sq += diff * diff;
    }
    std_dev = std::sqrt(sum_sq / values.size());

    // Constant columns stay representable
    if (std_dev == 0.0) {
        std_dev = 1.0;
    }
}

void require_finite(const Series& values, const std::string& what) {
    for (double v : values) {
        if (!std::isfinite(v)) {
            throw std::runtime_error(what + " failed: non-finite value in input");
        }
    }
}

Series scale(const Series& values, double mean, double std_dev) {
    Series out(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        out[i] = (values[i] - mean) / std_dev;
    }
    return out;
}

} // namespace

DataNormalizer::DataNormalizer(const Series& x, const Series& y) {
    if (x.empty() || y.empty()) {
        throw std::invalid_argument("x_data and y_data must be non-empty");
    }
    require_finite(x, "Normalization");
    require_finite(y, "Normalization");

    compute_mean_std(x, stats_.x_mean, stats_.x_std);
    compute_mean_std(y, stats_.y_mean, stats_.y_std);
}

std::pair<Series, Series> DataNormalizer::normalize(const Series& x, const Series& y) const {
    require_finite(x, "Normalization");
    require_finite(y, "Normalization");
    return {scale(x, stats_.x_mean, stats_.x_std), scale(y, stats_.y_mean, stats_.y_std)};
}

Series DataNormalizer::normalize_input(const Series& x) const {
    require_finite(x, "Input normalization");
    return scale(x, stats_.x_mean, stats_.x_std);
}

Series DataNormalizer::denormalize_predictions(const Series& predictions_norm) const {
    require_finite(predictions_norm, "Denormalization");
    Series out(predictions_norm.size());
    for (size_t i = 0; i < predictions_norm.size(); ++i) {
        out[i] = predictions_norm[i] * stats_.y_std + stats_.y_mean;
    }
    return out;
}

LinearParameters DataNormalizer::get_original_scale_parameters(double theta0_norm,
                                                               double theta1_norm) const {
    if (!std::isfinite(theta0_norm) || !std::isfinite(theta1_norm)) {
        throw std::runtime_error("Parameter denormalization failed: non-finite parameter");
    }

    LinearParameters original;
    // theta0 depends on the de-normalized slope, so the slope comes first
    original.theta1 = theta1_norm * (stats_.y_std / stats_.x_std);
    original.theta0 = theta0_norm * stats_.y_std + stats_.y_mean - original.theta1 * stats_.x_mean;
    return original;
}

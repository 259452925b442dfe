#include "test_framework.hpp"
#include "../include/regression_trainer.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace {

std::vector<EpochResult> drain(EpochStream& stream) {
    std::vector<EpochResult> results;
    while (true) {
        EpochStep step = stream.next();
        if (step.status != EpochStatus::Epoch) {
            break;
        }
        results.push_back(step.result);
    }
    return results;
}

void noisy_line(Series& x, Series& y) {
    x.clear();
    y.clear();
    for (int i = 1; i <= 50; ++i) {
        x.push_back(i);
        y.push_back(2.0 * i + 3.0 + 0.8 * std::sin(1.7 * i));
    }
}

} // namespace

TEST(RegressionTrainer, exact_line_end_to_end) {
    RegressionTrainer trainer({1, 2, 3, 4, 5}, {2, 4, 6, 8, 10}, 7);
    TrainTestSplit split = trainer.train_test_split(0.8);
    TEST_ASSERT(split.x_train.size() == 4);
    TEST_ASSERT(split.x_test.size() == 1);
    trainer.set_training_data(split.x_train, split.y_train);

    EpochStream stream = trainer.train_epoch_by_epoch(0.1, 500, 1e-8, true);
    std::vector<EpochResult> results = drain(stream);
    TEST_ASSERT(!results.empty());
    TEST_ASSERT(results.size() <= 500);

    LinearParameters params = trainer.get_original_scale_parameters();
    TEST_APPROX(params.theta1, 2.0, 1e-2);
    TEST_APPROX(params.theta0, 0.0, 5e-2);
    TEST_APPROX(results.back().r2, 1.0, 1e-3);

    Series prediction = trainer.predict(split.x_test);
    TEST_APPROX(prediction[0], split.y_test[0], 5e-2);
}

TEST(RegressionTrainer, early_stopping_at_patience) {
    Series x, y;
    noisy_line(x, y);
    RegressionTrainer trainer(x, y, 1);

    EpochStream stream = trainer.train_epoch_by_epoch(0.01, 1000, 1e9, true);
    std::vector<EpochResult> results = drain(stream);

    TEST_ASSERT(results.size() == RegressionTrainer::EARLY_STOPPING_PATIENCE);
    TEST_ASSERT(results.back().epoch == 15);
    TEST_ASSERT(stream.exhausted());
    TEST_ASSERT(stream.epochs_completed() == 15);
    TEST_ASSERT(!stream.diverged());
}

TEST(RegressionTrainer, never_exceeds_max_epochs) {
    Series x, y;
    noisy_line(x, y);
    RegressionTrainer trainer(x, y, 1);

    EpochStream stream = trainer.train_epoch_by_epoch(0.01, 25, 0.0, false);
    std::vector<EpochResult> results = drain(stream);

    TEST_ASSERT(results.size() == 25);
    for (size_t i = 0; i < results.size(); ++i) {
        TEST_ASSERT(results[i].epoch == i + 1);
        TEST_ASSERT(results[i].max_epochs == 25);
        TEST_ASSERT(results[i].is_complete == (i + 1 == 25));
    }
    TEST_ASSERT(stream.next().status == EpochStatus::Finished);
    TEST_ASSERT(std::isinf(results.front().cost_change));
}

TEST(RegressionTrainer, cost_is_non_increasing) {
    Series x, y;
    noisy_line(x, y);
    RegressionTrainer trainer(x, y, 3);

    EpochStream stream = trainer.train_epoch_by_epoch(0.01, 300, 0.0, false);
    std::vector<EpochResult> results = drain(stream);

    TEST_ASSERT(results.size() == 300);
    for (size_t i = 1; i < results.size(); ++i) {
        TEST_ASSERT(results[i].cost <= results[i - 1].cost + 1e-12);
    }
    TEST_ASSERT(results.back().rmse < results.front().rmse);
}

TEST(RegressionTrainer, convergence_ends_run_without_early_stopping) {
    Series x, y;
    noisy_line(x, y);
    RegressionTrainer trainer(x, y, 3);

    EpochStream stream = trainer.train_epoch_by_epoch(0.5, 1000, 1e-6, false);
    std::vector<EpochResult> results = drain(stream);

    TEST_ASSERT(results.size() < 1000);
    TEST_ASSERT(results.back().converged);
    TEST_ASSERT(results.back().is_complete);
    TEST_ASSERT(!results.front().converged);
}

TEST(RegressionTrainer, divergence_keeps_last_finite_parameters) {
    Series x, y;
    noisy_line(x, y);
    RegressionTrainer trainer(x, y, 3);

    EpochStream stream = trainer.train_epoch_by_epoch(1e200, 100, 0.0, false);
    EpochStep first = stream.next();
    TEST_ASSERT(first.status == EpochStatus::Epoch);

    EpochStep second = stream.next();
    TEST_ASSERT(second.status == EpochStatus::Diverged);
    TEST_ASSERT(stream.diverged());
    TEST_ASSERT(stream.exhausted());
    TEST_ASSERT(stream.epochs_completed() == 1);

    LinearParameters theta = trainer.get_normalized_parameters();
    TEST_ASSERT(std::isfinite(theta.theta0) && std::isfinite(theta.theta1));
    TEST_ASSERT(theta.theta1 == first.result.theta1);
    TEST_ASSERT(stream.next().status == EpochStatus::Finished);
}

TEST(RegressionTrainer, split_is_a_seeded_permutation) {
    Series x, y;
    for (int i = 0; i < 10; ++i) {
        x.push_back(i);
        y.push_back(10 * i);
    }
    RegressionTrainer a(x, y, 42);
    RegressionTrainer b(x, y, 42);
    TrainTestSplit sa = a.train_test_split(0.8);
    TrainTestSplit sb = b.train_test_split(0.8);

    TEST_ASSERT(sa.x_train.size() == 8 && sa.x_test.size() == 2);
    TEST_ASSERT(sa.x_train == sb.x_train);

    Series all = sa.x_train;
    all.insert(all.end(), sa.x_test.begin(), sa.x_test.end());
    std::sort(all.begin(), all.end());
    TEST_ASSERT(all == x);
    for (size_t i = 0; i < sa.x_train.size(); ++i) {
        TEST_APPROX(sa.y_train[i], 10 * sa.x_train[i], 1e-12);
    }

    TEST_THROWS(a.train_test_split(0.0), std::invalid_argument);
    TEST_THROWS(a.train_test_split(1.0), std::invalid_argument);
}

TEST(RegressionTrainer, invalid_arguments) {
    TEST_THROWS(RegressionTrainer(Series{}, Series{}), std::invalid_argument);
    TEST_THROWS(RegressionTrainer(Series{1.0, 2.0}, Series{1.0}), std::invalid_argument);

    RegressionTrainer trainer({1, 2, 3}, {1, 2, 3}, 1);
    TEST_THROWS(trainer.train_epoch_by_epoch(0.0, 10), std::invalid_argument);
    TEST_THROWS(trainer.train_epoch_by_epoch(0.1, 0), std::invalid_argument);
    TEST_THROWS(trainer.train_epoch_by_epoch(0.1, 10, -1.0), std::invalid_argument);

    // A failed replacement keeps the previous data
    TEST_THROWS(trainer.set_training_data(Series{}, Series{}), std::invalid_argument);
    TEST_ASSERT(trainer.training_examples() == 3);

    TEST_THROWS(trainer.predict({std::nan("")}), std::runtime_error);
}

TEST(RegressionTrainer, model_summary) {
    RegressionTrainer trainer({1, 2, 3, 4}, {3, 5, 7, 9}, 1);
    TEST_ASSERT(!trainer.get_latest_metrics().has_value());

    EpochStream stream = trainer.train_epoch_by_epoch(0.1, 5, 0.0, false);
    drain(stream);

    ModelSummary summary = trainer.get_model_summary();
    TEST_ASSERT(summary.training_examples == 4);
    TEST_ASSERT(summary.metrics_summary.has_value());
    TEST_ASSERT(summary.equation_normalized.rfind("y_norm = ", 0) == 0);
    TEST_ASSERT(summary.equation_original ==
                format_equation(summary.original_theta0, summary.original_theta1));
    TEST_ASSERT(summary.final_cost >= 0.0);
    TEST_ASSERT(trainer.metrics().get_epoch_count() == 5);
    TEST_ASSERT(format_equation(1.0, 2.0) == "y = 1.0000 + 2.0000 * x");
}

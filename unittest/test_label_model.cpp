#include <cmath>
#include <limits>

#include "../src/core/errors.hpp"
#include "../src/ml/dependency.hpp"
#include "../src/ml/label_model.hpp"
#include "config.hpp"

using namespace wl;
using namespace test;

namespace {

    ml::FitOptions Quiet(int seed, double lr, int n_epochs) {
        ml::FitOptions options;
        options.seed = seed;
        options.learning_rate = lr;
        options.n_epochs = n_epochs;
        options.log_frequency = 0;
        return options;
    }

    // every function votes the true label, which cycles through the classes
    core::LabelMatrix PerfectVotes(int n, int nlfs, int cardinality,
                                   core::LabelVector & Y) {
        core::LabelMatrix L(n, nlfs);
        Y.resize(n);
        for (int i = 0; i < n; i++) {
            Y[i] = i % cardinality;
            L.row(i).setConstant(Y[i]);
        }
        return L;
    }
}

TEST(LabelModel, SparseMatrix) {
    core::LabelMatrix L = core::LabelMatrix::Constant(5, 3, core::Abstain);
    L(1, 0) = 0;
    L(3, 0) = 0;

    ml::DependencyOptions dep_options;
    dep_options.policy = ml::DependencyPolicy::Empty;
    ml::EdgeSet edges = ml::EstimateEdges(L, nullptr, dep_options);
    EXPECT_TRUE(edges.empty());

    ml::LabelModel model(3);
    EXPECT_EQ(ml::LabelModel::Unfitted, model.state());
    ASSERT_NO_THROW(model.fit(L, edges, 1, 0.01, 50, 10));
    EXPECT_EQ(ml::LabelModel::Fitted, model.state());
    EXPECT_EQ(3, model.nlfs());

    Eigen::MatrixXd probs = model.predictProba(L);
    ASSERT_EQ(5, probs.rows());
    ASSERT_EQ(3, probs.cols());
    ExpectRowStochastic(probs);
    // rows without votes follow the class balance
    EXPECT_NEAR(1.0 / 3, probs(0, 0), 1e-9);
    EXPECT_NEAR(1.0 / 3, probs(4, 2), 1e-9);
    EXPECT_GT(probs(1, 0), probs(1, 1));
    EXPECT_TRUE(std::isfinite(model.loss()));
}

TEST(LabelModel, NotFitted) {
    core::LabelMatrix L;
    core::LabelVector Y;
    MakeSyntheticLabels(20, 3, {0.8, 0.8}, 0.9, 1, L, Y);

    ml::LabelModel model(3);
    EXPECT_FALSE(model.fitted());
    EXPECT_THROW(model.predictProba(L), core::ModelNotFittedError);
    EXPECT_THROW(model.predict(L), core::ModelNotFittedError);
    EXPECT_THROW(model.score(L, Y), core::ModelNotFittedError);
    EXPECT_THROW(model.mu(), core::ModelNotFittedError);
    EXPECT_THROW(model.accuracies(), core::ModelNotFittedError);
    try {
        model.predictProba(L);
    } catch (const core::Error & e) {
        EXPECT_EQ(core::ErrorKind::ModelNotFitted, e.kind());
    }
}

TEST(LabelModel, InvalidConstruction) {
    EXPECT_THROW(ml::LabelModel(1), core::InvalidInput);
    EXPECT_THROW(ml::LabelModel(0), core::InvalidInput);
    EXPECT_NO_THROW(ml::LabelModel(2));
}

TEST(LabelModel, InvalidFitInput) {
    core::LabelMatrix L;
    core::LabelVector Y;
    MakeSyntheticLabels(50, 3, {0.8, 0.8, 0.8}, 0.9, 2, L, Y);
    ml::LabelModel model(3);

    EXPECT_THROW(model.fit(L, {}, Quiet(0, 0.0, 10)), core::InvalidInput);
    EXPECT_THROW(model.fit(L, {}, Quiet(0, -0.1, 10)), core::InvalidInput);
    EXPECT_THROW(
        model.fit(L, {}, Quiet(0, std::numeric_limits<double>::quiet_NaN(), 10)),
        core::InvalidInput);
    EXPECT_THROW(model.fit(L, {}, Quiet(0, 0.01, 0)), core::InvalidInput);

    auto options = Quiet(0, 0.01, 10);
    options.l2 = -1.0;
    EXPECT_THROW(model.fit(L, {}, options), core::InvalidInput);
    options.l2 = 0.0;
    options.precision_init = 1.5;
    EXPECT_THROW(model.fit(L, {}, options), core::InvalidInput);
    options.precision_init = 0.7;
    options.class_balance = {0.5, 0.5};
    EXPECT_THROW(model.fit(L, {}, options), core::ShapeMismatch);
    options.class_balance = {0.5, 0.5, -0.1};
    EXPECT_THROW(model.fit(L, {}, options), core::InvalidInput);

    EXPECT_THROW(model.fit(L, {{0, 3}}, Quiet(0, 0.01, 10)), core::InvalidInput);
    EXPECT_THROW(model.fit(L, {{1, 1}}, Quiet(0, 0.01, 10)), core::InvalidInput);
    EXPECT_THROW(model.fit(core::LabelMatrix(0, 3), {}, Quiet(0, 0.01, 10)),
                 core::InvalidInput);

    core::LabelMatrix out_of_range = L;
    out_of_range(0, 0) = 3;
    EXPECT_THROW(model.fit(out_of_range, {}, Quiet(0, 0.01, 10)),
                 core::InvalidInput);
    EXPECT_FALSE(model.fitted());

    // a rejected refit keeps the previous parameters
    model.fit(L, {}, Quiet(0, 0.01, 10));
    Eigen::MatrixXd mu = model.mu();
    EXPECT_THROW(model.fit(L, {}, Quiet(0, 0.0, 10)), core::InvalidInput);
    EXPECT_TRUE(model.fitted());
    EXPECT_TRUE(mu == model.mu());
}

TEST(LabelModel, Deterministic) {
    core::LabelMatrix L;
    core::LabelVector Y;
    MakeSyntheticLabels(300, 3, {0.8, 0.7, 0.75, 0.6}, 0.8, 3, L, Y);

    ml::LabelModel a(3), b(3), c(3);
    a.fit(L, {{0, 1}}, Quiet(7, 0.01, 50));
    b.fit(L, {{0, 1}}, Quiet(7, 0.01, 50));
    c.fit(L, {{0, 1}}, Quiet(8, 0.01, 50));

    EXPECT_TRUE(a.mu() == b.mu());
    EXPECT_TRUE(a.correlations()[0] == b.correlations()[0]);
    EXPECT_TRUE(a.predictProba(L) == b.predictProba(L));
    EXPECT_FALSE(a.mu() == c.mu());
}

TEST(LabelModel, Divergence) {
    core::LabelMatrix L;
    core::LabelVector Y;
    MakeSyntheticLabels(200, 3, {0.8, 0.7, 0.6, 0.9}, 1.0, 4, L, Y);

    ml::LabelModel model(3);
    try {
        model.fit(L, {}, Quiet(0, 1e6, 100));
        FAIL() << "FitDivergence expected";
    } catch (const core::FitDivergence & e) {
        EXPECT_EQ(core::ErrorKind::FitDivergence, e.kind());
        EXPECT_GE(e.epoch(), 0);
        EXPECT_LT(e.epoch(), 100);
    }
    EXPECT_EQ(ml::LabelModel::Unfitted, model.state());
    EXPECT_THROW(model.predictProba(L), core::ModelNotFittedError);

    // the model remains usable
    model.fit(L, {}, Quiet(0, 0.01, 20));
    EXPECT_TRUE(model.fitted());
}

TEST(LabelModel, RefitReplacesShape) {
    core::LabelMatrix L;
    core::LabelVector Y;
    MakeSyntheticLabels(100, 3, {0.8, 0.7, 0.6, 0.9}, 0.9, 5, L, Y);

    ml::LabelModel model(3);
    model.fit(L, {{2, 3}}, Quiet(0, 0.01, 20));
    EXPECT_EQ(4, model.nlfs());

    core::LabelMatrix narrow = L.leftCols(3);
    model.fit(narrow, {}, Quiet(0, 0.01, 20));
    EXPECT_EQ(3, model.nlfs());
    EXPECT_TRUE(model.edges().empty());
    EXPECT_TRUE(model.correlations().empty());
    EXPECT_NO_THROW(model.predictProba(narrow));
    try {
        model.predictProba(L);
        FAIL() << "ShapeMismatch expected";
    } catch (const core::ShapeMismatch & e) {
        EXPECT_EQ(3, e.expected());
        EXPECT_EQ(4, e.actual());
    }
}

TEST(LabelModel, EdgesAreNormalized) {
    core::LabelMatrix L;
    core::LabelVector Y;
    MakeSyntheticLabels(100, 3, {0.8, 0.7, 0.6, 0.9}, 0.9, 6, L, Y);

    ml::LabelModel model(3);
    model.fit(L, {{3, 1}, {1, 3}, {2, 0}}, Quiet(0, 0.01, 20));
    ml::EdgeSet expected = {{0, 2}, {1, 3}};
    EXPECT_EQ(expected, model.edges());
    ASSERT_EQ(2u, model.correlations().size());
    EXPECT_EQ(3, model.correlations()[0].rows());
    EXPECT_EQ(3, model.correlations()[0].cols());
}

TEST(LabelModel, EdgeDiscountsCopiedVotes) {
    core::LabelMatrix L;
    core::LabelVector Y;
    MakeSyntheticLabels(1000, 3, {0.7, 0.7, 0.7, 0.7}, 0.9, 7, L, Y);
    L.col(1) = L.col(0);

    core::LabelMatrix row(1, 4);
    row << 0, 0, 1, 1;

    ml::LabelModel independent(3), correlated(3);
    independent.fit(L, {}, Quiet(0, 0.01, 300));
    correlated.fit(L, {{0, 1}}, Quiet(0, 0.01, 300));

    // the copies agree far more often than their accuracies explain
    EXPECT_GT(correlated.correlations()[0](0, 0), 0.05);

    Eigen::MatrixXd p_independent = independent.predictProba(row);
    Eigen::MatrixXd p_correlated = correlated.predictProba(row);
    ExpectRowStochastic(p_correlated);
    EXPECT_LT(p_correlated(0, 0), p_independent(0, 0));
}

TEST(LabelModel, PerfectScore) {
    core::LabelVector Y;
    core::LabelMatrix L = PerfectVotes(30, 4, 3, Y);

    ml::LabelModel model(3);
    model.fit(L, {}, Quiet(0, 0.01, 100));
    Eigen::MatrixXd probs = model.predictProba(L);
    for (int i = 0; i < L.rows(); i++) {
        EXPECT_GT(probs(i, Y[i]), 0.99);
    }
    EXPECT_DOUBLE_EQ(1.0, model.score(L, Y, ml::Metric::Accuracy));
    EXPECT_DOUBLE_EQ(1.0, model.score(L, Y, ml::Metric::F1));

    // unlabeled gold rows do not count
    core::LabelVector partial = Y;
    partial[0] = core::Abstain;
    EXPECT_DOUBLE_EQ(1.0, model.score(L, partial));
}

TEST(LabelModel, ScoreChecksShapes) {
    core::LabelVector Y;
    core::LabelMatrix L = PerfectVotes(30, 4, 3, Y);
    ml::LabelModel model(3);
    model.fit(L, {}, Quiet(0, 0.01, 10));

    core::LabelVector short_Y = Y.head(29);
    EXPECT_THROW(model.score(L, short_Y), core::ShapeMismatch);
    core::LabelVector bad_Y = Y;
    bad_Y[3] = 5;
    EXPECT_THROW(model.score(L, bad_Y), core::InvalidInput);
    core::LabelVector unlabeled = core::LabelVector::Constant(30, core::Abstain);
    EXPECT_THROW(model.score(L, unlabeled), core::InvalidInput);
}

TEST(LabelModel, Accuracies) {
    core::LabelVector Y;
    core::LabelMatrix L = PerfectVotes(300, 4, 3, Y);
    // the last function votes at random
    std::mt19937 rng(9);
    std::uniform_int_distribution<int> cls(0, 2);
    for (int i = 0; i < L.rows(); i++) {
        L(i, 3) = cls(rng);
    }

    ml::LabelModel model(3);
    model.fit(L, {}, Quiet(0, 0.05, 500));
    Eigen::VectorXd accs = model.accuracies();
    ASSERT_EQ(4, accs.size());
    for (int j = 0; j < 3; j++) {
        EXPECT_GT(accs[j], accs[3]);
    }
    EXPECT_GE(accs.minCoeff(), 0.0);
    EXPECT_LE(accs.maxCoeff(), 1.0);
}

TEST(LabelModel, ConditionalProbabilities) {
    core::LabelMatrix L;
    core::LabelVector Y;
    MakeSyntheticLabels(500, 3, {0.8, 0.7, 0.6}, 0.6, 10, L, Y);

    ml::LabelModel model(3);
    model.fit(L, {}, Quiet(0, 0.01, 100));
    for (int j = 0; j < 3; j++) {
        Eigen::MatrixXd cprobs = model.conditionalProbabilities(j);
        ASSERT_EQ(4, cprobs.rows());
        ASSERT_EQ(3, cprobs.cols());
        for (int y = 0; y < 3; y++) {
            EXPECT_NEAR(1.0, cprobs.col(y).sum(), 1e-9);
        }
        EXPECT_GE(cprobs.minCoeff(), 0.0);
        EXPECT_LE(cprobs.maxCoeff(), 1.0);
    }
    EXPECT_THROW(model.conditionalProbabilities(3), core::InvalidInput);
    EXPECT_THROW(model.conditionalProbabilities(-1), core::InvalidInput);
}

TEST(LabelModel, SyntheticAccuracy) {
    core::LabelMatrix L;
    core::LabelVector Y;
    MakeSyntheticLabels(2000, 3, {0.85, 0.8, 0.75, 0.8, 0.7}, 0.9, 11, L, Y);

    ml::LabelModel model(3);
    ml::FitOptions options = Quiet(123, 0.01, 200);
    model.fit(L, {}, options);

    Eigen::MatrixXd probs = model.predictProba(L);
    ExpectRowStochastic(probs);
    core::LabelVector pred = model.predict(L);
    ASSERT_EQ(L.rows(), pred.size());
    EXPECT_GE(pred.minCoeff(), 0);
    EXPECT_LT(pred.maxCoeff(), 3);
    EXPECT_GT(model.score(L, Y), 0.85);
    EXPECT_TRUE(model.classBalance().isApprox(Eigen::VectorXd::Constant(3, 1.0 / 3)));
}

TEST(LabelModel, ClassBalance) {
    core::LabelMatrix L;
    core::LabelVector Y;
    MakeSyntheticLabels(100, 2, {0.8, 0.8, 0.8}, 0.9, 12, L, Y);

    ml::LabelModel model(2);
    ml::FitOptions options = Quiet(0, 0.01, 20);
    options.class_balance = {3.0, 1.0};
    model.fit(L, {}, options);
    EXPECT_NEAR(0.75, model.classBalance()[0], 1e-12);
    EXPECT_NEAR(0.25, model.classBalance()[1], 1e-12);

    // without votes only the prior speaks
    core::LabelMatrix silent = core::LabelMatrix::Constant(1, 3, core::Abstain);
    EXPECT_NEAR(0.75, model.predictProba(silent)(0, 0), 1e-9);
}

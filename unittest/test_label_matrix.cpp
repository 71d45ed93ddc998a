#include <cmath>
#include <limits>
#include <sstream>

#include "../src/core/errors.hpp"
#include "../src/core/label_matrix.hpp"
#include "../src/core/statistics.hpp"
#include "config.hpp"

using namespace wl;
using namespace test;

TEST(LabelMatrix, Check) {
    core::LabelMatrix L(2, 3);
    L << 0, -1, 2, 1, 1, -1;
    EXPECT_NO_THROW(core::CheckLabelMatrix(L, 3));
    EXPECT_THROW(core::CheckLabelMatrix(L, 2), core::InvalidInput);
    EXPECT_THROW(core::CheckLabelMatrix(L, 1), core::InvalidInput);

    L(0, 1) = -2;
    EXPECT_THROW(core::CheckLabelMatrix(L, 3), core::InvalidInput);
}

TEST(LabelMatrix, CheckGoldLabels) {
    core::LabelMatrix L = core::LabelMatrix::Constant(3, 2, core::Abstain);
    core::LabelVector Y(3);
    Y << 0, -1, 2;
    EXPECT_NO_THROW(core::CheckGoldLabels(L, Y, 3));

    core::LabelVector short_Y(2);
    short_Y << 0, 1;
    try {
        core::CheckGoldLabels(L, short_Y, 3);
        FAIL() << "ShapeMismatch expected";
    } catch (const core::ShapeMismatch & e) {
        EXPECT_EQ(core::ErrorKind::ShapeMismatch, e.kind());
        EXPECT_EQ(3, e.expected());
        EXPECT_EQ(2, e.actual());
    }

    Y[1] = 3;
    EXPECT_THROW(core::CheckGoldLabels(L, Y, 3), core::InvalidInput);
}

TEST(LabelMatrix, IndicatorMatrix) {
    core::LabelMatrix L(2, 2);
    L << 0, -1, 2, 1;
    Eigen::MatrixXd X = core::IndicatorMatrix(L, 3);
    ASSERT_EQ(2, X.rows());
    ASSERT_EQ(6, X.cols());

    Eigen::MatrixXd expected(2, 6);
    expected << 1, 0, 0, 0, 0, 0, 0, 0, 1, 0, 1, 0;
    EXPECT_TRUE(X == expected);
}

TEST(LabelMatrix, NormalizeEdges) {
    core::EdgeSet edges = {{2, 0}, {0, 2}, {1, 3}, {0, 1}};
    core::EdgeSet normalized = core::NormalizeEdges(edges, 4);
    core::EdgeSet expected = {{0, 1}, {0, 2}, {1, 3}};
    EXPECT_EQ(expected, normalized);

    EXPECT_THROW(core::NormalizeEdges({{1, 1}}, 4), core::InvalidInput);
    EXPECT_THROW(core::NormalizeEdges({{0, 4}}, 4), core::InvalidInput);
    EXPECT_THROW(core::NormalizeEdges({{-1, 2}}, 4), core::InvalidInput);
    EXPECT_TRUE(core::NormalizeEdges({}, 4).empty());
}

TEST(LabelMatrix, ReadAndWrite) {
    std::istringstream in("# three functions\n"
                          "0, -1, 2\n"
                          "\n"
                          "1 1 -1   # trailing comment\n");
    core::LabelMatrix L = core::ReadLabelMatrix(in);
    ASSERT_EQ(2, L.rows());
    ASSERT_EQ(3, L.cols());
    EXPECT_EQ(2, L(0, 2));
    EXPECT_EQ(-1, L(1, 2));

    std::istringstream ragged("0 1\n1\n");
    EXPECT_THROW(core::ReadLabelMatrix(ragged), core::ShapeMismatch);

    std::istringstream garbage("0 x 1\n");
    EXPECT_THROW(core::ReadLabelMatrix(garbage), core::InvalidInput);

    std::istringstream gold("0\n2\n-1 1\n");
    core::LabelVector Y = core::ReadLabelVector(gold);
    ASSERT_EQ(4, Y.size());
    EXPECT_EQ(-1, Y[2]);

    std::ostringstream out;
    Eigen::MatrixXd probs(2, 2);
    probs << 0.25, 0.75, 1, 0;
    core::WriteMatrix(out, probs);
    EXPECT_EQ("0.25 0.75\n1 0\n", out.str());
}

TEST(Statistics, PluralityVote) {
    core::LabelMatrix L(1, 5);
    L << 0, 1, 1, -1, 0;
    EXPECT_EQ(core::Abstain, core::PluralityVote(core::VoteCounts(L, 0, 3)));
    EXPECT_EQ(1, core::PluralityVote(core::VoteCounts(L, 0, 3, 0)));
    EXPECT_EQ(0, core::PluralityVote(core::VoteCounts(L, 0, 3, 1, 2)));

    core::LabelMatrix none = core::LabelMatrix::Constant(1, 3, core::Abstain);
    EXPECT_EQ(core::Abstain, core::PluralityVote(core::VoteCounts(none, 0, 3)));
}

TEST(Statistics, ArgMaxTieBreak) {
    Eigen::VectorXd v(3);
    v << 0.4, 0.4, 0.2;
    EXPECT_EQ(0, core::ArgMax(v));
    v << 0.2, 0.4, 0.4;
    EXPECT_EQ(1, core::ArgMax(v));
}

TEST(Statistics, EntropyAndMutualInformation) {
    Eigen::VectorXd uniform = Eigen::VectorXd::Constant(4, 5.0);
    EXPECT_NEAR(std::log(4.0), core::Entropy(uniform), 1e-12);
    EXPECT_EQ(0.0, core::Entropy(Eigen::VectorXd::Zero(3)));

    Eigen::MatrixXd identical = Eigen::MatrixXd::Identity(2, 2) * 10;
    EXPECT_NEAR(std::log(2.0), core::MutualInformation(identical), 1e-12);
    Eigen::MatrixXd independent = Eigen::MatrixXd::Constant(2, 2, 3.0);
    EXPECT_NEAR(0.0, core::MutualInformation(independent), 1e-12);
}

TEST(Statistics, RVCoefficient) {
    Eigen::MatrixXd A(4, 2);
    A << 1, 0, 0, 1, 1, 0, 0, 1;
    EXPECT_NEAR(1.0, core::RVCoefficient(A, A), 1e-12);

    Eigen::MatrixXd B(4, 2);
    B << 1, 0, 1, 0, 0, 1, 0, 1;
    EXPECT_NEAR(0.0, core::RVCoefficient(A, B), 1e-12);

    // constant votes carry no covariance
    Eigen::MatrixXd C(4, 2);
    C << 1, 0, 1, 0, 1, 0, 1, 0;
    EXPECT_EQ(0.0, core::RVCoefficient(A, C));
}

TEST(Statistics, SoftmaxRows) {
    Eigen::MatrixXd scores(3, 3);
    double inf = std::numeric_limits<double>::infinity();
    scores << 0, 0, 0, 1000, 0, -1000, -inf, -inf, -inf;
    Eigen::MatrixXd probs = core::SoftmaxRows(scores);
    ExpectRowStochastic(probs);
    EXPECT_NEAR(1.0 / 3, probs(0, 0), 1e-12);
    EXPECT_NEAR(1.0, probs(1, 0), 1e-12);
    EXPECT_NEAR(1.0 / 3, probs(2, 2), 1e-12);
}

#include "gtest/gtest.h"

#include "config.hpp"

namespace wl {
    namespace test {

        std::string ProjectDataDirStrings::Base = WEAKLABEL_TEST_DATA_DIR_STR;
        std::string ProjectDataDirStrings::Relations =
            WEAKLABEL_TEST_DATA_DIR_STR "/relations";

        void MakeSyntheticLabels(int n, int cardinality,
                                 const std::vector<double> & accuracies,
                                 double coverage, unsigned seed, core::LabelMatrix & L,
                                 core::LabelVector & Y) {
            std::mt19937 rng(seed);
            std::uniform_real_distribution<double> unit(0.0, 1.0);
            std::uniform_int_distribution<int> cls(0, cardinality - 1);
            std::uniform_int_distribution<int> shift(1, cardinality - 1);
            int m = accuracies.size();
            L.resize(n, m);
            Y.resize(n);
            for (int i = 0; i < n; i++) {
                Y[i] = cls(rng);
                for (int j = 0; j < m; j++) {
                    if (unit(rng) >= coverage) {
                        L(i, j) = core::Abstain;
                    } else if (unit(rng) < accuracies[j]) {
                        L(i, j) = Y[i];
                    } else {
                        L(i, j) = (Y[i] + shift(rng)) % cardinality;
                    }
                }
            }
        }

        void ExpectRowStochastic(const Eigen::MatrixXd & probs) {
            ASSERT_TRUE(probs.allFinite());
            for (int i = 0; i < probs.rows(); i++) {
                EXPECT_NEAR(probs.row(i).sum(), 1.0, 1e-9);
                EXPECT_GE(probs.row(i).minCoeff(), 0.0);
            }
        }
    }
}

int main(int argc, char * argv[], char * envp[]) {
    testing::InitGoogleTest(&argc, argv);

    // testing::GTEST_FLAG(catch_exceptions) = false;
    // testing::GTEST_FLAG(filter) = "LabelModel.*";
    // testing::GTEST_FLAG(filter) = "DependencyEstimator.*";
    return RUN_ALL_TESTS();
}

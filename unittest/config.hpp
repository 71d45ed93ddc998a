#pragma once

#include <chrono>
#include <iostream>
#include <random>
#include <vector>

#include "gtest/gtest.h"

#include "../src/core/label_matrix.hpp"

namespace wl {
    namespace test {

        struct ProjectDataDirStrings {
            static std::string Base;
            static std::string Relations;
        };

        // Y uniform over classes; lf j votes with probability coverage, correctly
        // with probability accuracies[j], otherwise a uniformly chosen wrong class
        void MakeSyntheticLabels(int n, int cardinality,
                                 const std::vector<double> & accuracies,
                                 double coverage, unsigned seed, core::LabelMatrix & L,
                                 core::LabelVector & Y);

        void ExpectRowStochastic(const Eigen::MatrixXd & probs);
    }
}

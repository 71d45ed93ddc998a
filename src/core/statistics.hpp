#pragma once

#include <Eigen/Dense>

#include "label_matrix.hpp"

namespace wl {
    namespace core {

        // vote counts per class of one row, skipping the given columns
        Eigen::VectorXi VoteCounts(const LabelMatrix & L, int row, int cardinality,
                                   int skip1 = -1, int skip2 = -1);

        // the unique most voted class, Abstain on ties or no votes
        int PluralityVote(const Eigen::VectorXi & counts);

        // index of the largest entry, lowest index on ties
        int ArgMax(const Eigen::VectorXd & v);

        // Shannon entropy (nats) of a count or probability vector
        double Entropy(const Eigen::VectorXd & counts);

        // mutual information (nats) of a joint count table
        double MutualInformation(const Eigen::MatrixXd & joint);

        // RV coefficient between the columns of A and B, in [0, 1].
        // A and B must have the same number of rows. The result is 0 when either
        // side has no variance, callers handle constant columns themselves
        double RVCoefficient(const Eigen::MatrixXd & A, const Eigen::MatrixXd & B);

        // row-wise softmax of log scores; non-finite rows fall back to uniform
        Eigen::MatrixXd SoftmaxRows(const Eigen::MatrixXd & scores);
    }
}

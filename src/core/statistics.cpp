#include <algorithm>
#include <cassert>
#include <cmath>

#include "statistics.hpp"

namespace wl {
    namespace core {

        Eigen::VectorXi VoteCounts(const LabelMatrix & L, int row, int cardinality,
                                   int skip1, int skip2) {
            Eigen::VectorXi counts = Eigen::VectorXi::Zero(cardinality);
            for (int j = 0; j < L.cols(); j++) {
                if (j == skip1 || j == skip2 || L(row, j) == Abstain)
                    continue;
                counts[L(row, j)]++;
            }
            return counts;
        }

        int PluralityVote(const Eigen::VectorXi & counts) {
            int best = Abstain;
            int best_count = 0;
            bool tied = false;
            for (int c = 0; c < counts.size(); c++) {
                if (counts[c] > best_count) {
                    best = c;
                    best_count = counts[c];
                    tied = false;
                } else if (counts[c] == best_count && best_count > 0) {
                    tied = true;
                }
            }
            return tied ? Abstain : best;
        }

        int ArgMax(const Eigen::VectorXd & v) {
            int best = 0;
            for (int i = 1; i < v.size(); i++) {
                if (v[i] > v[best])
                    best = i;
            }
            return best;
        }

        double Entropy(const Eigen::VectorXd & counts) {
            double total = counts.sum();
            if (total <= 0)
                return 0.0;
            double h = 0.0;
            for (int i = 0; i < counts.size(); i++) {
                if (counts[i] > 0) {
                    double p = counts[i] / total;
                    h -= p * std::log(p);
                }
            }
            return h;
        }

        double MutualInformation(const Eigen::MatrixXd & joint) {
            double total = joint.sum();
            if (total <= 0)
                return 0.0;
            Eigen::VectorXd pa = joint.rowwise().sum() / total;
            Eigen::VectorXd pb = joint.colwise().sum().transpose() / total;
            double mi = 0.0;
            for (int a = 0; a < joint.rows(); a++) {
                for (int b = 0; b < joint.cols(); b++) {
                    double pab = joint(a, b) / total;
                    if (pab > 0)
                        mi += pab * std::log(pab / (pa[a] * pb[b]));
                }
            }
            // rounding can leave tiny negatives
            return std::max(mi, 0.0);
        }

        double RVCoefficient(const Eigen::MatrixXd & A, const Eigen::MatrixXd & B) {
            assert(A.rows() == B.rows());
            if (A.rows() < 2)
                return 0.0;
            Eigen::MatrixXd Ac = A.rowwise() - A.colwise().mean();
            Eigen::MatrixXd Bc = B.rowwise() - B.colwise().mean();
            double n = A.rows();
            Eigen::MatrixXd Cab = Ac.transpose() * Bc / n;
            Eigen::MatrixXd Caa = Ac.transpose() * Ac / n;
            Eigen::MatrixXd Cbb = Bc.transpose() * Bc / n;
            double denom = Caa.norm() * Cbb.norm();
            if (denom < 1e-12)
                return 0.0;
            return std::min(Cab.squaredNorm() / denom, 1.0);
        }

        Eigen::MatrixXd SoftmaxRows(const Eigen::MatrixXd & scores) {
            Eigen::MatrixXd probs(scores.rows(), scores.cols());
            for (int i = 0; i < scores.rows(); i++) {
                double m = scores.row(i).maxCoeff();
                Eigen::RowVectorXd e = (scores.row(i).array() - m).exp().matrix();
                double z = e.sum();
                if (!std::isfinite(m) || !std::isfinite(z) || z <= 0 || !e.allFinite()) {
                    probs.row(i).setConstant(1.0 / scores.cols());
                } else {
                    probs.row(i) = e.cwiseMax(0.0) / z;
                }
            }
            return probs;
        }
    }
}

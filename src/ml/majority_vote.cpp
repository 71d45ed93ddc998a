#include "majority_vote.hpp"
#include "../core/statistics.hpp"

namespace wl {
    namespace ml {

        using namespace core;

        MajorityLabelVoter::MajorityLabelVoter(int cardinality)
            : _cardinality(cardinality) {
            CheckCardinality(cardinality);
        }

        Eigen::MatrixXd MajorityLabelVoter::predictProba(const LabelMatrix & L) const {
            CheckLabelMatrix(L, _cardinality);
            Eigen::MatrixXd probs(L.rows(), _cardinality);
            for (int i = 0; i < L.rows(); i++) {
                Eigen::VectorXd counts = VoteCounts(L, i, _cardinality).cast<double>();
                double total = counts.sum();
                if (total > 0) {
                    probs.row(i) = counts.transpose() / total;
                } else {
                    probs.row(i).setConstant(1.0 / _cardinality);
                }
            }
            return probs;
        }

        LabelVector MajorityLabelVoter::predict(const LabelMatrix & L) const {
            Eigen::MatrixXd probs = predictProba(L);
            LabelVector pred(L.rows());
            for (int i = 0; i < L.rows(); i++) {
                pred[i] = ArgMax(probs.row(i).transpose());
            }
            return pred;
        }

        double MajorityLabelVoter::score(const LabelMatrix & L, const LabelVector & Y,
                                         Metric metric) const {
            CheckGoldLabels(L, Y, _cardinality);
            return Score(Y, predict(L), _cardinality, metric);
        }
    }
}

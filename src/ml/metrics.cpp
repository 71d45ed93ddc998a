#include "metrics.hpp"
#include "../core/errors.hpp"
#include "../core/label_matrix.hpp"
#include "../core/macros.hpp"

namespace wl {
    namespace ml {

        const char * MetricName(Metric metric) {
            switch (metric) {
                case Metric::Accuracy:
                    return "accuracy";
                case Metric::Precision:
                    return "precision";
                case Metric::Recall:
                    return "recall";
                case Metric::F1:
                    return "f1";
                default:
                    SHOULD_NEVER_BE_CALLED();
            }
        }

        Metric MetricFromName(const std::string & name) {
            for (auto metric :
                 {Metric::Accuracy, Metric::Precision, Metric::Recall, Metric::F1}) {
                if (name == MetricName(metric))
                    return metric;
            }
            throw core::InvalidInput("metric", "unknown metric \"" + name + "\"");
        }

        Eigen::MatrixXi ConfusionMatrix(const Eigen::VectorXi & gold,
                                        const Eigen::VectorXi & pred, int cardinality) {
            if (gold.size() != pred.size()) {
                throw core::ShapeMismatch("predictions", gold.size(), pred.size());
            }
            Eigen::MatrixXi confusion = Eigen::MatrixXi::Zero(cardinality, cardinality);
            for (int i = 0; i < gold.size(); i++) {
                if (gold[i] == core::Abstain)
                    continue;
                if (gold[i] < 0 || gold[i] >= cardinality || pred[i] < 0 ||
                    pred[i] >= cardinality) {
                    throw core::InvalidInput("labels", "class out of range at row " +
                                                           std::to_string(i));
                }
                confusion(gold[i], pred[i])++;
            }
            return confusion;
        }

        double Score(const Eigen::VectorXi & gold, const Eigen::VectorXi & pred,
                     int cardinality, Metric metric) {
            Eigen::MatrixXi confusion = ConfusionMatrix(gold, pred, cardinality);
            int total = confusion.sum();
            if (total == 0) {
                throw core::InvalidInput("Y", "no labeled rows to score");
            }
            if (metric == Metric::Accuracy) {
                return static_cast<double>(confusion.trace()) / total;
            }

            // macro average over classes present in gold or predictions
            double sum = 0.0;
            int nclasses = 0;
            for (int c = 0; c < cardinality; c++) {
                int tp = confusion(c, c);
                int gold_c = confusion.row(c).sum();
                int pred_c = confusion.col(c).sum();
                if (gold_c == 0 && pred_c == 0)
                    continue;
                double precision = pred_c > 0 ? static_cast<double>(tp) / pred_c : 0.0;
                double recall = gold_c > 0 ? static_cast<double>(tp) / gold_c : 0.0;
                switch (metric) {
                    case Metric::Precision:
                        sum += precision;
                        break;
                    case Metric::Recall:
                        sum += recall;
                        break;
                    case Metric::F1:
                        sum += precision + recall > 0
                                   ? 2 * precision * recall / (precision + recall)
                                   : 0.0;
                        break;
                    default:
                        SHOULD_NEVER_BE_CALLED();
                }
                nclasses++;
            }
            return sum / nclasses;
        }
    }
}

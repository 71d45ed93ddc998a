#pragma once

#include <string>

#include <Eigen/Dense>

namespace wl {
    namespace ml {

        // precision, recall and f1 are macro averages over classes
        enum class Metric { Accuracy, Precision, Recall, F1 };

        const char * MetricName(Metric metric);
        // accepts "accuracy", "precision", "recall", "f1"
        Metric MetricFromName(const std::string & name);

        // cardinality x cardinality, entry (g, p) counts gold g predicted as p;
        // gold entries equal to Abstain are skipped
        Eigen::MatrixXi ConfusionMatrix(const Eigen::VectorXi & gold,
                                        const Eigen::VectorXi & pred, int cardinality);

        double Score(const Eigen::VectorXi & gold, const Eigen::VectorXi & pred,
                     int cardinality, Metric metric);
    }
}

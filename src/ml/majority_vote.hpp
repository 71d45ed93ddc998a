#pragma once

#include <Eigen/Dense>

#include "../core/label_matrix.hpp"
#include "metrics.hpp"

namespace wl {
    namespace ml {

        using core::LabelMatrix;
        using core::LabelVector;

        // baseline that needs no fitting: class probabilities are vote shares
        class MajorityLabelVoter {
        public:
            explicit MajorityLabelVoter(int cardinality = 3);

            // all-abstain rows get the uniform distribution
            Eigen::MatrixXd predictProba(const LabelMatrix & L) const;
            // lowest class on ties
            LabelVector predict(const LabelMatrix & L) const;
            double score(const LabelMatrix & L, const LabelVector & Y,
                         Metric metric = Metric::Accuracy) const;

            int cardinality() const { return _cardinality; }

        private:
            int _cardinality;
        };
    }
}

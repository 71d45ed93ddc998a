#pragma once

#include <vector>

#include "../core/label_matrix.hpp"

namespace wl {
    namespace ml {

        using core::LabelMatrix;
        using core::LabelVector;

        struct LFSummary {
            // fraction of rows the function votes on
            double coverage = 0.0;
            // fraction of rows where it votes together with another function
            double overlaps = 0.0;
            // fraction of rows where another function votes differently
            double conflicts = 0.0;
            // classes it ever votes, ascending
            std::vector<int> polarity;
            // filled only when gold labels are given
            int correct = 0;
            int incorrect = 0;
            double empirical_accuracy = 0.0;
        };

        std::vector<LFSummary> AnalyzeLabelingFunctions(const LabelMatrix & L,
                                                        int cardinality,
                                                        const LabelVector * gold =
                                                            nullptr);

        // fraction of rows with at least one vote
        double LabelCoverage(const LabelMatrix & L);
    }
}

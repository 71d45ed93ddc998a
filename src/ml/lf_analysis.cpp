#include "lf_analysis.hpp"

namespace wl {
    namespace ml {

        using namespace core;

        std::vector<LFSummary> AnalyzeLabelingFunctions(const LabelMatrix & L,
                                                        int cardinality,
                                                        const LabelVector * gold) {
            CheckLabelMatrix(L, cardinality);
            if (gold) {
                CheckGoldLabels(L, *gold, cardinality);
            }
            const int n = L.rows(), m = L.cols();
            std::vector<LFSummary> summaries(m);
            if (n == 0)
                return summaries;

            for (int j = 0; j < m; j++) {
                LFSummary & s = summaries[j];
                std::vector<bool> voted_classes(cardinality, false);
                int covered = 0, overlapped = 0, conflicted = 0;
                for (int i = 0; i < n; i++) {
                    int v = L(i, j);
                    if (v == Abstain)
                        continue;
                    covered++;
                    voted_classes[v] = true;
                    bool overlap = false, conflict = false;
                    for (int jj = 0; jj < m; jj++) {
                        if (jj == j || L(i, jj) == Abstain)
                            continue;
                        overlap = true;
                        conflict = conflict || L(i, jj) != v;
                    }
                    overlapped += overlap;
                    conflicted += conflict;
                    if (gold && (*gold)[i] != Abstain) {
                        if ((*gold)[i] == v) {
                            s.correct++;
                        } else {
                            s.incorrect++;
                        }
                    }
                }
                s.coverage = static_cast<double>(covered) / n;
                s.overlaps = static_cast<double>(overlapped) / n;
                s.conflicts = static_cast<double>(conflicted) / n;
                for (int c = 0; c < cardinality; c++) {
                    if (voted_classes[c])
                        s.polarity.push_back(c);
                }
                if (s.correct + s.incorrect > 0) {
                    s.empirical_accuracy =
                        static_cast<double>(s.correct) / (s.correct + s.incorrect);
                }
            }
            return summaries;
        }

        double LabelCoverage(const LabelMatrix & L) {
            if (L.rows() == 0)
                return 0.0;
            int covered = 0;
            for (int i = 0; i < L.rows(); i++) {
                covered += (L.row(i).array() != Abstain).any();
            }
            return static_cast<double>(covered) / L.rows();
        }
    }
}

#pragma once

#include <iosfwd>
#include <utility>
#include <vector>

#include <Eigen/Dense>

namespace wl {
    namespace core {

        // a labeling function's explicit non-vote
        constexpr int Abstain = -1;

        // rows = examples, columns = labeling functions
        using LabelMatrix =
            Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
        // gold labels, Abstain for unlabeled rows
        using LabelVector = Eigen::VectorXi;

        // unordered pair of labeling functions, stored with first < second
        using Edge = std::pair<int, int>;
        using EdgeSet = std::vector<Edge>;

        void CheckCardinality(int cardinality);
        void CheckLabelMatrix(const LabelMatrix & L, int cardinality);
        void CheckGoldLabels(const LabelMatrix & L, const LabelVector & Y,
                             int cardinality);

        // validates, orders and deduplicates edges over nlfs labeling functions
        EdgeSet NormalizeEdges(const EdgeSet & edges, int nlfs);

        // n x (m * cardinality), column j * cardinality + c is 1 iff lf j votes c
        Eigen::MatrixXd IndicatorMatrix(const LabelMatrix & L, int cardinality);

        // whitespace or comma separated integers, one row per line
        LabelMatrix ReadLabelMatrix(std::istream & in);
        LabelVector ReadLabelVector(std::istream & in);
        void WriteMatrix(std::ostream & out, const Eigen::MatrixXd & m);
    }
}

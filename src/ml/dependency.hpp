#pragma once

#include <string>

#include "../core/label_matrix.hpp"

namespace wl {
    namespace ml {

        using core::Edge;
        using core::EdgeSet;
        using core::LabelMatrix;
        using core::LabelVector;

        enum class DependencyPolicy {
            Empty,             // no edges, the independent voters baseline
            Covariance,        // marginal covariance of co-votes
            GoldCovariance,    // covariance within each gold class, needs Y
            ConditionalEntropy // conditional mutual information given Y or a vote
        };

        const char * PolicyName(DependencyPolicy policy);
        // accepts "empty", "covariance", "gold_covariance", "entropy"
        DependencyPolicy PolicyFromName(const std::string & name);
        bool PolicyRequiresGold(DependencyPolicy policy);

        struct DependencyOptions {
            int cardinality = 3;
            // a pair becomes an edge when its statistic exceeds this, in [0, 1]
            double threshold = 0.1;
            DependencyPolicy policy = DependencyPolicy::Covariance;
            // pairs (or classes) with fewer co-voting rows score 0
            int min_overlap = 2;
        };

        struct DependencyEstimate {
            EdgeSet edges;
            // symmetric nlfs x nlfs matrix of pair statistics, zero diagonal
            Eigen::MatrixXd statistics;
        };

        // gold may be nullptr unless the policy requires it
        DependencyEstimate EstimateDependencies(const LabelMatrix & L,
                                                const LabelVector * gold,
                                                const DependencyOptions & options);

        inline EdgeSet EstimateEdges(const LabelMatrix & L, const LabelVector * gold,
                                     const DependencyOptions & options) {
            return EstimateDependencies(L, gold, options).edges;
        }

        // per-policy pair statistics, inputs are assumed to be checked
        Eigen::MatrixXd CovarianceStatistics(const LabelMatrix & L, int cardinality,
                                             int min_overlap);
        Eigen::MatrixXd GoldCovarianceStatistics(const LabelMatrix & L,
                                                 const LabelVector & gold,
                                                 int cardinality, int min_overlap);
        Eigen::MatrixXd ConditionalEntropyStatistics(const LabelMatrix & L,
                                                     const LabelVector * gold,
                                                     int cardinality,
                                                     int min_overlap);
    }
}

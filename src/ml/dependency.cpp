#include <algorithm>
#include <cmath>
#include <vector>

#include "../core/errors.hpp"
#include "../core/macros.hpp"
#include "../core/statistics.hpp"
#include "dependency.hpp"

namespace wl {
    namespace ml {

        using namespace core;

        const char * PolicyName(DependencyPolicy policy) {
            switch (policy) {
                case DependencyPolicy::Empty:
                    return "empty";
                case DependencyPolicy::Covariance:
                    return "covariance";
                case DependencyPolicy::GoldCovariance:
                    return "gold_covariance";
                case DependencyPolicy::ConditionalEntropy:
                    return "entropy";
                default:
                    SHOULD_NEVER_BE_CALLED();
            }
        }

        DependencyPolicy PolicyFromName(const std::string & name) {
            for (auto policy :
                 {DependencyPolicy::Empty, DependencyPolicy::Covariance,
                  DependencyPolicy::GoldCovariance,
                  DependencyPolicy::ConditionalEntropy}) {
                if (name == PolicyName(policy))
                    return policy;
            }
            throw InvalidInput("policy", "unknown dependency policy \"" + name + "\"");
        }

        bool PolicyRequiresGold(DependencyPolicy policy) {
            return policy == DependencyPolicy::GoldCovariance;
        }

        namespace {

            // one-hot votes of columns i and j on the selected rows
            void CoVotes(const LabelMatrix & L, int i, int j, int cardinality,
                         const std::vector<int> & rows, Eigen::MatrixXd & A,
                         Eigen::MatrixXd & B) {
                A = Eigen::MatrixXd::Zero(rows.size(), cardinality);
                B = Eigen::MatrixXd::Zero(rows.size(), cardinality);
                for (int r = 0; r < rows.size(); r++) {
                    A(r, L(rows[r], i)) = 1.0;
                    B(r, L(rows[r], j)) = 1.0;
                }
            }

            std::vector<int> CoVotingRows(const LabelMatrix & L, int i, int j) {
                std::vector<int> rows;
                for (int r = 0; r < L.rows(); r++) {
                    if (L(r, i) != Abstain && L(r, j) != Abstain)
                        rows.push_back(r);
                }
                return rows;
            }

            bool VotesOneClass(const LabelMatrix & L, int col,
                               const std::vector<int> & rows) {
                for (int r : rows) {
                    if (L(r, col) != L(rows.front(), col))
                        return false;
                }
                return true;
            }

            // fraction of the selected rows on which columns i and j vote alike
            double AgreementRate(const LabelMatrix & L, int i, int j,
                                 const std::vector<int> & rows) {
                int agree = 0;
                for (int r : rows) {
                    if (L(r, i) == L(r, j))
                        agree++;
                }
                return double(agree) / rows.size();
            }
        }

        Eigen::MatrixXd CovarianceStatistics(const LabelMatrix & L, int cardinality,
                                             int min_overlap) {
            int m = L.cols();
            Eigen::MatrixXd stats = Eigen::MatrixXd::Zero(m, m);
            Eigen::MatrixXd A, B;
            for (int i = 0; i < m; i++) {
                for (int j = i + 1; j < m; j++) {
                    auto rows = CoVotingRows(L, i, j);
                    if (rows.size() < std::max(min_overlap, 2))
                        continue;
                    // a column voting one class has no covariance with anything
                    if (VotesOneClass(L, i, rows) || VotesOneClass(L, j, rows)) {
                        stats(i, j) = stats(j, i) = AgreementRate(L, i, j, rows);
                        continue;
                    }
                    CoVotes(L, i, j, cardinality, rows, A, B);
                    stats(i, j) = stats(j, i) = RVCoefficient(A, B);
                }
            }
            return stats;
        }

        Eigen::MatrixXd GoldCovarianceStatistics(const LabelMatrix & L,
                                                 const LabelVector & gold,
                                                 int cardinality, int min_overlap) {
            int m = L.cols();
            Eigen::MatrixXd stats = Eigen::MatrixXd::Zero(m, m);
            Eigen::MatrixXd A, B;
            for (int i = 0; i < m; i++) {
                for (int j = i + 1; j < m; j++) {
                    auto rows = CoVotingRows(L, i, j);
                    double weighted = 0.0;
                    int total = 0;
                    for (int y = 0; y < cardinality; y++) {
                        std::vector<int> class_rows;
                        for (int r : rows) {
                            if (gold[r] == y)
                                class_rows.push_back(r);
                        }
                        if (class_rows.size() < std::max(min_overlap, 2))
                            continue;
                        CoVotes(L, i, j, cardinality, class_rows, A, B);
                        weighted += class_rows.size() * RVCoefficient(A, B);
                        total += class_rows.size();
                    }
                    if (total > 0)
                        stats(i, j) = stats(j, i) = weighted / total;
                }
            }
            return stats;
        }

        Eigen::MatrixXd ConditionalEntropyStatistics(const LabelMatrix & L,
                                                     const LabelVector * gold,
                                                     int cardinality,
                                                     int min_overlap) {
            int m = L.cols();
            Eigen::MatrixXd stats = Eigen::MatrixXd::Zero(m, m);
            for (int i = 0; i < m; i++) {
                for (int j = i + 1; j < m; j++) {
                    // joint vote counts of (i, j) per conditioning class
                    std::vector<Eigen::MatrixXd> joints(
                        cardinality, Eigen::MatrixXd::Zero(cardinality, cardinality));
                    int total = 0;
                    for (int r = 0; r < L.rows(); r++) {
                        if (L(r, i) == Abstain || L(r, j) == Abstain)
                            continue;
                        int c = gold ? (*gold)[r]
                                     : PluralityVote(VoteCounts(L, r, cardinality, i, j));
                        if (c == Abstain)
                            continue;
                        joints[c](L(r, i), L(r, j)) += 1.0;
                        total++;
                    }
                    if (total < std::max(min_overlap, 2))
                        continue;

                    double mi = 0.0, hi = 0.0, hj = 0.0;
                    for (auto & joint : joints) {
                        double w = joint.sum() / total;
                        if (w == 0.0)
                            continue;
                        mi += w * MutualInformation(joint);
                        hi += w * Entropy(joint.rowwise().sum());
                        hj += w * Entropy(joint.colwise().sum().transpose());
                    }
                    double h = std::min(hi, hj);
                    if (h > 1e-12)
                        stats(i, j) = stats(j, i) = std::min(mi / h, 1.0);
                }
            }
            return stats;
        }

        DependencyEstimate EstimateDependencies(const LabelMatrix & L,
                                                const LabelVector * gold,
                                                const DependencyOptions & options) {
            if (L.cols() < 2) {
                throw InvalidInput("L", "at least 2 labeling functions are needed, got " +
                                            std::to_string(L.cols()));
            }
            CheckLabelMatrix(L, options.cardinality);
            if (gold) {
                CheckGoldLabels(L, *gold, options.cardinality);
            } else if (PolicyRequiresGold(options.policy)) {
                throw InvalidInput("Y", std::string("policy \"") +
                                            PolicyName(options.policy) +
                                            "\" requires gold labels");
            }

            DependencyEstimate estimate;
            int m = L.cols();
            if (options.policy == DependencyPolicy::Empty) {
                estimate.statistics = Eigen::MatrixXd::Zero(m, m);
                return estimate;
            }
            if (!std::isfinite(options.threshold) || options.threshold < 0.0 ||
                options.threshold > 1.0) {
                throw InvalidInput("threshold", "must lie in [0, 1], got " +
                                                    std::to_string(options.threshold));
            }

            switch (options.policy) {
                case DependencyPolicy::Covariance:
                    estimate.statistics =
                        CovarianceStatistics(L, options.cardinality, options.min_overlap);
                    break;
                case DependencyPolicy::GoldCovariance:
                    estimate.statistics = GoldCovarianceStatistics(
                        L, *gold, options.cardinality, options.min_overlap);
                    break;
                case DependencyPolicy::ConditionalEntropy:
                    estimate.statistics = ConditionalEntropyStatistics(
                        L, gold, options.cardinality, options.min_overlap);
                    break;
                default:
                    SHOULD_NEVER_BE_CALLED();
            }

            for (int i = 0; i < m; i++) {
                for (int j = i + 1; j < m; j++) {
                    if (estimate.statistics(i, j) > options.threshold)
                        estimate.edges.emplace_back(i, j);
                }
            }
            return estimate;
        }
    }
}

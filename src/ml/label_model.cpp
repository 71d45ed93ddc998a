#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <random>

#include "../core/errors.hpp"
#include "../core/serialization.hpp"
#include "../core/statistics.hpp"
#include "../misc/clock.hpp"
#include "label_model.hpp"

namespace wl {
    namespace ml {

        using namespace core;

        namespace {
            // floor of probabilities entering a log
            constexpr double ProbabilityEps = 1e-6;

            inline double ClampProbability(double v) {
                return std::min(std::max(v, ProbabilityEps), 1.0);
            }
        }

        LabelModel::LabelModel(int cardinality)
            : _cardinality(cardinality), _nlfs(0), _state(Unfitted), _loss(0.0) {
            CheckCardinality(cardinality);
        }

        void LabelModel::fit(const LabelMatrix & L, const EdgeSet & edges, int seed,
                             double learning_rate, int n_epochs, int log_frequency) {
            FitOptions options;
            options.seed = seed;
            options.learning_rate = learning_rate;
            options.n_epochs = n_epochs;
            options.log_frequency = log_frequency;
            fit(L, edges, options);
        }

        void LabelModel::fit(const LabelMatrix & L, const EdgeSet & edges,
                             const FitOptions & options) {
            if (L.rows() == 0 || L.cols() == 0) {
                throw InvalidInput("L", "the label matrix is empty");
            }
            CheckLabelMatrix(L, _cardinality);
            if (!std::isfinite(options.learning_rate) || options.learning_rate <= 0) {
                throw InvalidInput("learning_rate", "must be positive, got " + std::to_string(options.learning_rate));
            }
            if (options.n_epochs < 1) {
                throw InvalidInput("n_epochs", "must be at least 1, got " + std::to_string(options.n_epochs));
            }
            if (!std::isfinite(options.l2) || options.l2 < 0) {
                throw InvalidInput("l2", "must be non-negative");
            }
            if (!(options.precision_init > 0 && options.precision_init <= 1)) {
                throw InvalidInput("precision_init", "must lie in (0, 1]");
            }
            EdgeSet normalized_edges = NormalizeEdges(edges, L.cols());
            Eigen::VectorXd p = makeClassBalance(options.class_balance);

            std::unique_ptr<misc::Clock> clock;
            if (options.log_frequency > 0) {
                clock.reset(new misc::Clock("LabelModel::fit"));
            }

            // forget the previous fit
            _state = Fitting;
            _nlfs = L.cols();
            _edges = normalized_edges;
            _classBalance = p;
            _mu.resize(0, 0);
            _correlations.clear();
            _loss = 0.0;

            const int n = L.rows();
            const int k = _cardinality;
            const int d = _nlfs * k;

            // co-vote moments
            Eigen::MatrixXd X = IndicatorMatrix(L, k);
            Eigen::MatrixXd O = X.transpose() * X / n;
            Eigen::VectorXd o = O.diagonal();

            // same-lf blocks are trivially dependent, edge blocks are explained by
            // the correlation parameters
            Eigen::MatrixXd mask = Eigen::MatrixXd::Ones(d, d);
            for (int j = 0; j < _nlfs; j++) {
                mask.block(j * k, j * k, k, k).setZero();
            }
            for (auto & e : _edges) {
                mask.block(e.first * k, e.second * k, k, k).setZero();
                mask.block(e.second * k, e.first * k, k, k).setZero();
            }

            Eigen::MatrixXd P = p.asDiagonal();
            std::mt19937 rng(options.seed);
            std::uniform_real_distribution<double> jitter(0.0, 0.01);
            Eigen::MatrixXd mu_init = Eigen::MatrixXd::Zero(d, k);
            for (int j = 0; j < _nlfs; j++) {
                for (int a = 0; a < k; a++) {
                    int idx = j * k + a;
                    for (int y = 0; y < k; y++) {
                        double v = a == y ? o[idx] * options.precision_init / p[y] : 0.0;
                        v += jitter(rng) * o[idx];
                        mu_init(idx, y) = std::min(std::max(v, 0.0), 1.0);
                    }
                }
            }

            Eigen::MatrixXd mu = mu_init;
            std::vector<Eigen::MatrixXd> correlations(_edges.size(),
                                                      Eigen::MatrixXd::Zero(k, k));
            const double lr = options.learning_rate;
            double loss = 0.0;

            for (int epoch = 0; epoch < options.n_epochs; epoch++) {
                Eigen::MatrixXd MPM = mu * P * mu.transpose();
                Eigen::MatrixXd R = mask.cwiseProduct(MPM - O);
                Eigen::VectorXd r = mu * p - o;
                Eigen::MatrixXd reg = mu - mu_init;
                loss = R.squaredNorm() + r.squaredNorm() + options.l2 * reg.squaredNorm();

                Eigen::MatrixXd grad =
                    4.0 * R * mu * P + 2.0 * r * p.transpose() + 2.0 * options.l2 * reg;

                bool finite = true;
                for (int e = 0; e < _edges.size(); e++) {
                    int i = _edges[e].first, j = _edges[e].second;
                    Eigen::MatrixXd residual =
                        O.block(i * k, j * k, k, k) - MPM.block(i * k, j * k, k, k);
                    Eigen::MatrixXd E = correlations[e] - residual;
                    loss += E.squaredNorm();
                    correlations[e] -= lr * 2.0 * E;
                    finite = finite && correlations[e].allFinite();
                }
                mu -= lr * grad;

                if (!finite || !std::isfinite(loss) || !mu.allFinite()) {
                    _state = Unfitted;
                    _nlfs = 0;
                    _edges.clear();
                    throw FitDivergence(epoch, loss);
                }
                if (options.log_frequency > 0 &&
                    (epoch % options.log_frequency == 0 || epoch == options.n_epochs - 1)) {
                    std::cout << "[LabelModel] epoch " << epoch << ": loss = " << loss
                              << std::endl;
                }
            }

            _mu = std::move(mu);
            _correlations = std::move(correlations);
            _loss = loss;
            _state = Fitted;
        }

        Eigen::MatrixXd LabelModel::predictProba(const LabelMatrix & L) const {
            checkFitted();
            checkInput(L);
            const int k = _cardinality;

            Eigen::MatrixXd log_mu =
                _mu.unaryExpr([](double v) { return std::log(ClampProbability(v)); });
            Eigen::MatrixXd scores = IndicatorMatrix(L, k) * log_mu;
            scores.rowwise() += _classBalance.array().log().matrix().transpose();

            // replace the independent factor of co-voting edge pairs by their joint
            for (int e = 0; e < _edges.size(); e++) {
                int i = _edges[e].first, j = _edges[e].second;
                const Eigen::MatrixXd & C = _correlations[e];
                for (int row = 0; row < L.rows(); row++) {
                    int a = L(row, i), b = L(row, j);
                    if (a == Abstain || b == Abstain)
                        continue;
                    for (int y = 0; y < k; y++) {
                        double indep = ClampProbability(_mu(i * k + a, y)) *
                                       ClampProbability(_mu(j * k + b, y));
                        double joint = ClampProbability(indep + C(a, b));
                        scores(row, y) += std::log(joint) - std::log(indep);
                    }
                }
            }
            return SoftmaxRows(scores);
        }

        LabelVector LabelModel::predict(const LabelMatrix & L) const {
            Eigen::MatrixXd probs = predictProba(L);
            LabelVector pred(probs.rows());
            for (int i = 0; i < probs.rows(); i++) {
                pred[i] = ArgMax(probs.row(i).transpose());
            }
            return pred;
        }

        double LabelModel::score(const LabelMatrix & L, const LabelVector & Y,
                                 Metric metric) const {
            checkFitted();
            CheckGoldLabels(L, Y, _cardinality);
            return Score(Y, predict(L), _cardinality, metric);
        }

        const Eigen::MatrixXd & LabelModel::mu() const {
            checkFitted();
            return _mu;
        }

        const std::vector<Eigen::MatrixXd> & LabelModel::correlations() const {
            checkFitted();
            return _correlations;
        }

        const Eigen::VectorXd & LabelModel::classBalance() const {
            checkFitted();
            return _classBalance;
        }

        double LabelModel::loss() const {
            checkFitted();
            return _loss;
        }

        Eigen::MatrixXd LabelModel::conditionalProbabilities(int lf) const {
            checkFitted();
            if (lf < 0 || lf >= _nlfs) {
                throw InvalidInput("lf", "no labeling function " + std::to_string(lf));
            }
            const int k = _cardinality;
            Eigen::MatrixXd votes =
                _mu.block(lf * k, 0, k, k).cwiseMax(0.0).cwiseMin(1.0);
            Eigen::MatrixXd cprobs(k + 1, k);
            for (int y = 0; y < k; y++) {
                double voted = votes.col(y).sum();
                if (voted > 1.0) {
                    votes.col(y) /= voted;
                    voted = 1.0;
                }
                cprobs(0, y) = 1.0 - voted;
            }
            cprobs.bottomRows(k) = votes;
            return cprobs;
        }

        Eigen::VectorXd LabelModel::accuracies() const {
            checkFitted();
            Eigen::VectorXd accs = Eigen::VectorXd::Zero(_nlfs);
            for (int j = 0; j < _nlfs; j++) {
                Eigen::MatrixXd cprobs = conditionalProbabilities(j);
                double correct = 0.0, voted = 0.0;
                for (int y = 0; y < _cardinality; y++) {
                    correct += _classBalance[y] * cprobs(y + 1, y);
                    voted += _classBalance[y] * (1.0 - cprobs(0, y));
                }
                if (voted > 0)
                    accs[j] = correct / voted;
            }
            return accs;
        }

        bool LabelModel::save(const std::string & filename) const {
            checkFitted();
            return SaveToDisk(filename, *this);
        }

        bool LabelModel::load(const std::string & filename) {
            LabelModel loaded(_cardinality);
            try {
                if (!LoadFromDisk(filename, loaded))
                    return false;
            } catch (const cereal::Exception & e) {
                throw InvalidInput("filename", "\"" + filename + "\" is not a label model: " + e.what());
            }
            if (loaded._cardinality != _cardinality) {
                throw InvalidInput("filename", "\"" + filename + "\" holds a model of cardinality " +
                    std::to_string(loaded._cardinality));
            }
            loaded.checkLoaded(filename);
            *this = std::move(loaded);
            return true;
        }

        void LabelModel::checkLoaded(const std::string & filename) const {
            auto malformed = [&filename](const std::string & what) {
                return InvalidInput("filename",
                                    "\"" + filename + "\" holds a malformed " + what);
            };
            const int k = _cardinality;
            if (_state != Fitted || _nlfs < 1)
                throw malformed("model, it is not fitted");
            if (_mu.rows() != _nlfs * k || _mu.cols() != k || !_mu.allFinite())
                throw malformed("mu");
            if (_classBalance.size() != k || !_classBalance.allFinite() || (_classBalance.array() <= 0).any())
                throw malformed("class balance");
            EdgeSet normalized;
            try {
                normalized = NormalizeEdges(_edges, _nlfs);
            } catch (const InvalidInput &) {
                throw malformed("edge set");
            }
            if (normalized != _edges)
                throw malformed("edge set");
            if (_correlations.size() != _edges.size())
                throw malformed("edge set, one correlation block per edge is needed");
            for (auto & C : _correlations) {
                if (C.rows() != k || C.cols() != k || !C.allFinite())
                    throw malformed("correlation block");
            }
            if (!std::isfinite(_loss))
                throw malformed("loss");
        }

        void LabelModel::checkFitted() const {
            if (_state != Fitted)
                throw ModelNotFittedError();
        }

        void LabelModel::checkInput(const LabelMatrix & L) const {
            if (L.cols() != _nlfs) {
                throw ShapeMismatch("columns of L", _nlfs, L.cols());
            }
            CheckLabelMatrix(L, _cardinality);
        }

        Eigen::VectorXd
        LabelModel::makeClassBalance(const std::vector<double> & balance) const {
            if (balance.empty()) {
                return Eigen::VectorXd::Constant(_cardinality, 1.0 / _cardinality);
            }
            if (balance.size() != _cardinality) {
                throw ShapeMismatch("class_balance", _cardinality, balance.size());
            }
            Eigen::VectorXd p(_cardinality);
            for (int y = 0; y < _cardinality; y++) {
                if (!std::isfinite(balance[y]) || balance[y] <= 0) {
                    throw InvalidInput("class_balance", "entries must be positive");
                }
                p[y] = balance[y];
            }
            return p / p.sum();
        }
    }
}

#pragma once

#include <string>
#include <vector>

#include <Eigen/Dense>

#include "../core/label_matrix.hpp"
#include "metrics.hpp"

namespace wl {
    namespace ml {

        using core::EdgeSet;
        using core::LabelMatrix;
        using core::LabelVector;

        struct FitOptions {
            int seed = 0;
            double learning_rate = 0.01;
            int n_epochs = 100;
            // print the loss every log_frequency epochs, 0 for silence
            int log_frequency = 10;
            double l2 = 0.0;
            // initial precision assumed for every labeling function
            double precision_init = 0.7;
            // prior P(Y = y), uniform if empty
            std::vector<double> class_balance;
        };

        // Generative model of labeling function votes given the hidden true label.
        // mu(j * k + a, y) estimates P(lf j votes a | Y = y); every dependency edge
        // (i, j) adds a k x k block correlating the votes of i and j. Fitting matches
        // the co-vote moments of the label matrix and never looks at gold labels.
        class LabelModel {
        public:
            enum State { Unfitted, Fitting, Fitted };

            explicit LabelModel(int cardinality = 3);

            // refits from scratch, throws FitDivergence on non-finite parameters
            void fit(const LabelMatrix & L, const EdgeSet & edges,
                     const FitOptions & options = FitOptions());
            void fit(const LabelMatrix & L, const EdgeSet & edges, int seed,
                     double learning_rate, int n_epochs, int log_frequency);

            // n x cardinality, rows sum to 1
            Eigen::MatrixXd predictProba(const LabelMatrix & L) const;
            // arg-max of predictProba, lowest class on ties
            LabelVector predict(const LabelMatrix & L) const;
            // gold rows equal to Abstain are ignored
            double score(const LabelMatrix & L, const LabelVector & Y,
                         Metric metric = Metric::Accuracy) const;

            int cardinality() const { return _cardinality; }
            State state() const { return _state; }
            bool fitted() const { return _state == Fitted; }
            int nlfs() const { return _nlfs; }
            const EdgeSet & edges() const { return _edges; }

            const Eigen::MatrixXd & mu() const;
            const std::vector<Eigen::MatrixXd> & correlations() const;
            const Eigen::VectorXd & classBalance() const;
            // training loss after the last epoch
            double loss() const;

            // (cardinality + 1) x cardinality, row 0 is P(abstain | Y = y),
            // row a + 1 is P(vote a | Y = y)
            Eigen::MatrixXd conditionalProbabilities(int lf) const;
            // P(vote correct | lf votes) per labeling function
            Eigen::VectorXd accuracies() const;

            bool save(const std::string & filename) const;
            // reads a model saved with the same cardinality, throws InvalidInput on
            // archives that do not hold a consistent fitted model
            bool load(const std::string & filename);

            template <class Archiver> inline void serialize(Archiver & ar) {
                ar(_cardinality, _nlfs, _state, _edges, _mu, _correlations, _classBalance, _loss);
            }

        private:
            void checkFitted() const;
            void checkInput(const LabelMatrix & L) const;
            // parameters read by load must describe a fitted model
            void checkLoaded(const std::string & filename) const;
            Eigen::VectorXd makeClassBalance(const std::vector<double> & balance) const;

        private:
            int _cardinality;
            int _nlfs;
            State _state;
            EdgeSet _edges;
            Eigen::MatrixXd _mu;
            std::vector<Eigen::MatrixXd> _correlations;
            Eigen::VectorXd _classBalance;
            double _loss;
        };
    }
}

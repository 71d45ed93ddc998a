#include <fstream>
#include <iostream>
#include <string>

#include "../src/core/errors.hpp"
#include "../src/ml/dependency.hpp"
#include "../src/ml/label_model.hpp"
#include "../src/ml/lf_analysis.hpp"
#include "../src/ml/majority_vote.hpp"
#include "../src/ml/relation.hpp"
#include "../src/misc/clock.hpp"
#include "../src/misc/cmd_tools.hpp"

using namespace wl;

namespace {

    struct Split {
        core::LabelMatrix L;
        core::LabelVector Y;
        bool has_gold = false;
    };

    core::LabelMatrix LoadMatrixFile(const std::string & filename) {
        std::ifstream in(filename);
        if (!in.is_open()) {
            throw core::InvalidInput("filename",
                                     "\"" + filename + "\" cannot be opened");
        }
        return core::ReadLabelMatrix(in);
    }

    core::LabelVector LoadVectorFile(const std::string & filename) {
        std::ifstream in(filename);
        if (!in.is_open()) {
            throw core::InvalidInput("filename",
                                     "\"" + filename + "\" cannot be opened");
        }
        return core::ReadLabelVector(in);
    }

    // relations files carry their own gold labels, matrix files take them from
    // a separate file
    Split LoadSplit(const std::string & relations, const std::string & matrix,
                    const std::string & gold) {
        Split split;
        if (!relations.empty()) {
            auto examples = ml::LoadRelationExamples(relations);
            split.L = ml::ApplyLabelingFunctions(examples,
                                                 ml::RelationLabelingFunctions());
            split.Y = ml::GoldLabels(examples);
            split.has_gold = (split.Y.array() != core::Abstain).any();
        } else if (!matrix.empty()) {
            split.L = LoadMatrixFile(matrix);
            if (!gold.empty()) {
                split.Y = LoadVectorFile(gold);
                split.has_gold = true;
            }
        }
        return split;
    }

    void PrintSummaries(const std::string & tag, const Split & split,
                        int cardinality) {
        auto summaries = ml::AnalyzeLabelingFunctions(
            split.L, cardinality, split.has_gold ? &split.Y : nullptr);
        std::cout << "[" << tag << "] " << split.L.rows() << " rows, coverage "
                  << ml::LabelCoverage(split.L) << std::endl;
        for (int j = 0; j < summaries.size(); j++) {
            auto & s = summaries[j];
            std::cout << "[" << tag << "]   lf " << j << ": coverage " << s.coverage
                      << ", overlaps " << s.overlaps << ", conflicts " << s.conflicts;
            if (s.correct + s.incorrect > 0)
                std::cout << ", accuracy " << s.empirical_accuracy;
            std::cout << std::endl;
        }
    }
}

int main(int argc, char * argv[]) {
    misc::CmdOptions options = {
        {"train", "", "training relations (tab separated, unlabeled)"},
        {"valid", "", "validation relations with gold labels"},
        {"train_matrix", "", "training label matrix, instead of -train"},
        {"valid_matrix", "", "validation label matrix, instead of -valid"},
        {"valid_gold", "", "gold labels of -valid_matrix"},
        {"cardinality", ml::RelationCardinality, "number of classes"},
        {"policy", "covariance",
         "dependency policy: empty, covariance, gold_covariance, entropy"},
        {"threshold", 0.1, "dependency statistic threshold in [0, 1]"},
        {"seed", 123, "initialization seed"},
        {"lr", 0.01, "learning rate"},
        {"epochs", 100, "number of optimization epochs"},
        {"log", 10, "log the loss every n epochs, 0 for silence"},
        {"l2", 0.0, "l2 regularization towards the initial parameters"},
        {"metric", "accuracy", "accuracy, precision, recall or f1"},
        {"probs", "", "write validation probabilities to this file"},
        {"save", "", "write the fitted model to this file"},
        {"analyze", false, "print labeling function summaries"},
        {"help", false, "print this message"}};

    if (!options.parseArguments(argc, argv) || options.value<bool>("help")) {
        options.printUsage(std::cout);
        return options.value<bool>("help") ? 0 : 1;
    }

    try {
        SetClock();
        std::cout << "[weaklabel] " << misc::CurrentTimeString() << std::endl;

        const int cardinality = options.value<int>("cardinality");
        Split train = LoadSplit(options.value<std::string>("train"),
                                options.value<std::string>("train_matrix"), "");
        Split valid = LoadSplit(options.value<std::string>("valid"),
                                options.value<std::string>("valid_matrix"),
                                options.value<std::string>("valid_gold"));
        if (train.L.size() == 0) {
            std::cout << "no training data, use -train or -train_matrix"
                      << std::endl;
            return 1;
        }
        if (options.value<bool>("analyze")) {
            PrintSummaries("train", train, cardinality);
            if (valid.L.size() > 0)
                PrintSummaries("valid", valid, cardinality);
        }

        // gold-informed policies estimate the structure on the validation split
        ml::DependencyOptions dep_options;
        dep_options.cardinality = cardinality;
        dep_options.threshold = options.value<double>("threshold");
        dep_options.policy =
            ml::PolicyFromName(options.value<std::string>("policy"));
        ml::EdgeSet edges;
        if (ml::PolicyRequiresGold(dep_options.policy)) {
            if (!valid.has_gold) {
                throw core::InvalidInput("policy",
                                         "gold-informed policies need -valid");
            }
            edges = ml::EstimateEdges(valid.L, &valid.Y, dep_options);
        } else {
            edges = ml::EstimateEdges(train.L, nullptr, dep_options);
        }
        std::cout << "[Dependency] " << ml::PolicyName(dep_options.policy) << ": "
                  << edges.size() << " edges";
        for (auto & e : edges)
            std::cout << " (" << e.first << ", " << e.second << ")";
        std::cout << std::endl;

        ml::FitOptions fit_options;
        fit_options.seed = options.value<int>("seed");
        fit_options.learning_rate = options.value<double>("lr");
        fit_options.n_epochs = options.value<int>("epochs");
        fit_options.log_frequency = options.value<int>("log");
        fit_options.l2 = options.value<double>("l2");

        ml::LabelModel model(cardinality);
        model.fit(train.L, edges, fit_options);
        std::cout << "[LabelModel] final loss = " << model.loss() << std::endl;

        if (valid.has_gold) {
            ml::Metric metric =
                ml::MetricFromName(options.value<std::string>("metric"));
            ml::MajorityLabelVoter majority(cardinality);
            std::cout << "[Score] " << ml::MetricName(metric)
                      << " label model = " << model.score(valid.L, valid.Y, metric)
                      << ", majority vote = "
                      << majority.score(valid.L, valid.Y, metric) << std::endl;
        }

        std::string probs_file = options.value<std::string>("probs");
        if (!probs_file.empty() && valid.L.size() > 0) {
            std::ofstream out(probs_file);
            if (!out.is_open()) {
                throw core::InvalidInput("probs",
                                         "\"" + probs_file + "\" cannot be opened");
            }
            core::WriteMatrix(out, model.predictProba(valid.L));
        }
        std::string model_file = options.value<std::string>("save");
        if (!model_file.empty() && !model.save(model_file)) {
            return 1;
        }
    } catch (const core::Error & e) {
        std::cout << e.what() << std::endl;
        return 1;
    }
    return 0;
}

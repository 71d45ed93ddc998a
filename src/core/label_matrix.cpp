#include <algorithm>
#include <iostream>
#include <sstream>
#include <string>

#include "errors.hpp"
#include "label_matrix.hpp"

namespace wl {
    namespace core {

        void CheckCardinality(int cardinality) {
            if (cardinality <= 1) {
                throw InvalidInput("cardinality", "must be at least 2, got " +
                                                      std::to_string(cardinality));
            }
        }

        void CheckLabelMatrix(const LabelMatrix & L, int cardinality) {
            CheckCardinality(cardinality);
            for (int i = 0; i < L.rows(); i++) {
                for (int j = 0; j < L.cols(); j++) {
                    int v = L(i, j);
                    if (v < Abstain || v >= cardinality) {
                        throw InvalidInput("L", "entry (" + std::to_string(i) + ", " +
                                                    std::to_string(j) + ") = " +
                                                    std::to_string(v) +
                                                    " is neither Abstain nor in [0, " +
                                                    std::to_string(cardinality) + ")");
                    }
                }
            }
        }

        void CheckGoldLabels(const LabelMatrix & L, const LabelVector & Y,
                             int cardinality) {
            if (Y.size() != L.rows()) {
                throw ShapeMismatch("rows of Y", L.rows(), Y.size());
            }
            for (int i = 0; i < Y.size(); i++) {
                if (Y[i] < Abstain || Y[i] >= cardinality) {
                    throw InvalidInput("Y", "gold label " + std::to_string(Y[i]) +
                                                " at row " + std::to_string(i) +
                                                " is out of range");
                }
            }
        }

        EdgeSet NormalizeEdges(const EdgeSet & edges, int nlfs) {
            EdgeSet normalized;
            normalized.reserve(edges.size());
            for (const Edge & e : edges) {
                if (e.first < 0 || e.first >= nlfs || e.second < 0 || e.second >= nlfs) {
                    throw InvalidInput("edges", "(" + std::to_string(e.first) + ", " +
                                                    std::to_string(e.second) +
                                                    ") references a missing column");
                }
                if (e.first == e.second) {
                    throw InvalidInput("edges",
                                       "self edge on column " + std::to_string(e.first));
                }
                normalized.emplace_back(std::min(e.first, e.second),
                                        std::max(e.first, e.second));
            }
            std::sort(normalized.begin(), normalized.end());
            normalized.erase(std::unique(normalized.begin(), normalized.end()),
                             normalized.end());
            return normalized;
        }

        Eigen::MatrixXd IndicatorMatrix(const LabelMatrix & L, int cardinality) {
            Eigen::MatrixXd X = Eigen::MatrixXd::Zero(L.rows(), L.cols() * cardinality);
            for (int i = 0; i < L.rows(); i++) {
                for (int j = 0; j < L.cols(); j++) {
                    if (L(i, j) != Abstain) {
                        X(i, j * cardinality + L(i, j)) = 1.0;
                    }
                }
            }
            return X;
        }

        namespace {
            std::vector<std::vector<int>> ReadIntRows(std::istream & in) {
                std::vector<std::vector<int>> rows;
                std::string line;
                int lineno = 0;
                while (std::getline(in, line)) {
                    lineno++;
                    auto comment = line.find('#');
                    if (comment != std::string::npos) {
                        line.erase(comment);
                    }
                    std::replace(line.begin(), line.end(), ',', ' ');
                    std::istringstream ss(line);
                    std::vector<int> row;
                    std::string token;
                    while (ss >> token) {
                        size_t consumed = 0;
                        int v = 0;
                        try {
                            v = std::stoi(token, &consumed);
                        } catch (const std::logic_error &) {
                            consumed = 0;
                        }
                        if (consumed != token.size()) {
                            throw InvalidInput("input", "line " + std::to_string(lineno) +
                                                            ": \"" + token +
                                                            "\" is not an integer");
                        }
                        row.push_back(v);
                    }
                    if (!row.empty()) {
                        rows.push_back(std::move(row));
                    }
                }
                return rows;
            }
        }

        LabelMatrix ReadLabelMatrix(std::istream & in) {
            auto rows = ReadIntRows(in);
            if (rows.empty()) {
                return LabelMatrix();
            }
            LabelMatrix L(rows.size(), rows.front().size());
            for (int i = 0; i < rows.size(); i++) {
                if (rows[i].size() != rows.front().size()) {
                    throw ShapeMismatch("columns of row " + std::to_string(i),
                                        rows.front().size(), rows[i].size());
                }
                for (int j = 0; j < rows[i].size(); j++) {
                    L(i, j) = rows[i][j];
                }
            }
            return L;
        }

        LabelVector ReadLabelVector(std::istream & in) {
            std::vector<int> values;
            for (auto & row : ReadIntRows(in)) {
                values.insert(values.end(), row.begin(), row.end());
            }
            LabelVector Y(values.size());
            for (int i = 0; i < values.size(); i++) {
                Y[i] = values[i];
            }
            return Y;
        }

        void WriteMatrix(std::ostream & out, const Eigen::MatrixXd & m) {
            static const Eigen::IOFormat format(Eigen::StreamPrecision,
                                                Eigen::DontAlignCols, " ", "\n");
            out << m.format(format) << std::endl;
        }
    }
}

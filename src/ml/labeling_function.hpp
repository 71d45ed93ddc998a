#pragma once

#include <functional>
#include <string>
#include <vector>

#include "../core/label_matrix.hpp"

namespace wl {
    namespace ml {

        // maps one example to a class index or core::Abstain
        template <class ExampleT>
        using LabelingFunction = std::function<int(const ExampleT &)>;

        template <class ExampleT> struct NamedLabelingFunction {
            std::string name;
            LabelingFunction<ExampleT> fun;
        };

        // column j holds the votes of lfs[j]
        template <class ExampleT>
        core::LabelMatrix
        ApplyLabelingFunctions(const std::vector<ExampleT> & examples,
                               const std::vector<NamedLabelingFunction<ExampleT>> & lfs) {
            core::LabelMatrix L(examples.size(), lfs.size());
            for (int i = 0; i < examples.size(); i++) {
                for (int j = 0; j < lfs.size(); j++) {
                    L(i, j) = lfs[j].fun(examples[i]);
                }
            }
            return L;
        }
    }
}

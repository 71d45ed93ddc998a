#pragma once

#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>

#include <cereal/types/common.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/utility.hpp>
#include <cereal/types/vector.hpp>

#include <cereal/archives/portable_binary.hpp>

#include <Eigen/Dense>

namespace Eigen {

    // MUST be defined in the namespace of the underlying type (Eigen::XXX),
    //    definitions in namespace wl::core won't be found by cereal!

    // Serialization for Eigen::Matrix
    template <class Archive, class Scalar, int Rows, int Cols, int Options,
              int MaxRows, int MaxCols>
    void save(Archive & ar,
              const Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols> & m) {
        int32_t rows = static_cast<int32_t>(m.rows());
        int32_t cols = static_cast<int32_t>(m.cols());
        ar(rows, cols);
        for (Index i = 0; i < m.size(); i++) {
            ar(m.data()[i]);
        }
    }

    // Serialization for Eigen::Matrix
    template <class Archive, class Scalar, int Rows, int Cols, int Options,
              int MaxRows, int MaxCols>
    void load(Archive & ar,
              Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols> & m) {
        int32_t rows, cols;
        ar(rows, cols);
        m.resize(rows, cols);
        for (Index i = 0; i < m.size(); i++) {
            ar(m.data()[i]);
        }
    }
}

namespace wl {
    namespace core {

        template <class... Ts>
        inline bool SaveToDisk(const std::string & filename, const Ts & ... data) {
            std::ofstream out(filename, std::ios::binary);
            if (!out.is_open()) {
                std::cout << "[Serialization] file \"" << filename
                          << "\" cannot be opened for writing!" << std::endl;
                return false;
            }
            cereal::PortableBinaryOutputArchive archive(out);
            archive(data...);
            return true;
        }

        template <class... Ts>
        inline bool LoadFromDisk(const std::string & filename, Ts & ... data) {
            std::ifstream in(filename, std::ios::binary);
            if (!in.is_open()) {
                std::cout << "[Serialization] file \"" << filename
                          << "\" cannot be opened for reading!" << std::endl;
                return false;
            }
            cereal::PortableBinaryInputArchive archive(in);
            archive(data...);
            return true;
        }
    }
}

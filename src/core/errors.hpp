#pragma once

#include <stdexcept>
#include <string>

namespace wl {
    namespace core {

        enum class ErrorKind { InvalidInput, ModelNotFitted, ShapeMismatch, FitDivergence };

        const char * ErrorKindName(ErrorKind kind);

        // base of all errors thrown by weaklabel
        class Error : public std::runtime_error {
        public:
            Error(ErrorKind kind, const std::string & msg);
            ErrorKind kind() const { return _kind; }

        private:
            ErrorKind _kind;
        };

        // malformed shapes, out-of-range values, missing gold labels
        class InvalidInput : public Error {
        public:
            InvalidInput(const std::string & argument, const std::string & msg);
            const std::string & argument() const { return _argument; }

        private:
            std::string _argument;
        };

        // inference or scoring before fit
        class ModelNotFittedError : public Error {
        public:
            ModelNotFittedError();
        };

        // row/column counts disagree
        class ShapeMismatch : public Error {
        public:
            ShapeMismatch(const std::string & dimension, long expected, long actual);
            const std::string & dimension() const { return _dimension; }
            long expected() const { return _expected; }
            long actual() const { return _actual; }

        private:
            std::string _dimension;
            long _expected, _actual;
        };

        // non-finite parameters or loss during optimization
        class FitDivergence : public Error {
        public:
            FitDivergence(int epoch, double loss);
            int epoch() const { return _epoch; }
            double loss() const { return _loss; }

        private:
            int _epoch;
            double _loss;
        };
    }
}

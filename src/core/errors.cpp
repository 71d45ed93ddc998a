#include "errors.hpp"
#include "macros.hpp"

namespace wl {
    namespace core {

        const char * ErrorKindName(ErrorKind kind) {
            switch (kind) {
                case ErrorKind::InvalidInput:
                    return "InvalidInput";
                case ErrorKind::ModelNotFitted:
                    return "ModelNotFitted";
                case ErrorKind::ShapeMismatch:
                    return "ShapeMismatch";
                case ErrorKind::FitDivergence:
                    return "FitDivergence";
                default:
                    SHOULD_NEVER_BE_CALLED();
            }
        }

        Error::Error(ErrorKind kind, const std::string & msg)
            : std::runtime_error(std::string("[") + ErrorKindName(kind) + "] " + msg),
              _kind(kind) {}

        InvalidInput::InvalidInput(const std::string & argument, const std::string & msg)
            : Error(ErrorKind::InvalidInput, argument + ": " + msg),
              _argument(argument) {}

        ModelNotFittedError::ModelNotFittedError()
            : Error(ErrorKind::ModelNotFitted,
                    "the model must be fitted before inference") {}

        ShapeMismatch::ShapeMismatch(const std::string & dimension, long expected,
                                     long actual)
            : Error(ErrorKind::ShapeMismatch,
                    dimension + " expected " + std::to_string(expected) + ", got " +
                        std::to_string(actual)),
              _dimension(dimension), _expected(expected), _actual(actual) {}

        FitDivergence::FitDivergence(int epoch, double loss)
            : Error(ErrorKind::FitDivergence, "non-finite parameters at epoch " +
                                                  std::to_string(epoch) +
                                                  " (loss = " + std::to_string(loss) +
                                                  ")"),
              _epoch(epoch), _loss(loss) {}
    }
}

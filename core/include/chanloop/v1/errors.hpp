#pragma once

// =============================================================================
// ChanLoop - Error Types
// =============================================================================
// Every failure the core reports to a caller is one of these. The CLI catches
// them at the command boundary and prints what() as-is.
// =============================================================================

#include <stdexcept>
#include <string>

namespace chanloop::v1 {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Bad or missing input; recoverable by correcting the parameter.
class InvalidParameterError : public Error {
public:
    using Error::Error;
};

/// The model did not produce a physically valid loop. No partial output.
class NumericDivergenceError : public Error {
public:
    using Error::Error;
};

/// Too few complete cycles left to average.
class InsufficientDataError : public Error {
public:
    using Error::Error;
};

/// Destination file or directory cannot be written.
class WriteError : public Error {
public:
    using Error::Error;
};

}  // namespace chanloop::v1

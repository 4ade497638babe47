#pragma once

#include <stdexcept>
#include <string>

namespace grating_reduce {

class GratingReduceError : public std::runtime_error {
public:
    explicit GratingReduceError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public GratingReduceError {
public:
    explicit ConfigError(const std::string& message)
        : GratingReduceError("Config error: " + message) {}
};

class ValidationError : public GratingReduceError {
public:
    explicit ValidationError(const std::string& message)
        : GratingReduceError("Validation error: " + message) {}
};

class IOError : public GratingReduceError {
public:
    explicit IOError(const std::string& message)
        : GratingReduceError("I/O error: " + message) {}
};

class NotFoundError : public IOError {
public:
    explicit NotFoundError(const std::string& message)
        : IOError("Not found: " + message) {}
};

class UnsupportedFormatError : public IOError {
public:
    explicit UnsupportedFormatError(const std::string& message)
        : IOError("Unsupported format: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class TiffError : public IOError {
public:
    explicit TiffError(const std::string& message)
        : IOError("TIFF error: " + message) {}
};

class Hdf5Error : public IOError {
public:
    explicit Hdf5Error(const std::string& message)
        : IOError("HDF5 error: " + message) {}
};

class ShapeMismatchError : public GratingReduceError {
public:
    explicit ShapeMismatchError(const std::string& message)
        : GratingReduceError("Shape mismatch: " + message) {}
};

class CountMismatchError : public GratingReduceError {
public:
    explicit CountMismatchError(const std::string& message)
        : GratingReduceError("Count mismatch: " + message) {}
};

class MissingDataError : public GratingReduceError {
public:
    explicit MissingDataError(const std::string& message)
        : GratingReduceError("Missing data: " + message) {}
};

class InvalidRoiError : public GratingReduceError {
public:
    explicit InvalidRoiError(const std::string& message)
        : GratingReduceError("Invalid ROI: " + message) {}
};

class InvalidArgumentError : public GratingReduceError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : GratingReduceError("Invalid argument: " + message) {}
};

class OperationNotAllowedError : public GratingReduceError {
public:
    explicit OperationNotAllowedError(const std::string& message)
        : GratingReduceError("Operation not allowed: " + message) {}
};

} // namespace grating_reduce

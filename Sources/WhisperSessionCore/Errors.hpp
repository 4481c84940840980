#pragma once

#include <stdexcept>
#include <string>

namespace ws {

/// Base of every error raised by this library.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/// The model source could not be loaded.  No session is produced.
class ConstructionError : public Error {
public:
    explicit ConstructionError(const std::string& what) : Error(what) {}
};

/// A native string (parameter field or segment text) is not valid UTF-8.
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& what) : Error(what) {}
};

/// transcribe() or set_params() was called while a run is in flight.
class ConcurrencyViolation : public Error {
public:
    explicit ConcurrencyViolation(const std::string& what) : Error(what) {}
};

/// The caller handed us samples the engine cannot take.
class InvalidInputError : public Error {
public:
    explicit InvalidInputError(const std::string& what) : Error(what) {}
};

/// The native run returned a failure code without a stop request.
class EngineRunError : public Error {
public:
    EngineRunError(const std::string& what, int code) : Error(what), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

} // namespace ws

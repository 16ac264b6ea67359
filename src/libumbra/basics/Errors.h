#pragma once

#include <stdexcept>
#include <string>

namespace umbra {

/** Coarse failure class, enough for a caller to decide how to react. */
enum class ErrorCategory {
    inputValidation,  // malformed or missing input, rejected before work
    stateInvariant,   // request conflicts with pool state
    cryptoArtifact,   // circuit files, keys or proof bytes unusable
    timeout,          // caller-supplied deadline expired, retry is safe
    rngFailure,       // entropy source unavailable, never recoverable
    manifestExpired   // stealth manifest past its ttl
};

char const* to_string(ErrorCategory category);

class Error : public std::runtime_error
{
public:
    Error(ErrorCategory category, std::string const& what)
        : std::runtime_error(what), category_(category)
    {
    }

    ErrorCategory category() const noexcept
    {
        return category_;
    }

private:
    ErrorCategory category_;
};

//------------------------------------------------------------------------------

class InputValidationError : public Error
{
public:
    explicit InputValidationError(std::string const& what)
        : Error(ErrorCategory::inputValidation, what)
    {
    }
};

class MissingFieldError : public InputValidationError
{
public:
    explicit MissingFieldError(std::string const& field)
        : InputValidationError("missing field: " + field), field_(field)
    {
    }

    std::string const& field() const noexcept
    {
        return field_;
    }

private:
    std::string field_;
};

class RangeError : public InputValidationError
{
public:
    using InputValidationError::InputValidationError;
};

//------------------------------------------------------------------------------

class StateInvariantError : public Error
{
public:
    explicit StateInvariantError(std::string const& what)
        : Error(ErrorCategory::stateInvariant, what)
    {
    }
};

class CommitmentMismatchError : public StateInvariantError
{
public:
    using StateInvariantError::StateInvariantError;
};

class NullifierReplayError : public StateInvariantError
{
public:
    using StateInvariantError::StateInvariantError;
};

class TreeFullError : public StateInvariantError
{
public:
    using StateInvariantError::StateInvariantError;
};

class UnknownLeafError : public StateInvariantError
{
public:
    using StateInvariantError::StateInvariantError;
};

class UnknownRootError : public StateInvariantError
{
public:
    using StateInvariantError::StateInvariantError;
};

//------------------------------------------------------------------------------

class CryptoArtifactError : public Error
{
public:
    explicit CryptoArtifactError(std::string const& what)
        : Error(ErrorCategory::cryptoArtifact, what)
    {
    }
};

class CircuitLoadError : public CryptoArtifactError
{
public:
    using CryptoArtifactError::CryptoArtifactError;
};

class ProvingKeyMissingError : public CryptoArtifactError
{
public:
    using CryptoArtifactError::CryptoArtifactError;
};

class WitnessGenerationError : public CryptoArtifactError
{
public:
    using CryptoArtifactError::CryptoArtifactError;
};

class MalformedProofError : public CryptoArtifactError
{
public:
    using CryptoArtifactError::CryptoArtifactError;
};

//------------------------------------------------------------------------------

class TimeoutError : public Error
{
public:
    explicit TimeoutError(std::string const& what)
        : Error(ErrorCategory::timeout, what)
    {
    }
};

class RngFailureError : public Error
{
public:
    explicit RngFailureError(std::string const& what)
        : Error(ErrorCategory::rngFailure, what)
    {
    }
};

class ManifestExpiredError : public Error
{
public:
    explicit ManifestExpiredError(std::string const& what)
        : Error(ErrorCategory::manifestExpired, what)
    {
    }
};

}  // namespace umbra

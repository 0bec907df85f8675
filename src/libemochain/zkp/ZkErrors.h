#ifndef EMOCHAIN_ZKP_ZKERRORS_H
#define EMOCHAIN_ZKP_ZKERRORS_H

#include <stdexcept>
#include <string>

namespace emochain {
namespace zkp {

/**
 * Generation-time errors. All of them may be retried by the caller with a
 * fresh nonce; verification never raises any of these.
 */

// A score or threshold lies outside the declared score domain
class InputValidationError : public std::invalid_argument {
public:
    explicit InputValidationError(const std::string& what)
        : std::invalid_argument(what) {}
};

class InvalidScoreRange : public InputValidationError {
public:
    explicit InvalidScoreRange(const std::string& what)
        : InputValidationError(what) {}
};

class InvalidThreshold : public InputValidationError {
public:
    explicit InvalidThreshold(const std::string& what)
        : InputValidationError(what) {}
};

// The threshold-proof backend failed to produce an artifact
class ProofGenerationError : public std::runtime_error {
public:
    explicit ProofGenerationError(const std::string& what)
        : std::runtime_error(what) {}
};

// Batch creation was requested with nothing queued
class EmptyQueueError : public std::logic_error {
public:
    explicit EmptyQueueError(const std::string& what)
        : std::logic_error(what) {}
};

} // namespace zkp
} // namespace emochain

#endif // EMOCHAIN_ZKP_ZKERRORS_H

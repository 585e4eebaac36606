/**
 * @file Error.hpp
 * @brief Translation of native FMOD result codes into semantic error kinds.
 *
 * Every native call returns an FMOD_RESULT. This file maps each code onto a
 * closed set of ErrorKind values and provides the Result<T> vocabulary type
 * returned by all fallible operations of the layer.
 */

#ifndef FMODPP_CORE_ERROR_HPP
#define FMODPP_CORE_ERROR_HPP

#include <fmod_common.h>
#include <expected>
#include <stdexcept>
#include <utility>

namespace fmodpp {

/**
 * @brief Semantic classification of a native result code.
 */
enum class ErrorKind {
    Success,
    Configuration,     // Bad argument, wrong object kind, tag mismatch
    Resource,          // Allocation or handle exhaustion, buffer too small
    Unavailable,       // Feature absent on this platform, build or plugin set
    NotReady,          // Asynchronous operation still pending
    IO,                // File or network failure
    Internal,          // Engine-internal or unrecognised condition
    ContractViolation  // Misuse of this layer's own unsafe contract
};

/**
 * @brief Classify a native result code.
 *
 * Pure and total: any integer value, including codes newer than the header
 * this layer was built against, maps to exactly one kind.
 */
ErrorKind classify(FMOD_RESULT code) noexcept;

/**
 * @brief Stable name of an error kind, for diagnostics.
 */
const char* kind_name(ErrorKind kind) noexcept;

/**
 * @brief A failed native result.
 *
 * Carries the raw code so callers that care about the exact native condition
 * (e.g. FMOD_ERR_MEMORY inside the Resource kind) can still inspect it.
 * Callback bodies may throw an Error to return that code to the engine.
 */
class Error {
public:
    explicit Error(FMOD_RESULT code) noexcept : code_(code) {}

    FMOD_RESULT code() const noexcept { return code_; }
    ErrorKind kind() const noexcept { return classify(code_); }

    /**
     * @brief Engine-provided description of the code.
     */
    const char* what() const noexcept;

    friend bool operator==(const Error& lhs, const Error& rhs) noexcept {
        return lhs.code_ == rhs.code_;
    }

private:
    FMOD_RESULT code_;
};

/**
 * @brief Value-or-error returned by every fallible operation.
 */
template <typename T = void>
using Result = std::expected<T, Error>;

/**
 * @brief Thrown when the unsafe preconditions of this layer are broken,
 * e.g. taking ownership of a null pointer. Signals a bug in the caller.
 */
class ContractViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

inline Result<> check(FMOD_RESULT code) {
    if (code == FMOD_OK) {
        return {};
    }
    return std::unexpected(Error(code));
}

/**
 * @brief Return value when code is FMOD_OK, the translated error otherwise.
 *
 * The native call must already have completed: pass the stored code, never
 * the call expression itself, so the out-parameter is read afterwards.
 */
template <typename T>
Result<T> check(FMOD_RESULT code, T value) {
    if (code == FMOD_OK) {
        return Result<T>(std::move(value));
    }
    return std::unexpected(Error(code));
}

} // namespace fmodpp

#endif // FMODPP_CORE_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error taxonomy shared by every PgFleet component.
 *
 * Operations return std::expected<T, Error>. The code lets callers branch on the
 * failure (retry a version conflict, swallow an idempotent fence request) while the
 * message stays human-readable for logs and backup status.
 */

#ifndef ERROR_HPP
#define ERROR_HPP

#include <string>
#include <expected>
#include <utility>

/**
 * @brief Stable error codes used across PgFleet.
 */
enum class ErrorCode {
    Conflict,               ///< Stale resourceVersion on a compare-and-swap update.
    NotFound,               ///< Requested object does not exist.
    AlreadyExists,          ///< Object with the same name already exists.
    AlreadyFenced,          ///< Member is already fenced.
    AlreadyUnfenced,        ///< Member is not fenced.
    ConflictingFenceState,  ///< Another fencing operation holds the annotation.
    MissingExternalSource,  ///< Replica cluster source cannot be resolved.
    SnapshotFailed,         ///< Storage provider reported a terminal snapshot error.
    InvalidConfiguration,   ///< Configuration or object spec cannot be used as is.
    ParseError,             ///< Malformed annotation, manifest or status document.
    IoFailed,               ///< Local filesystem or process failure.
    Unavailable,            ///< Remote collaborator could not be reached.
    Cancelled,              ///< Operation context was cancelled.
    Timeout,                ///< Operation context deadline expired.
    Internal,               ///< Anything else.
};

/**
 * @brief Structured error payload.
 */
struct Error {
    ErrorCode code = ErrorCode::Internal; ///< Machine-readable code.
    std::string message;                  ///< Human-readable message.
};

/**
 * @brief Builds an unexpected Error in one expression.
 *
 * @param code Error code.
 * @param message Human-readable message.
 * @return std::unexpected<Error> Value convertible to any std::expected<T, Error>.
 */
inline std::unexpected<Error> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/**
 * @brief Returns the canonical name of an error code (e.g. "ConflictingFenceState").
 */
const char* errorCodeName(ErrorCode code);

/**
 * @brief Tells whether an operation failing with this code may succeed on a later attempt.
 *
 * Transient failures (version conflicts, unreachable collaborators, cancellation) are
 * retried by the scheduler. Precondition and terminal provider failures are not, since
 * retrying without operator intervention cannot change the outcome.
 */
bool isRetryable(ErrorCode code);

/**
 * @brief Formats an error as "<CodeName>: <message>".
 */
std::string describe(const Error& error);

#endif // ERROR_HPP

/**
 * @file AssistantErrors.hpp
 * @brief Error taxonomy shared by the record store, timer and facade.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace deskpal::domain {

/**
 * @enum ErrorKind
 * @brief Category of an AssistantError, used to pick a user-facing message.
 */
enum class ErrorKind {
    NotFound,           ///< An id is absent from its collection.
    Validation,         ///< Caller-supplied input was rejected.
    CorruptStore,       ///< A stored document could not be parsed at load time.
    InvalidTransition,  ///< Timer operation not allowed in the current state.
    Storage             ///< A document could not be written; nothing changed.
};

/**
 * @brief Helper to convert an error kind to string for display/logging.
 */
inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::CorruptStore: return "CorruptStore";
        case ErrorKind::InvalidTransition: return "InvalidTransition";
        case ErrorKind::Storage: return "StorageError";
        default: return "Unknown";
    }
}

/**
 * @class AssistantError
 * @brief Base class of every failure DeskPal reports to its caller.
 */
class AssistantError : public std::runtime_error {
public:
    AssistantError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

class NotFoundError : public AssistantError {
public:
    explicit NotFoundError(const std::string& message)
        : AssistantError(ErrorKind::NotFound, message) {}
};

class ValidationError : public AssistantError {
public:
    explicit ValidationError(const std::string& message)
        : AssistantError(ErrorKind::Validation, message) {}
};

/**
 * @class CorruptStoreError
 * @brief A durable document exists but failed to parse or validate.
 *
 * Never recovered from silently: it means user data may be lost.
 */
class CorruptStoreError : public AssistantError {
public:
    CorruptStoreError(const std::string& documentPath, const std::string& detail)
        : AssistantError(ErrorKind::CorruptStore, "Corrupt document " + documentPath + ": " + detail),
          m_documentPath(documentPath) {}

    const std::string& documentPath() const { return m_documentPath; }

private:
    std::string m_documentPath;
};

class InvalidTransitionError : public AssistantError {
public:
    explicit InvalidTransitionError(const std::string& message)
        : AssistantError(ErrorKind::InvalidTransition, message) {}
};

class StorageError : public AssistantError {
public:
    explicit StorageError(const std::string& message)
        : AssistantError(ErrorKind::Storage, message) {}
};

} // namespace deskpal::domain

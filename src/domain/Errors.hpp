/**
 * @file Errors.hpp
 * @brief Error taxonomy of the section store.
 *
 * Every error carries a stable reason code and a JSON context object
 * (document path, slug, ...) so the request layer can report it verbatim.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace sectionvault::domain {

/**
 * @class StoreError
 * @brief Base class of every error raised by the store.
 */
class StoreError : public std::runtime_error {
public:
    StoreError(std::string kind, std::string code, const std::string& message,
               nlohmann::json context = nlohmann::json::object())
        : std::runtime_error(message)
        , m_kind(std::move(kind))
        , m_code(std::move(code))
        , m_context(std::move(context)) {}

    const std::string& kind() const { return m_kind; }       ///< Taxonomy name, e.g. "ConflictError".
    const std::string& code() const { return m_code; }       ///< Stable reason code, e.g. "CONFLICT".
    const nlohmann::json& context() const { return m_context; }

    /** @brief Structured form used in tool responses. */
    nlohmann::json toJson() const {
        return nlohmann::json{
            {"type", m_kind},
            {"code", m_code},
            {"message", what()},
            {"context", m_context}
        };
    }

private:
    std::string m_kind;
    std::string m_code;
    nlohmann::json m_context;
};

/// Malformed input: bad paths, namespace rule violations, missing or invalid parameters.
class AddressingError : public StoreError {
public:
    AddressingError(const std::string& code, const std::string& message,
                    nlohmann::json context = nlohmann::json::object())
        : StoreError("AddressingError", code, message, std::move(context)) {}
};

class SectionNotFoundError : public StoreError {
public:
    SectionNotFoundError(const std::string& slug, const std::string& documentPath = "")
        : StoreError("SectionNotFoundError", "NOT_FOUND",
                     "Section not found: " + slug,
                     nlohmann::json{{"slug", slug}, {"document", documentPath}}) {}
};

class DocumentNotFoundError : public StoreError {
public:
    explicit DocumentNotFoundError(const std::string& documentPath)
        : StoreError("DocumentNotFoundError", "DOCUMENT_NOT_FOUND",
                     "Document not found: " + documentPath,
                     nlohmann::json{{"document", documentPath}}) {}
};

/// The file changed on disk between snapshot and write.
class ConflictError : public StoreError {
public:
    explicit ConflictError(const std::string& documentPath)
        : StoreError("ConflictError", "CONFLICT",
                     "Document was modified since it was read: " + documentPath,
                     nlohmann::json{{"document", documentPath}}) {}
};

class TaskStateError : public StoreError {
public:
    TaskStateError(const std::string& code, const std::string& message,
                   nlohmann::json context = nlohmann::json::object())
        : StoreError("TaskStateError", code, message, std::move(context)) {}
};

class ArchiveIOError : public StoreError {
public:
    ArchiveIOError(const std::string& message, nlohmann::json context = nlohmann::json::object())
        : StoreError("ArchiveIOError", "ARCHIVE_IO", message, std::move(context)) {}
};

/// Filesystem failures outside archiving (unreadable files, size limits, failed renames).
class StorageError : public StoreError {
public:
    StorageError(const std::string& code, const std::string& message,
                 nlohmann::json context = nlohmann::json::object())
        : StoreError("StorageError", code, message, std::move(context)) {}
};

} // namespace sectionvault::domain

/**
 * @file DocumentService.hpp
 * @brief Section-level reads and edits of workspace documents.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "domain/DocumentRecord.hpp"
#include "infrastructure/ConcurrencyGuard.hpp"
#include "infrastructure/DocumentCache.hpp"

namespace sectionvault::application {

/**
 * @enum SectionOperation
 * @brief Edit applied to one section.
 */
enum class SectionOperation {
    Replace,        ///< Whole span; the heading line is kept if the content has none.
    Append,         ///< Adds to the end of the section's own body.
    Prepend,        ///< Adds to the start of the section's own body.
    InsertBefore,
    InsertAfter,
    AppendChild,
    Remove,
    Rename
};

inline std::string SectionOperationToString(SectionOperation op) {
    switch (op) {
        case SectionOperation::Replace: return "replace";
        case SectionOperation::Append: return "append";
        case SectionOperation::Prepend: return "prepend";
        case SectionOperation::InsertBefore: return "insert_before";
        case SectionOperation::InsertAfter: return "insert_after";
        case SectionOperation::AppendChild: return "append_child";
        case SectionOperation::Remove: return "remove";
        case SectionOperation::Rename: return "rename";
        default: return "unknown";
    }
}

inline std::optional<SectionOperation> ParseSectionOperation(const std::string& name) {
    if (name == "replace") return SectionOperation::Replace;
    if (name == "append") return SectionOperation::Append;
    if (name == "prepend") return SectionOperation::Prepend;
    if (name == "insert_before") return SectionOperation::InsertBefore;
    if (name == "insert_after") return SectionOperation::InsertAfter;
    if (name == "append_child") return SectionOperation::AppendChild;
    if (name == "remove") return SectionOperation::Remove;
    if (name == "rename") return SectionOperation::Rename;
    return std::nullopt;
}

struct SectionEdit {
    std::string document;
    std::string section;                 ///< Reference section slug (flat or hierarchical).
    SectionOperation operation = SectionOperation::Replace;
    std::string content;
    std::optional<std::string> title;    ///< New heading title (inserts, rename).
    std::optional<int> depth;            ///< Explicit depth for inserts.
};

struct SectionEditResult {
    std::string document;
    std::string action;                  ///< "edited", "created", "renamed" or "removed".
    std::string section;                 ///< Slug of the affected section after the edit.
    std::optional<int> depth;
    std::optional<std::string> removedContent;
};

/// One entry of a batch edit: either a result or the error that stopped it.
struct BatchEditOutcome {
    SectionEdit request;
    std::optional<SectionEditResult> result;
    std::optional<nlohmann::json> error;
};

struct DocumentSummary {
    std::string path;
    std::string title;
    std::string namespaceName;
    std::size_t wordCount = 0;
    std::size_t headingCount = 0;
};

class DocumentService {
public:
    DocumentService(std::shared_ptr<infrastructure::ConcurrencyGuard> guard,
                    std::shared_ptr<infrastructure::DocumentCache> cache);

    /** @brief Parsed document; throws DocumentNotFoundError. */
    std::shared_ptr<const domain::DocumentRecord> viewDocument(const std::string& path);

    /** @brief Heading line and body of "/doc.md#slug". */
    std::string viewSection(const std::string& address);

    /**
     * @brief Applies one edit as snapshot, transform, conditional write, invalidate.
     * @throws domain::ConflictError if the file changed since it was read.
     */
    SectionEditResult editSection(const SectionEdit& edit);

    /**
     * @brief Applies edits in order, each on its own snapshot.
     *
     * A failing edit is reported in its outcome and does not stop the rest.
     * More than 100 edits fail up front with BATCH_TOO_LARGE.
     */
    std::vector<BatchEditOutcome> editSections(const std::vector<SectionEdit>& edits);

    /** @brief Creates "# title" with an optional overview paragraph. */
    std::shared_ptr<const domain::DocumentRecord> createDocument(const std::string& path, const std::string& title,
                                                                 const std::string& overview = "");

    void deleteDocument(const std::string& path);

    /**
     * @brief Moves a document to a new path (".md" is added when missing).
     *
     * The destination is created exclusively, then the source is removed if it
     * is still at the version that was copied.
     * @throws domain::AddressingError DOCUMENT_EXISTS, NAMESPACE_VIOLATION for /archived/.
     * @throws domain::ConflictError if the source changed during the move.
     */
    std::shared_ptr<const domain::DocumentRecord> moveDocument(const std::string& from, const std::string& to);

    /**
     * @brief Documents under a folder ("/" for all), archived ones excluded unless asked for.
     *
     * Documents that cannot be parsed (too large, too many headings) are left
     * out and logged.
     */
    std::vector<DocumentSummary> listDocuments(const std::string& folder = "/");

private:
    std::shared_ptr<infrastructure::ConcurrencyGuard> m_guard;
    std::shared_ptr<infrastructure::DocumentCache> m_cache;
};

} // namespace sectionvault::application

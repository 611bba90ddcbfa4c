/**
 * @file DocumentService.cpp
 * @brief Implementation of DocumentService.
 */

#include "application/DocumentService.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

#include "application/AddressResolver.hpp"
#include "domain/Errors.hpp"
#include "domain/Limits.hpp"
#include "domain/SectionTree.hpp"

namespace sectionvault::application {

namespace fs = std::filesystem;
using domain::SectionTree;
using json = nlohmann::json;

namespace {

domain::InsertMode ToInsertMode(SectionOperation op) {
    switch (op) {
        case SectionOperation::InsertBefore: return domain::InsertMode::InsertBefore;
        case SectionOperation::InsertAfter: return domain::InsertMode::InsertAfter;
        default: return domain::InsertMode::AppendChild;
    }
}

// Index the inserted heading will have once the new text is parsed.
size_t InsertedIndex(const std::vector<domain::Heading>& headings, const domain::Heading& ref, SectionOperation op) {
    if (op == SectionOperation::InsertBefore) {
        return ref.index;
    }
    return static_cast<size_t>(std::count_if(headings.begin(), headings.end(), [&](const domain::Heading& h) {
        return h.startOffset < ref.endOffset;
    }));
}

// Document address without a "#section" fragment.
domain::Address ResolveWholeDocument(const std::string& path, const char* what) {
    domain::Address address = AddressResolver::Resolve(path);
    if (address.sectionSlug) {
        throw domain::AddressingError("INVALID_PATH", std::string(what) + " must not carry a section",
                                      json{{"path", path}});
    }
    return address;
}

const std::string& RequireTitle(const SectionEdit& edit) {
    if (!edit.title || edit.title->empty()) {
        throw domain::AddressingError("MISSING_PARAMETER",
                                      "A title is required for " + SectionOperationToString(edit.operation),
                                      json{{"document", edit.document}, {"section", edit.section}});
    }
    return *edit.title;
}

} // namespace

DocumentService::DocumentService(std::shared_ptr<infrastructure::ConcurrencyGuard> guard,
                                 std::shared_ptr<infrastructure::DocumentCache> cache)
    : m_guard(std::move(guard)), m_cache(std::move(cache)) {}

std::shared_ptr<const domain::DocumentRecord> DocumentService::viewDocument(const std::string& path) {
    domain::Address address = AddressResolver::Resolve(path);
    auto record = m_cache->get(address.documentPath);
    if (!record) {
        throw domain::DocumentNotFoundError(address.documentPath);
    }
    return record;
}

std::string DocumentService::viewSection(const std::string& address) {
    domain::Address resolved = AddressResolver::Resolve(address);
    if (!resolved.sectionSlug) {
        throw domain::AddressingError("MISSING_PARAMETER", "Section address needs a '#slug' fragment",
                                      json{{"address", address}});
    }
    auto record = m_cache->get(resolved.documentPath);
    if (!record) {
        throw domain::DocumentNotFoundError(resolved.documentPath);
    }
    const domain::Heading& h = SectionTree::Require(record->headings, *resolved.sectionSlug, resolved.documentPath);
    return record->content.substr(h.startOffset, h.endOffset - h.startOffset);
}

SectionEditResult DocumentService::editSection(const SectionEdit& edit) {
    if (edit.section.empty()) {
        throw domain::AddressingError("MISSING_PARAMETER", "A section slug is required",
                                      json{{"document", edit.document}});
    }
    domain::Address address = AddressResolver::Resolve(edit.document + "#" + edit.section);
    const std::string& path = address.documentPath;
    const std::string& slug = *address.sectionSlug;

    infrastructure::FileSnapshot snapshot = m_guard->snapshot(path);
    const auto headings = SectionTree::Parse(snapshot.content);
    const domain::Heading& ref = SectionTree::Require(headings, slug, path);

    SectionEditResult result;
    result.document = path;
    std::string updated;

    switch (edit.operation) {
        case SectionOperation::Replace:
            updated = SectionTree::Replace(snapshot.content, slug, edit.content);
            result.action = "edited";
            break;
        case SectionOperation::Append:
            updated = SectionTree::AppendToBody(snapshot.content, slug, edit.content);
            result.action = "edited";
            break;
        case SectionOperation::Prepend:
            updated = SectionTree::PrependToBody(snapshot.content, slug, edit.content);
            result.action = "edited";
            break;
        case SectionOperation::InsertBefore:
        case SectionOperation::InsertAfter:
        case SectionOperation::AppendChild:
            updated = SectionTree::Insert(snapshot.content, slug, ToInsertMode(edit.operation),
                                          RequireTitle(edit), edit.content, edit.depth);
            result.action = "created";
            break;
        case SectionOperation::Rename:
            updated = SectionTree::Rename(snapshot.content, slug, RequireTitle(edit));
            result.action = "renamed";
            break;
        case SectionOperation::Remove:
            result.removedContent = snapshot.content.substr(ref.startOffset, ref.endOffset - ref.startOffset);
            updated = SectionTree::Remove(snapshot.content, slug);
            result.action = "removed";
            break;
    }

    if (updated.size() > domain::kMaxFileBytes) {
        throw domain::StorageError("FILE_TOO_LARGE", "Edit would exceed the file size limit",
                                   json{{"document", path}, {"size", updated.size()}});
    }

    m_guard->writeIfUnchanged(path, snapshot.version, updated);
    m_cache->invalidate(path);

    // Report the slug the section carries in the rewritten document.
    const auto after = SectionTree::Parse(updated);
    size_t index = ref.index;
    if (result.action == "created") {
        index = InsertedIndex(headings, ref, edit.operation);
    }
    if (result.action == "removed") {
        result.section = ref.slug;
    } else if (index < after.size()) {
        result.section = after[index].slug;
        result.depth = after[index].depth;
    }
    return result;
}

std::vector<BatchEditOutcome> DocumentService::editSections(const std::vector<SectionEdit>& edits) {
    if (edits.size() > domain::kMaxBatchOperations) {
        throw domain::AddressingError("BATCH_TOO_LARGE",
                                      "At most " + std::to_string(domain::kMaxBatchOperations) +
                                      " operations are allowed per batch",
                                      json{{"count", edits.size()}});
    }

    std::vector<BatchEditOutcome> outcomes;
    outcomes.reserve(edits.size());
    for (const auto& edit : edits) {
        BatchEditOutcome outcome;
        outcome.request = edit;
        try {
            outcome.result = editSection(edit);
        } catch (const domain::StoreError& e) {
            outcome.error = e.toJson();
        }
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

std::shared_ptr<const domain::DocumentRecord> DocumentService::createDocument(const std::string& path,
                                                                              const std::string& title,
                                                                              const std::string& overview) {
    domain::Address address = ResolveWholeDocument(path, "A new document path");
    SectionTree::ValidateTitle(title);

    std::string content = SectionTree::HeadingLine(1, title) + "\n\n";
    if (overview.find_first_not_of(" \t\r\n") != std::string::npos) {
        content += overview + "\n";
    }

    m_guard->createExclusive(address.documentPath, content);
    m_cache->invalidate(address.documentPath);
    std::cout << "[DocumentService] Created " << address.documentPath << std::endl;

    auto record = m_cache->get(address.documentPath);
    if (!record) {
        throw domain::DocumentNotFoundError(address.documentPath);
    }
    return record;
}

void DocumentService::deleteDocument(const std::string& path) {
    domain::Address address = ResolveWholeDocument(path, "A document to delete");
    m_guard->remove(address.documentPath);
    m_cache->invalidate(address.documentPath);
    std::cout << "[DocumentService] Deleted " << address.documentPath << std::endl;
}

std::shared_ptr<const domain::DocumentRecord> DocumentService::moveDocument(const std::string& from,
                                                                            const std::string& to) {
    domain::Address source = ResolveWholeDocument(from, "A document to move");
    std::string destinationPath = to;
    if (destinationPath.size() < 3 || destinationPath.compare(destinationPath.size() - 3, 3, ".md") != 0) {
        destinationPath += ".md";
    }
    domain::Address destination = ResolveWholeDocument(destinationPath, "A move destination");

    if (source.documentPath == destination.documentPath) {
        throw domain::AddressingError("INVALID_PATH", "Source and destination are the same document",
                                      json{{"from", source.documentPath}, {"to", destination.documentPath}});
    }
    if (source.policy.name == "archived" || destination.policy.name == "archived") {
        throw domain::AddressingError("NAMESPACE_VIOLATION",
                                      "Documents enter and stay in /archived/ through archive_document",
                                      json{{"from", source.documentPath}, {"to", destination.documentPath}});
    }

    infrastructure::FileSnapshot snapshot = m_guard->snapshot(source.documentPath);
    m_guard->createExclusive(destination.documentPath, snapshot.content);

    auto current = m_guard->currentVersion(source.documentPath);
    if (!current || !(*current == snapshot.version)) {
        m_guard->remove(destination.documentPath);
        throw domain::ConflictError(source.documentPath);
    }
    try {
        m_guard->remove(source.documentPath);
    } catch (const domain::StoreError& e) {
        std::cerr << "[DocumentService] Move of " << source.documentPath << " rolled back: " << e.what() << std::endl;
        m_guard->remove(destination.documentPath);
        throw;
    }

    m_cache->invalidate(source.documentPath);
    m_cache->invalidate(destination.documentPath);
    std::cout << "[DocumentService] Moved " << source.documentPath << " -> " << destination.documentPath << std::endl;

    auto record = m_cache->get(destination.documentPath);
    if (!record) {
        throw domain::DocumentNotFoundError(destination.documentPath);
    }
    return record;
}

std::vector<DocumentSummary> DocumentService::listDocuments(const std::string& folder) {
    std::string prefix = "/";
    if (folder != "/" && !folder.empty()) {
        prefix = AddressResolver::NormalizeFolderPath(folder);
    }
    const bool includeArchived = prefix.compare(0, 10, "/archived/") == 0;

    std::vector<DocumentSummary> documents;
    const fs::path base = m_guard->absolutePath(prefix);
    std::error_code ec;
    if (!fs::is_directory(base, ec)) {
        return documents;
    }

    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::error_code entryError;
        if (!it->is_regular_file(entryError) || it->path().extension() != ".md") continue;

        std::string relative = fs::relative(it->path(), m_guard->root(), entryError).generic_string();
        if (entryError) continue;
        std::string canonical = "/" + relative;
        if (!includeArchived && canonical.compare(0, 10, "/archived/") == 0) continue;

        std::shared_ptr<const domain::DocumentRecord> record;
        try {
            record = m_cache->get(canonical);
        } catch (const domain::StoreError& e) {
            std::cerr << "[DocumentService] Skipping " << canonical << " in listing: " << e.what() << std::endl;
            continue;
        }
        if (!record) continue;  // Removed while listing.

        DocumentSummary summary;
        summary.path = canonical;
        summary.title = record->title;
        summary.namespaceName = record->namespaceName;
        summary.wordCount = record->wordCount;
        summary.headingCount = record->headings.size();
        documents.push_back(std::move(summary));
    }

    if (ec) {
        std::cerr << "[DocumentService] Listing of " << prefix << " stopped early: " << ec.message() << std::endl;
    }

    std::sort(documents.begin(), documents.end(),
              [](const DocumentSummary& a, const DocumentSummary& b) { return a.path < b.path; });
    return documents;
}

} // namespace sectionvault::application

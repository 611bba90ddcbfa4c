/**
 * @file AddressResolver.hpp
 * @brief Turns raw, user-supplied paths into canonical addresses.
 *
 * Pure string handling plus the namespace policy table; no I/O.
 */

#pragma once

#include <string>

#include "domain/Address.hpp"

namespace sectionvault::application {

class AddressResolver {
public:
    /**
     * @brief Resolves "/folder/doc.md" or "/folder/doc.md#section".
     * @throws domain::AddressingError INVALID_PATH for malformed input,
     *         NAMESPACE_VIOLATION for a fragment in a sequential-only namespace.
     */
    static domain::Address Resolve(const std::string& rawPath);

    /**
     * @brief Resolves a section reference: a full "/doc.md#slug" address, or
     * "#slug" / "slug" relative to @p contextDocument.
     */
    static domain::Address ResolveSection(const std::string& reference, const std::string& contextDocument);

    /// Canonical document path: leading '/', no '.', '..' or empty segments, ".md" suffix.
    static std::string NormalizeDocumentPath(const std::string& rawPath);

    /// Canonical folder path, always ending in '/'.
    static std::string NormalizeFolderPath(const std::string& rawPath);

    /// Validates and lower-cases a (possibly hierarchical) section slug.
    static std::string NormalizeSlugPath(const std::string& slug);

    static domain::NamespacePolicy PolicyFor(const std::string& canonicalPath);

    /// Folder part of a canonical document path ("docs/api"), or "root".
    static std::string FolderNamespace(const std::string& canonicalPath);

    /// File name without ".md".
    static std::string DocumentStem(const std::string& canonicalPath);
};

} // namespace sectionvault::application

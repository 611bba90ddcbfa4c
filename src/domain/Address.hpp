/**
 * @file Address.hpp
 * @brief Canonical document/section address and namespace policies.
 */

#pragma once

#include <optional>
#include <string>

namespace sectionvault::domain {

/**
 * @struct NamespacePolicy
 * @brief Rules attached to a top-level folder of the workspace.
 */
struct NamespacePolicy {
    std::string name;             ///< "coordinator", "archived", "docs".
    std::string prefix;           ///< Canonical path prefix, e.g. "/coordinator/".
    bool sequentialOnly = false;  ///< Tasks are worked in order; section fragments are rejected.
    bool autoArchive = false;     ///< Archive the document once every task is completed.
};

/**
 * @struct Address
 * @brief A canonical document path with an optional section slug.
 */
struct Address {
    std::string documentPath;                ///< "/docs/api/auth.md"
    std::optional<std::string> sectionSlug;  ///< "tasks/implement-caching"
    NamespacePolicy policy;

    const std::string& namespaceName() const { return policy.name; }

    std::string toString() const {
        return sectionSlug ? documentPath + "#" + *sectionSlug : documentPath;
    }
};

} // namespace sectionvault::domain

/**
 * @file AddressResolver.cpp
 * @brief Implementation of AddressResolver.
 */

#include "application/AddressResolver.hpp"

#include <vector>

#include "domain/Errors.hpp"
#include "domain/Slug.hpp"

namespace sectionvault::application {

using domain::AddressingError;
using domain::NamespacePolicy;
using json = nlohmann::json;

namespace {

constexpr size_t kMaxSlugLength = 1000;
constexpr size_t kMaxSlugDepth = 20;
constexpr size_t kMaxSlugComponentLength = 200;

const NamespacePolicy kCoordinatorPolicy{"coordinator", "/coordinator/", true, true};
const NamespacePolicy kArchivedPolicy{"archived", "/archived/", false, false};
const NamespacePolicy kDocsPolicy{"docs", "/", false, false};

std::string Trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool HasControlCharacters(const std::string& s) {
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c == 0x7f) return true;
    }
    return false;
}

bool EndsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> SplitSegments(const std::string& rawPath) {
    std::string path = Trim(rawPath);
    if (path.empty()) {
        throw AddressingError("INVALID_PATH", "Path must not be empty");
    }
    if (HasControlCharacters(path)) {
        throw AddressingError("INVALID_PATH", "Path contains control characters", json{{"path", rawPath}});
    }
    for (auto& c : path) {
        if (c == '\\') c = '/';
    }

    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        std::string segment = path.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
        if (segment == "..") {
            throw AddressingError("INVALID_PATH", "Path traversal is not allowed", json{{"path", rawPath}});
        }
        if (!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
        if (slash == std::string::npos) break;
        pos = slash + 1;
    }
    if (segments.empty()) {
        throw AddressingError("INVALID_PATH", "Path has no segments", json{{"path", rawPath}});
    }
    return segments;
}

std::string Join(const std::vector<std::string>& segments) {
    std::string out;
    for (const auto& s : segments) {
        out += "/" + s;
    }
    return out;
}

} // namespace

domain::Address AddressResolver::Resolve(const std::string& rawPath) {
    std::string path = Trim(rawPath);
    std::optional<std::string> fragment;

    size_t hash = path.find('#');
    if (hash != std::string::npos) {
        fragment = path.substr(hash + 1);
        path = path.substr(0, hash);
        if (Trim(*fragment).empty()) {
            throw AddressingError("INVALID_PATH", "Section fragment must not be empty", json{{"path", rawPath}});
        }
    }

    domain::Address address;
    address.documentPath = NormalizeDocumentPath(path);
    address.policy = PolicyFor(address.documentPath);

    if (fragment) {
        if (address.policy.sequentialOnly) {
            throw AddressingError("NAMESPACE_VIOLATION",
                                  "Namespace '" + address.policy.name + "' does not accept section addresses",
                                  json{{"path", rawPath}, {"namespace", address.policy.name}});
        }
        address.sectionSlug = NormalizeSlugPath(*fragment);
    }
    return address;
}

domain::Address AddressResolver::ResolveSection(const std::string& reference, const std::string& contextDocument) {
    std::string ref = Trim(reference);
    if (ref.empty()) {
        throw AddressingError("MISSING_PARAMETER", "Section reference is required");
    }

    domain::Address address;
    if (ref.front() == '/') {
        address = Resolve(ref);
    } else {
        if (Trim(contextDocument).empty()) {
            throw AddressingError("MISSING_PARAMETER",
                                  "A document is required for relative section references",
                                  json{{"section", reference}});
        }
        std::string fragment = ref.front() == '#' ? ref.substr(1) : ref;
        address = Resolve(contextDocument + "#" + fragment);
    }

    if (!address.sectionSlug) {
        throw AddressingError("MISSING_PARAMETER", "Section reference has no section slug",
                              json{{"section", reference}});
    }
    return address;
}

std::string AddressResolver::NormalizeDocumentPath(const std::string& rawPath) {
    auto segments = SplitSegments(rawPath);
    const std::string& file = segments.back();
    if (!EndsWith(file, ".md") || file.size() <= 3) {
        throw AddressingError("INVALID_PATH", "Document path must end in .md", json{{"path", rawPath}});
    }
    return Join(segments);
}

std::string AddressResolver::NormalizeFolderPath(const std::string& rawPath) {
    auto segments = SplitSegments(rawPath);
    if (EndsWith(segments.back(), ".md")) {
        throw AddressingError("INVALID_PATH", "Folder path must not name a document", json{{"path", rawPath}});
    }
    return Join(segments) + "/";
}

std::string AddressResolver::NormalizeSlugPath(const std::string& slug) {
    std::string raw = Trim(slug);
    if (raw.empty()) {
        throw AddressingError("INVALID_SLUG", "Slug must not be empty");
    }
    if (raw.size() > kMaxSlugLength) {
        throw AddressingError("INVALID_SLUG", "Slug is too long", json{{"length", raw.size()}});
    }
    if (HasControlCharacters(raw) || raw.find('\\') != std::string::npos || raw.find('%') != std::string::npos) {
        throw AddressingError("INVALID_SLUG", "Slug contains forbidden characters", json{{"slug", slug}});
    }
    if (raw.find("..") != std::string::npos) {
        throw AddressingError("INVALID_SLUG", "Slug must not contain '..'", json{{"slug", slug}});
    }

    std::string normalized = domain::NormalizeSlugReference(raw);
    if (normalized.empty() || normalized.front() == '/' || normalized.back() == '/') {
        throw AddressingError("INVALID_SLUG", "Slug must not start or end with '/'", json{{"slug", slug}});
    }

    size_t depth = 0;
    size_t pos = 0;
    while (pos <= normalized.size()) {
        size_t slash = normalized.find('/', pos);
        size_t len = (slash == std::string::npos ? normalized.size() : slash) - pos;
        if (len == 0) {
            throw AddressingError("INVALID_SLUG", "Slug has an empty component", json{{"slug", slug}});
        }
        if (len > kMaxSlugComponentLength) {
            throw AddressingError("INVALID_SLUG", "Slug component is too long", json{{"slug", slug}});
        }
        ++depth;
        if (slash == std::string::npos) break;
        pos = slash + 1;
    }
    if (depth > kMaxSlugDepth) {
        throw AddressingError("INVALID_SLUG", "Slug is nested too deeply", json{{"depth", depth}});
    }
    return normalized;
}

domain::NamespacePolicy AddressResolver::PolicyFor(const std::string& canonicalPath) {
    if (canonicalPath.compare(0, kCoordinatorPolicy.prefix.size(), kCoordinatorPolicy.prefix) == 0) {
        return kCoordinatorPolicy;
    }
    if (canonicalPath.compare(0, kArchivedPolicy.prefix.size(), kArchivedPolicy.prefix) == 0) {
        return kArchivedPolicy;
    }
    return kDocsPolicy;
}

std::string AddressResolver::FolderNamespace(const std::string& canonicalPath) {
    size_t lastSlash = canonicalPath.rfind('/');
    if (lastSlash == std::string::npos || lastSlash == 0) {
        return "root";
    }
    return canonicalPath.substr(1, lastSlash - 1);
}

std::string AddressResolver::DocumentStem(const std::string& canonicalPath) {
    size_t lastSlash = canonicalPath.rfind('/');
    std::string file = lastSlash == std::string::npos ? canonicalPath : canonicalPath.substr(lastSlash + 1);
    if (EndsWith(file, ".md")) {
        file.resize(file.size() - 3);
    }
    return file;
}

} // namespace sectionvault::application

#include <cassert>
#include <iostream>
#include <string>

#include "application/AddressResolver.hpp"
#include "domain/Errors.hpp"

using namespace sectionvault;
using application::AddressResolver;

namespace {

template <typename Fn>
std::string ErrorCodeOf(Fn fn) {
    try {
        fn();
    } catch (const domain::AddressingError& e) {
        return e.code();
    }
    return "";
}

void TestDocumentPaths() {
    std::cout << "[Test] Normalizing document paths..." << std::endl;
    assert(AddressResolver::NormalizeDocumentPath("/docs/api.md") == "/docs/api.md");
    assert(AddressResolver::NormalizeDocumentPath("docs/api.md") == "/docs/api.md");
    assert(AddressResolver::NormalizeDocumentPath("  /docs//./api.md ") == "/docs/api.md");
    assert(AddressResolver::NormalizeDocumentPath("\\docs\\api.md") == "/docs/api.md");

    assert(ErrorCodeOf([] { AddressResolver::NormalizeDocumentPath("/docs/../etc/passwd.md"); }) == "INVALID_PATH");
    assert(ErrorCodeOf([] { AddressResolver::NormalizeDocumentPath("/docs/api.txt"); }) == "INVALID_PATH");
    assert(ErrorCodeOf([] { AddressResolver::NormalizeDocumentPath("/.md"); }) == "INVALID_PATH");
    assert(ErrorCodeOf([] { AddressResolver::NormalizeDocumentPath(""); }) == "INVALID_PATH");
    assert(ErrorCodeOf([] { AddressResolver::NormalizeDocumentPath("/a\nb.md"); }) == "INVALID_PATH");

    assert(AddressResolver::NormalizeFolderPath("/docs/api") == "/docs/api/");
    assert(AddressResolver::NormalizeFolderPath("docs/api/") == "/docs/api/");
    assert(ErrorCodeOf([] { AddressResolver::NormalizeFolderPath("/docs/api.md"); }) == "INVALID_PATH");

    assert(AddressResolver::FolderNamespace("/docs/api/auth.md") == "docs/api");
    assert(AddressResolver::FolderNamespace("/readme.md") == "root");
    assert(AddressResolver::DocumentStem("/docs/api/auth.md") == "auth");
    std::cout << "[PASS] Document and folder paths." << std::endl;
}

void TestResolve() {
    std::cout << "[Test] Resolving addresses..." << std::endl;
    auto plain = AddressResolver::Resolve("/docs/api.md");
    assert(plain.documentPath == "/docs/api.md");
    assert(!plain.sectionSlug);
    assert(plain.namespaceName() == "docs");

    auto section = AddressResolver::Resolve("/docs/api.md#Tasks/Implement-Caching");
    assert(section.sectionSlug && *section.sectionSlug == "tasks/implement-caching");
    assert(section.toString() == "/docs/api.md#tasks/implement-caching");

    auto coordinator = AddressResolver::Resolve("/coordinator/active.md");
    assert(coordinator.namespaceName() == "coordinator");
    assert(coordinator.policy.sequentialOnly && coordinator.policy.autoArchive);
    assert(ErrorCodeOf([] { AddressResolver::Resolve("/coordinator/active.md#phase-1"); }) == "NAMESPACE_VIOLATION");

    assert(AddressResolver::Resolve("/archived/old.md").namespaceName() == "archived");
    assert(ErrorCodeOf([] { AddressResolver::Resolve("/docs/api.md#"); }) == "INVALID_PATH");
    std::cout << "[PASS] Namespaces and fragments." << std::endl;
}

void TestSectionReferences() {
    std::cout << "[Test] Resolving section references..." << std::endl;
    auto relative = AddressResolver::ResolveSection("overview", "/docs/api.md");
    assert(relative.documentPath == "/docs/api.md");
    assert(*relative.sectionSlug == "overview");

    auto hashed = AddressResolver::ResolveSection("#overview", "/docs/api.md");
    assert(*hashed.sectionSlug == "overview");

    auto absolute = AddressResolver::ResolveSection("/docs/other.md#intro", "/docs/api.md");
    assert(absolute.documentPath == "/docs/other.md");
    assert(*absolute.sectionSlug == "intro");

    assert(ErrorCodeOf([] { AddressResolver::ResolveSection("overview", ""); }) == "MISSING_PARAMETER");
    assert(ErrorCodeOf([] { AddressResolver::ResolveSection("", "/docs/api.md"); }) == "MISSING_PARAMETER");
    assert(ErrorCodeOf([] { AddressResolver::ResolveSection("/docs/api.md", "/docs/api.md"); }) == "MISSING_PARAMETER");
    std::cout << "[PASS] Relative and absolute section references." << std::endl;
}

void TestSlugValidation() {
    std::cout << "[Test] Validating slugs..." << std::endl;
    assert(AddressResolver::NormalizeSlugPath("Tasks/Item") == "tasks/item");
    assert(AddressResolver::NormalizeSlugPath("#overview") == "overview");
    assert(ErrorCodeOf([] { AddressResolver::NormalizeSlugPath(""); }) == "INVALID_SLUG");
    assert(ErrorCodeOf([] { AddressResolver::NormalizeSlugPath("a/../b"); }) == "INVALID_SLUG");
    assert(ErrorCodeOf([] { AddressResolver::NormalizeSlugPath("/lead"); }) == "INVALID_SLUG");
    assert(ErrorCodeOf([] { AddressResolver::NormalizeSlugPath("trail/"); }) == "INVALID_SLUG");
    assert(ErrorCodeOf([] { AddressResolver::NormalizeSlugPath("a//b"); }) == "INVALID_SLUG");
    assert(ErrorCodeOf([] { AddressResolver::NormalizeSlugPath("a%2fb"); }) == "INVALID_SLUG");
    assert(ErrorCodeOf([] { AddressResolver::NormalizeSlugPath(std::string(201, 'a')); }) == "INVALID_SLUG");

    std::string deep;
    for (int i = 0; i < 21; ++i) {
        deep += (i ? "/" : "") + std::string("x");
    }
    assert(ErrorCodeOf([&] { AddressResolver::NormalizeSlugPath(deep); }) == "INVALID_SLUG");
    std::cout << "[PASS] Slug rules." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting AddressResolver tests..." << std::endl;
    TestDocumentPaths();
    TestResolve();
    TestSectionReferences();
    TestSlugValidation();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}

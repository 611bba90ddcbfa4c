#pragma once

#include <cstddef>

namespace sectionvault::domain {

// Hard limits applied when parsing and editing documents.
constexpr std::size_t kMaxHeadings = 1000;
constexpr std::size_t kMaxTitleLength = 200;
constexpr std::size_t kMaxSectionBytes = 100 * 1024;
constexpr std::size_t kMaxFileBytes = 10 * 1024 * 1024;
constexpr std::size_t kMaxBatchOperations = 100;
constexpr std::size_t kMaxViewedTasks = 10;
constexpr int kMaxHeadingDepth = 6;

} // namespace sectionvault::domain

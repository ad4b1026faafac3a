#pragma once

#include <cstddef>
#include <string>

namespace syncmd::sync {

/// Line-count change above which a body edit counts as material.
constexpr std::size_t kMaterialLineDelta = 3;

constexpr const char* kPreambleMarker = "---";

/**
 * @brief A text document split into its optional key-value preamble and body
 *
 * The preamble is the block between an opening "---" line (first line of the
 * document) and the next "---" line, without the markers themselves.
 */
struct DocumentParts {
    std::string preamble;
    std::string body;
};

DocumentParts split_preamble(const std::string& content);

std::size_t count_lines(const std::string& text);

struct MergeOutcome {
    std::string content;
    bool has_conflict_markers = false;
};

/**
 * @brief Merge two bodies against their common ancestor using line-count deltas
 *
 * Both sides off the ancestor by more than kMaterialLineDelta lines yields
 * conflict markers around both versions. Otherwise the side that changed
 * wins; when neither changed materially the bodies are concatenated,
 * local first.
 */
MergeOutcome merge_bodies(const std::string& local, const std::string& remote, const std::string& base);

/**
 * @brief Preamble-aware three-way merge; a non-empty remote preamble wins
 */
MergeOutcome merge_document(const std::string& local, const std::string& remote, const std::string& base);

} // namespace syncmd::sync

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace diffbudget::diff {

/// Split a unified git diff into per-file sections.
///
/// Rules:
/// - A section starts at every `diff --git ` that begins a line (or the input)
/// - Text before the first boundary, if any, is kept as its own leading section
/// - Empty input yields an empty vector; input without a boundary yields one section
/// - Concatenating the result in order reproduces the input byte for byte
///
/// Purely textual: no hunk or header parsing happens here.
[[nodiscard]] std::vector<std::string> split_diff(std::string_view diff_text);

}  // namespace diffbudget::diff

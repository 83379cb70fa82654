#pragma once

#include "diffbudget/tokenization/token_counter.h"

#include <string>
#include <string_view>

namespace diffbudget::truncation {

inline constexpr std::string_view kTruncationMarker = "[... truncated due to token limit ...]";

// Line ranks for intra-section truncation; lower survives longer.
inline constexpr int kAdditionRank = 0;
inline constexpr int kDeletionRank = 0;
inline constexpr int kHunkHeaderRank = 2;
inline constexpr int kContextRank = 3;

struct SectionTruncation {
  std::string text;
  int token_count = 0;
  bool truncated = false;
};

/// Shrink one section's diff to `token_limit` tokens at line granularity.
///
/// - Text that already fits is returned unchanged
/// - The header (lines through the first "@@") is kept whole when it fits; remaining non-blank
///   lines are admitted by rank (changes, then hunk headers, then context) and emitted in
///   document order
/// - Without a hunk header, or when the header alone does not fit, lines are taken in order
///   until the first one that does not fit
/// - kTruncationMarker is appended when lines were dropped, unless the budget cannot hold
///   the marker and a line besides; then the leading lines are emitted without it
///
/// The result is re-counted as a whole and trimmed further until it fits, so
/// token_count <= token_limit always holds. Text is empty only for token_limit <= 0 or
/// when not a single line fits.
[[nodiscard]] SectionTruncation truncate_section(std::string_view section_text, int token_limit,
                                                 const tokenization::ITokenCounter& counter,
                                                 const std::string& model);

}  // namespace diffbudget::truncation

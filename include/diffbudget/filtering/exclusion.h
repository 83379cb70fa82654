#pragma once

namespace diffbudget::filtering {

// ExclusionReason records which classifier check dropped a section.
// Checks run in declaration order; the first match wins.
enum class ExclusionReason {
  kNone,                 // section is kept
  kBinary,               // "Binary files ... differ" or "GIT binary patch"
  kMinifiedExtension,    // .min.js, .bundle.css, ...
  kBuildDirectory,       // /dist/, /node_modules/, ...
  kLockfileOrGenerated,  // yarn.lock, *.pb.go, ...
  kMinifiedContent,      // long, space-poor lines
};

// Stable machine-readable name ("binary", "minified_extension", ...).
[[nodiscard]] const char* exclusion_reason_to_string(ExclusionReason reason);

// Human-readable diagnostic prefix, e.g. "Filtered out binary file".
[[nodiscard]] const char* exclusion_reason_description(ExclusionReason reason);

}  // namespace diffbudget::filtering

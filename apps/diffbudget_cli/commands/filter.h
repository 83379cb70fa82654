#pragma once

// cmd_filter: drop noise sections (binary, minified, build output, lockfiles) from a diff.
// Usage: diffbudget_cli filter [--input <file>] [--max-workers <n>] [--summaries]
//                              [--keep-color] [--verbose]
int cmd_filter(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

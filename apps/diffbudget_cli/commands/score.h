#pragma once

// cmd_score: print the importance score of every section, highest first.
// Usage: diffbudget_cli score [--input <file>] [--keep-color] [--json]
int cmd_score(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

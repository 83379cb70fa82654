#pragma once

// cmd_truncate: fit a diff into a token budget without filtering or scoring.
// Every section gets the same score, so sections are considered in input order.
// Usage: diffbudget_cli truncate [--input <file>] [--token-limit <n>] [--model <m>]
//                                [--tokenizer <name>] [--keep-color]
int cmd_truncate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

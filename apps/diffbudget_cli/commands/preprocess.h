#pragma once

// cmd_preprocess: filter, score and truncate a diff to a token budget.
// Usage: diffbudget_cli preprocess [--input <file>] [--token-limit <n>] [--model <m>]
//                                  [--max-workers <n>] [--config <file>] [--cache <path>]
//                                  [--tokenizer <name>] [--summaries] [--keep-color]
//                                  [--json] [--verbose]
int cmd_preprocess(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

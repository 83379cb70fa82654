#pragma once

// cmd_count_tokens: print the token count of the input.
// Usage: diffbudget_cli count-tokens [--input <file>] [--model <m>] [--tokenizer <name>]
//                                    [--keep-color]
int cmd_count_tokens(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

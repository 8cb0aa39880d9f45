#pragma once

// cmd_format: normalize translation files in place or into --output-dir.
// Usage: transfmt format [--dir <path>] [--output-dir <path>] [--include <glob>]...
//                        [--exclude <glob>]... [--eol <unix|win|mac>] [--write-if-unchanged]
//                        [--config <file>] [--report <file>] [--audit-db <file>] [--verbose]
int cmd_format(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_check: same options as format (plus --no-fail); writes nothing.
int cmd_check(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

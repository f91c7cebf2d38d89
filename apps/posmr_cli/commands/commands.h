#pragma once

// Subcommand entry points. argv[1] is the subcommand name; flags start at argv[2].
//
// posmr_cli completion --dataset <file> [--config <file>] [--preset default|strict]
//                      [--db <path>] [--workers N] [--accept-threshold X] [--trace]
// posmr_cli audit      (same flags as completion)
// posmr_cli resolve    --dataset <file> --store-id ID --shop TEXT [--leader TEXT]
// posmr_cli matrix     (completion flags) [--page N] [--limit N] [--search TEXT]
//                      [--sort-by store_name|store_id|region|completion_rate] [--desc|--asc]
// posmr_cli timeline   --dataset <file> [--since YYYY-MM-DD]
int cmd_completion(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_audit(int argc, char* argv[]);       // NOLINT(modernize-avoid-c-arrays)
int cmd_resolve(int argc, char* argv[]);     // NOLINT(modernize-avoid-c-arrays)
int cmd_matrix(int argc, char* argv[]);      // NOLINT(modernize-avoid-c-arrays)
int cmd_timeline(int argc, char* argv[]);    // NOLINT(modernize-avoid-c-arrays)

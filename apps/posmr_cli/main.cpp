#include "commands/commands.h"

#include "posmr/core/version.h"

#include <exception>
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "posm-reconcile v" << posmr::core::kBuildVersion << "\n"
            << "Usage: posmr_cli <command> [options]\n"
            << "Commands:\n"
            << "  completion  Compute per-store, per-model and global POSM completion\n"
            << "  audit       Compute completion and print the audit report\n"
            << "  resolve     Check whether a shop label resolves to a catalog store\n"
            << "  matrix      Print a page of the store x model deployment matrix\n"
            << "  timeline    Print submissions per day\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  try {
    if (subcommand == "completion") {
      return cmd_completion(argc, argv);
    }
    if (subcommand == "audit") {
      return cmd_audit(argc, argv);
    }
    if (subcommand == "resolve") {
      return cmd_resolve(argc, argv);
    }
    if (subcommand == "matrix") {
      return cmd_matrix(argc, argv);
    }
    if (subcommand == "timeline") {
      return cmd_timeline(argc, argv);
    }
    if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
      print_usage();
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}

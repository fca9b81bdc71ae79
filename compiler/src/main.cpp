#include <iostream>
#include <memory>
#include <string>

#include <llvm/Config/llvm-config.h>

#include "driver.hpp"
#include "lexer.hpp"
#include "rules.hpp"

static void print_usage() {
  std::cout << "Silver lexer – usage: silver [options] [command]\n";
  std::cout << "  --help, -h              Show this help\n";
  std::cout << "  --version, -v           Show lexer and LLVM version\n";
  std::cout << "  --strings               Recognize double-quoted string literals\n";
  std::cout << "  repl                    Lex lines from stdin (default)\n";
  std::cout << "  lex <file>              Print the tokens of a file\n";
  std::cout << "  tree <dir>              Print the module tree of a project\n";
  std::cout << "  module <dir> <path>     Load one module of a project and print its tokens\n";
}

int main(int argc, char* argv[]) {
  silver::LexOptions options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    }
    if (arg == "--version" || arg == "-v") {
      std::cout << "Silver lexer (LLVM " << LLVM_VERSION_STRING << ")\n";
      return 0;
    }
    if (arg == "--strings") {
      options.rules.push_back(std::make_shared<silver::StringLiteralRule>());
      continue;
    }
    if (arg == "repl") return silver::run_repl(std::cin, std::cout, std::cerr, options);
    if (arg == "lex" && i + 1 < argc) return silver::run_file(argv[++i], std::cout, std::cerr, options);
    if (arg == "tree" && i + 1 < argc) return silver::run_tree(argv[++i], std::cout, std::cerr);
    if (arg == "module" && i + 2 < argc) {
      std::string root = argv[++i];
      return silver::run_module(root, argv[++i], std::cout, std::cerr, options);
    }
    std::cerr << "silver: unknown argument '" << arg << "'\n";
    print_usage();
    return 1;
  }
  return silver::run_repl(std::cin, std::cout, std::cerr, options);
}

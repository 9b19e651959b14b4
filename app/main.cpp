#include "commands/categories.hpp"
#include "commands/suggest.hpp"
#include "commands/validate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  habitcat suggest --text \"<habit name>\" [args]\n"
        << "  habitcat categories [--registry <path>]\n"
        << "  habitcat validate [--registry <path>] [--out <path>]\n"
        << "  habitcat help\n";
    return 1;
}

static int print_suggest_help() {
    std::cerr
        << "usage:\n"
        << "  habitcat suggest --text \"<habit name>\" [options]\n"
        << "\n"
        << "options:\n"
        << "  --text <str>                 (required, may be empty)\n"
        << "  --registry <path>            default: data/registry.json\n"
        << "  --topk <n>                   also list the n best categories (default: 0)\n"
        << "  --json                       print the full result as JSON\n"
        << "  --out <path>                 optional: write the JSON result to a file\n";
    return 0;
}

static int print_validate_help() {
    std::cerr
        << "usage:\n"
        << "  habitcat validate [options]\n"
        << "\n"
        << "options:\n"
        << "  --registry <path>            default: data/registry.json\n"
        << "  --out <path>                 optional: write a JSON validation report\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    if (cmd == "suggest"  && (argc >= 3 && std::string(argv[2]) == "--help")) return print_suggest_help();
    if (cmd == "validate" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_validate_help();

    if (cmd == "suggest")    return cmd_suggest(argc - 1, argv + 1);
    if (cmd == "categories") return cmd_categories(argc - 1, argv + 1);
    if (cmd == "validate")   return cmd_validate(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}

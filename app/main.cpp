#include "commands/batch.hpp"
#include "commands/build.hpp"
#include "commands/explore.hpp"
#include "commands/recommend.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  smartcart build --orders <csv> [args]\n"
        << "  smartcart recommend --item <name> [--item <name> ...] [args]\n"
        << "  smartcart batch --test <csv> [args]\n"
        << "  smartcart explore [args]\n"
        << "  smartcart help\n"
        << "\n"
        << "run 'smartcart <command> --help' for options\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    if (cmd == "build")     return cmd_build(argc - 1, argv + 1);
    if (cmd == "recommend") return cmd_recommend(argc - 1, argv + 1);
    if (cmd == "batch")     return cmd_batch(argc - 1, argv + 1);
    if (cmd == "explore")   return cmd_explore(argc - 1, argv + 1);

    std::cerr << "unknown command: " << cmd << "\n";
    return print_usage();
}

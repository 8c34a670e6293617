#include "fieldpatch/Cli.hpp"

#include <iostream>

int main(int argc, char** argv) {
    return fieldpatch::run_cli(argc, argv, std::cout, std::cerr);
}

/**
 * @file main.cpp
 * @brief tier_gate command-line entry point.
 * @author Dimitris Kafetzis
 */

#include "app/cli.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> words(argv + 1, argv + argc);
    return tier_gate::cli_main(words, {std::cin, std::cout, std::cerr});
}

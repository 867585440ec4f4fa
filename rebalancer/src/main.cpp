#include <iostream>
#include "cli.hpp"

int main() {
    return Cli::run(std::cin, std::cout, std::cerr);
}

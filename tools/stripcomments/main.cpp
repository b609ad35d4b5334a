#include "cli.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    return decomment::cli::run(std::vector<std::string>(argv + 1, argv + argc),
                               std::cin, std::cout, std::cerr);
}

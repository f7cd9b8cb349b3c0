#include "eps2svg/CommandLine.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    return eps2svg::runCli(argc, argv, std::cout, std::cerr);
}

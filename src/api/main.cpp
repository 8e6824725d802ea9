// src/api/main.cpp

#include <iostream>

#include "cli.hpp"

int main(int argc, char* argv[]) {
    return runCli(argc, argv, std::cout, std::cerr);
}

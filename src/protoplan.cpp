#include "protoplan/cli.hpp"

#include <iostream>

int main(const int argc, const char *const *argv) {
    return protoplan::run(argc, argv, std::cout, std::cerr);
}

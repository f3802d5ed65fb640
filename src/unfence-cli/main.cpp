#include "cli.hpp"

#include <iostream>

int main(int argc, char** argv)
{
    std::ios_base::sync_with_stdio(false);
    std::cin.tie(nullptr);

    return unfence::run_cli(argc, argv, std::cin, std::cout, std::cerr);
}

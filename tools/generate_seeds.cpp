#include "rng.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    int count = 1;
    if (argc > 1) {
        char* end = nullptr;
        long parsed = std::strtol(argv[1], &end, 10);
        if (end && *end == '\0' && parsed > 0) {
            count = static_cast<int>(parsed);
        } else {
            std::cerr << "Invalid count provided. Using default of 1.\n";
        }
    }
    std::string deploymentId = (argc > 2) ? argv[2] : "local";

    for (int i = 0; i < count; ++i) {
        std::string seed = sky::generateRoundSeed();
        std::cout << seed << ' ' << sky::seedCommitment(seed, deploymentId) << '\n';
    }

    return 0;
}

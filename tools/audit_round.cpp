#include "crash_point.hpp"
#include "rng.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: audit_round <seed> <houseEdgePercent> [deploymentId] [expectedHash]\n";
        return 1;
    }

    std::string seed = argv[1];
    std::string deploymentId = (argc > 3) ? argv[3] : "local";
    double houseEdge = 0.0;
    try {
        houseEdge = std::stod(argv[2]);
    } catch (const std::exception& ex) {
        std::cerr << "House edge must be a number: " << ex.what() << '\n';
        return 1;
    }

    try {
        sky::CrashPointGenerator generator(deploymentId);
        sky::SeededRng rng(seed, deploymentId);
        auto point = generator.generate(rng, houseEdge);
        std::string commitment = sky::seedCommitment(seed, deploymentId);

        std::cout << "Commitment: " << commitment << '\n';
        if (argc > 4) {
            bool match = commitment == argv[4];
            std::cout << "Commitment check: " << (match ? "valid" : "MISMATCH") << '\n';
            if (!match) {
                return 2;
            }
        }
        std::cout << "Crash multiplier: " << point.multiplier.toString() << "x\n";
        std::cout << "Flight duration: " << point.flightDuration.count() << " ms\n";
        std::cout << "Draws consumed: " << rng.getCallCount() << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "Audit failed: " << ex.what() << '\n';
        return 1;
    }

    return 0;
}

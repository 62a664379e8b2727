#include "crash_point.hpp"
#include "engine_config.hpp"
#include "rng.hpp"

#include <array>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <vector>

int main(int argc, char* argv[]) {
    long rounds = 200'000;
    if (argc > 1) {
        char* end = nullptr;
        long parsed = std::strtol(argv[1], &end, 10);
        if (end && *end == '\0' && parsed > 0) {
            rounds = parsed;
        } else {
            std::cerr << "Invalid round count provided. Using default of " << rounds << ".\n";
        }
    }

    sky::EngineConfig cfg;
    try {
        cfg = sky::EngineConfig::fromEnvironment(cfg);
    } catch (const std::exception& ex) {
        std::cerr << "Invalid configuration: " << ex.what() << '\n';
        return 1;
    }

    sky::CrashPointGenerator generator(cfg.deploymentId, cfg.flightLimits());
    sky::InsecureTestRng rng(20240601);

    const std::array<double, 8> targets{ { 1.10, 1.50, 2.00, 3.00, 5.00, 10.00, 25.00, 50.00 } };
    std::vector<long> survived(targets.size(), 0);
    double crashSum = 0.0;
    long longestFlightMs = 0;

    for (long i = 0; i < rounds; ++i) {
        auto point = generator.generate(rng, cfg.houseEdgePercent);
        double crash = point.multiplier.toDouble();
        crashSum += crash;
        if (point.flightDuration.count() > longestFlightMs) {
            longestFlightMs = static_cast<long>(point.flightDuration.count());
        }
        for (std::size_t t = 0; t < targets.size(); ++t) {
            if (targets[t] <= crash) {
                ++survived[t];
            }
        }
    }

    const double edge = cfg.houseEdgePercent / 100.0;
    std::cout << "=== CRASH DISTRIBUTION ===\n";
    std::cout << "House edge: " << cfg.houseEdgePercent << "%  rounds: " << rounds << "\n\n";
    double previous = 0.0;
    for (const auto& band : sky::CrashPointGenerator::bands()) {
        double upper = band.upperBase + band.upperEdgeWeight * edge;
        if (upper > 1.0) {
            upper = 1.0;
        }
        std::cout << "  " << std::setw(6) << band.low.toString() << "x - " << std::setw(6) << band.high.toString()
                  << "x : " << std::fixed << std::setprecision(2) << (upper - previous) * 100.0 << "%\n";
        previous = upper;
    }
    std::cout << "Mean crash: " << std::setprecision(3) << crashSum / static_cast<double>(rounds) << "x\n";
    std::cout << "Longest flight: " << longestFlightMs << " ms\n";

    std::cout << "\n=== RETURN TO PLAYER BY AUTO CASH-OUT ===\n";
    for (std::size_t t = 0; t < targets.size(); ++t) {
        double hitRate = static_cast<double>(survived[t]) / static_cast<double>(rounds);
        double rtp = hitRate * targets[t];
        std::cout << "  @" << std::setw(6) << std::setprecision(2) << targets[t] << "x : hit "
                  << std::setprecision(2) << hitRate * 100.0 << "%  RTP " << rtp * 100.0 << "%\n";
    }

    return 0;
}

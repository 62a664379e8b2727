#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace sky {

class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual double uniform01() = 0;
};

class InsecureTestRng : public RandomSource {
public:
    explicit InsecureTestRng(std::uint64_t seed);
    double uniform01() override;

private:
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> dist_;
};

// Reproducible stream derived from a round seed: draw i is the top 53 bits of
// SHA-256(domain|deployment|seed:i). Anyone holding the revealed seed can replay it.
class SeededRng : public RandomSource {
public:
    SeededRng(std::string seed, std::string deploymentId);

    double uniform01() override;

    const std::string& getSeed() const { return seed_; }
    const std::string& getDeploymentId() const { return deploymentId_; }
    std::uint64_t getCallCount() const { return callCount_; }

private:
    std::array<std::uint8_t, 32> generateHash(std::uint64_t counter) const;

    std::string seed_;
    std::string deploymentId_;
    std::uint64_t callCount_;
};

std::string sha256Hex(const std::string& input);

// Public commitment for a round seed, shown while the seed itself stays hidden.
std::string seedCommitment(const std::string& seed, const std::string& deploymentId);

std::string generateRoundSeed();

// 128-bit random identifier for rounds and bets.
std::string newIdentifier();

} // namespace sky

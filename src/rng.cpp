#include "rng.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <sodium.h>

namespace sky {

namespace {

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

std::string bytesToHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string buildScope(const std::string& deploymentId) {
    if (deploymentId.empty()) {
        throw std::invalid_argument("deploymentId must not be empty for seed domain separation");
    }
    return deploymentId;
}

constexpr std::string_view kSeedDomainTag = "skyline:crash:v1";

std::string randomHex(std::size_t numBytes) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium RNG");
    }
    std::vector<unsigned char> bytes(numBytes);
    randombytes_buf(bytes.data(), bytes.size());
    std::string hex = bytesToHex(bytes.data(), bytes.size());
    sodium_memzero(bytes.data(), bytes.size());
    return hex;
}

} // namespace

InsecureTestRng::InsecureTestRng(std::uint64_t seed)
    : engine_(seed)
    , dist_(0.0, 1.0) {}

double InsecureTestRng::uniform01() {
    return dist_(engine_);
}

SeededRng::SeededRng(std::string seed, std::string deploymentId)
    : seed_(std::move(seed))
    , deploymentId_(buildScope(deploymentId))
    , callCount_(0) {
    if (seed_.empty()) {
        throw std::invalid_argument("round seed must not be empty");
    }
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
}

std::array<std::uint8_t, 32> SeededRng::generateHash(std::uint64_t counter) const {
    std::ostringstream oss;
    oss << kSeedDomainTag << "|" << deploymentId_ << "|" << seed_ << ':' << counter;
    std::string input = oss.str();

    static_assert(crypto_hash_sha256_BYTES == 32, "unexpected SHA-256 digest size");
    std::array<std::uint8_t, 32> hash{};
    crypto_hash_sha256(hash.data(),
                       reinterpret_cast<const unsigned char*>(input.data()),
                       input.size());
    return hash;
}

double SeededRng::uniform01() {
    auto hash = generateHash(callCount_++);

    std::uint64_t val = 0;
    for (int i = 0; i < 8; ++i) {
        val = (val << 8) | hash[i];
    }

    val >>= 11;
    return static_cast<double>(val) / static_cast<double>(1ULL << 53);
}

std::string sha256Hex(const std::string& input) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
    unsigned char hash[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(hash, reinterpret_cast<const unsigned char*>(input.data()), input.size());
    return bytesToHex(hash, sizeof(hash));
}

std::string seedCommitment(const std::string& seed, const std::string& deploymentId) {
    std::ostringstream oss;
    oss << kSeedDomainTag << "|" << buildScope(deploymentId) << "|" << seed;
    return sha256Hex(oss.str());
}

std::string generateRoundSeed() {
    // 32 bytes of entropy renders a 64-character hex seed.
    return randomHex(32);
}

std::string newIdentifier() {
    return randomHex(16);
}

} // namespace sky

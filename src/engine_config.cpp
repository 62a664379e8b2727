#include "engine_config.hpp"

#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace sky {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

bool readEnv(const char* name, std::string& out) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return false;
    }
    out = trim(env);
    return !out.empty();
}

std::chrono::milliseconds parseMillis(const char* name, const std::string& text) {
    try {
        std::size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size() || value < 0) {
            throw std::invalid_argument(text);
        }
        return std::chrono::milliseconds(value);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(name) + " must be a non-negative integer of milliseconds");
    }
}

Fixed64 parseAmount(const char* name, const std::string& text) {
    try {
        return Fixed64::parse(text);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " must be a decimal amount");
    }
}

bool parseFlag(const char* name, const std::string& text) {
    if (text == "1" || text == "true" || text == "on" || text == "yes") {
        return true;
    }
    if (text == "0" || text == "false" || text == "off" || text == "no") {
        return false;
    }
    throw std::invalid_argument(std::string(name) + " must be a boolean flag");
}

void require(bool condition, const char* message) {
    if (!condition) {
        throw std::invalid_argument(message);
    }
}

} // namespace

void EngineConfig::validate() const {
    require(std::isfinite(houseEdgePercent) && houseEdgePercent >= 0.0 &&
                houseEdgePercent <= CrashPointGenerator::kMaxHouseEdgePercent,
            "houseEdgePercent must be within [0, 50]");
    require(bettingWindow.count() > 0, "bettingWindow must be positive");
    require(interRoundPause.count() >= 0, "interRoundPause must not be negative");
    require(tickInterval.count() > 0, "tickInterval must be positive");
    require(minBet > Fixed64() && minBet.isCentAligned(), "minBet must be a positive cent amount");
    require(maxBet >= minBet && maxBet.isCentAligned(), "maxBet must be a cent amount >= minBet");
    require(minAutoCashout > Fixed64(1) && minAutoCashout.isCentAligned(),
            "minAutoCashout must be above 1.00");
    require(maxAutoCashout >= minAutoCashout && maxAutoCashout.isCentAligned(),
            "maxAutoCashout must be >= minAutoCashout");
    require(minFlight.count() > 0, "minFlight must be positive");
    require(maxFlight >= minFlight, "maxFlight must be >= minFlight");
    require(maintenancePoll.count() > 0, "maintenancePoll must be positive");
    require(creationRetryBackoff.count() > 0, "creationRetryBackoff must be positive");
    require(maxCreationRetryBackoff >= creationRetryBackoff,
            "maxCreationRetryBackoff must be >= creationRetryBackoff");
    require(stallTimeout > maxFlight, "stallTimeout must exceed maxFlight");
    require(externalCallTimeout.count() > 0, "externalCallTimeout must be positive");
    require(historySize > 0, "historySize must be positive");
    require(transcriptRetention > 0, "transcriptRetention must be positive");
    require(!deploymentId.empty(), "deploymentId must not be empty");
}

EngineConfig EngineConfig::fromEnvironment(EngineConfig base) {
    std::string value;
    if (readEnv("SKY_HOUSE_EDGE", value)) {
        base.houseEdgePercent = parseAmount("SKY_HOUSE_EDGE", value).toDouble();
    }
    if (readEnv("SKY_BETTING_MS", value)) {
        base.bettingWindow = parseMillis("SKY_BETTING_MS", value);
    }
    if (readEnv("SKY_PAUSE_MS", value)) {
        base.interRoundPause = parseMillis("SKY_PAUSE_MS", value);
    }
    if (readEnv("SKY_TICK_MS", value)) {
        base.tickInterval = parseMillis("SKY_TICK_MS", value);
    }
    if (readEnv("SKY_MIN_BET", value)) {
        base.minBet = parseAmount("SKY_MIN_BET", value);
    }
    if (readEnv("SKY_MAX_BET", value)) {
        base.maxBet = parseAmount("SKY_MAX_BET", value);
    }
    if (readEnv("SKY_MAX_FLIGHT_MS", value)) {
        base.maxFlight = parseMillis("SKY_MAX_FLIGHT_MS", value);
    }
    if (readEnv("SKY_MAINTENANCE", value)) {
        base.maintenanceMode = parseFlag("SKY_MAINTENANCE", value);
    }
    if (readEnv("SKY_DEPLOYMENT_ID", value)) {
        base.deploymentId = value;
    }
    base.validate();
    return base;
}

std::string EngineConfig::describe() const {
    std::ostringstream oss;
    oss << "edge=" << houseEdgePercent << "% betting=" << bettingWindow.count()
        << "ms pause=" << interRoundPause.count() << "ms tick=" << tickInterval.count()
        << "ms bet=[" << minBet.toString() << "," << maxBet.toString() << "] auto=["
        << minAutoCashout.toString() << "," << maxAutoCashout.toString() << "] flight=["
        << minFlight.count() << "," << maxFlight.count() << "]ms maintenance="
        << (maintenanceMode ? "on" : "off") << " deployment=" << deploymentId;
    return oss.str();
}

} // namespace sky

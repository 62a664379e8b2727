#pragma once

#include "round.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

namespace sky {

enum class EventKind {
    EngineStart,
    EngineStop,
    RoundStart,
    FlyingStart,
    Cashout,
    Crash,
    ForceCrash,
    SettlementSummary,
    ConfigUpdate,
    Error
};

const char* toString(EventKind kind);

struct EngineEvent {
    EventKind kind = EventKind::Error;
    std::uint64_t roundNumber = 0;
    std::string detail;
    Timestamp at{};

    // Canonical "KIND|round|millis|detail" line; this is what gets hashed.
    std::string encode() const;
};

using EventListener = std::function<void(const EngineEvent&)>;

// Audit trail of engine events: each event is an independent SHA-256 leaf and the
// Merkle root commits to all of them. Safe to append from the scheduler and request
// threads at once.
class TranscriptLog {
public:
    void append(EventKind kind, std::uint64_t roundNumber, std::string detail);

    void subscribe(EventListener listener);
    // Lines are mirrored as "[sky] KIND round=N detail"; errors also go to std::cerr.
    void mirrorTo(std::ostream* out);

    std::string getLeaf(std::size_t index) const;
    std::vector<EngineEvent> events() const;
    std::vector<EngineEvent> eventsOf(EventKind kind) const;

    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;
    static bool verifyProof(const std::string& leaf,
                            std::size_t leafIndex,
                            const std::vector<std::string>& proof,
                            const std::string& root);

    // Folds every event but the newest `keepEvents` into a single anchor leaf at
    // index 0 holding the Merkle root they had. Later roots and proofs cover the
    // anchor plus the retained leaves, so leaf i + 1 is event i once anchored.
    void compact(std::size_t keepEvents);
    bool anchored() const;

    std::size_t size() const;
    void clear();

private:
    static std::string hashPair(const std::string& left, const std::string& right);
    static std::string rootOf(std::vector<std::string> layer);

    mutable std::mutex mutex_;
    std::vector<EngineEvent> events_;
    std::vector<std::string> leaves_;
    std::vector<EventListener> listeners_;
    std::ostream* mirror_ = nullptr;
    bool anchored_ = false;
};

} // namespace sky

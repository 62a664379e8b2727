#include "transcript_log.hpp"

#include "rng.hpp"

#include <iostream>
#include <sstream>

namespace sky {

const char* toString(EventKind kind) {
    switch (kind) {
    case EventKind::EngineStart:
        return "ENGINE_START";
    case EventKind::EngineStop:
        return "ENGINE_STOP";
    case EventKind::RoundStart:
        return "ROUND_START";
    case EventKind::FlyingStart:
        return "FLYING_START";
    case EventKind::Cashout:
        return "CASHOUT";
    case EventKind::Crash:
        return "CRASH";
    case EventKind::ForceCrash:
        return "FORCE_CRASH";
    case EventKind::SettlementSummary:
        return "SETTLEMENT";
    case EventKind::ConfigUpdate:
        return "CONFIG_UPDATE";
    case EventKind::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

std::string EngineEvent::encode() const {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
    std::ostringstream oss;
    oss << toString(kind) << "|" << roundNumber << "|" << millis << "|" << detail;
    return oss.str();
}

void TranscriptLog::append(EventKind kind, std::uint64_t roundNumber, std::string detail) {
    EngineEvent event;
    event.kind = kind;
    event.roundNumber = roundNumber;
    event.detail = std::move(detail);
    event.at = std::chrono::system_clock::now();
    std::string leaf = sha256Hex(event.encode());

    std::vector<EventListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leaves_.push_back(std::move(leaf));
        events_.push_back(event);
        listeners = listeners_;
        if (mirror_ != nullptr) {
            *mirror_ << "[sky] " << toString(kind) << " round=" << roundNumber << " "
                     << event.detail << "\n";
        }
        if (kind == EventKind::Error && mirror_ != &std::cerr) {
            std::cerr << "[sky] ERROR round=" << roundNumber << " " << event.detail << "\n";
        }
    }

    for (const auto& listener : listeners) {
        listener(event);
    }
}

void TranscriptLog::subscribe(EventListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void TranscriptLog::mirrorTo(std::ostream* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    mirror_ = out;
}

std::string TranscriptLog::getLeaf(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::vector<EngineEvent> TranscriptLog::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<EngineEvent> TranscriptLog::eventsOf(EventKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EngineEvent> out;
    for (const auto& event : events_) {
        if (event.kind == kind) {
            out.push_back(event);
        }
    }
    return out;
}

std::string TranscriptLog::hashPair(const std::string& left, const std::string& right) {
    return sha256Hex(left + right);
}

std::string TranscriptLog::merkleRoot() const {
    std::vector<std::string> layer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        layer = leaves_;
    }
    return rootOf(std::move(layer));
}

std::string TranscriptLog::rootOf(std::vector<std::string> layer) {
    if (layer.empty()) {
        return {};
    }

    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            if (i + 1 < layer.size()) {
                next.push_back(hashPair(layer[i], layer[i + 1]));
            } else {
                next.push_back(hashPair(layer[i], layer[i]));
            }
        }
        layer = std::move(next);
    }

    return layer.front();
}

std::vector<std::string> TranscriptLog::merkleProof(std::size_t leafIndex) const {
    std::vector<std::string> proof;
    std::vector<std::string> layer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        layer = leaves_;
    }
    if (leafIndex >= layer.size()) {
        return proof;
    }

    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);

        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& left = layer[i];
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(left, right));

            if (i == index || i + 1 == index) {
                proof.push_back((i == index) ? right : left);
            }
        }
        index /= 2;
        layer = std::move(next);
    }

    return proof;
}

bool TranscriptLog::verifyProof(const std::string& leaf,
                                std::size_t leafIndex,
                                const std::vector<std::string>& proof,
                                const std::string& root) {
    std::string current = leaf;
    std::size_t index = leafIndex;
    for (const auto& sibling : proof) {
        current = (index % 2 == 0) ? hashPair(current, sibling) : hashPair(sibling, current);
        index /= 2;
    }
    return current == root;
}

void TranscriptLog::compact(std::size_t keepEvents) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.size() <= keepEvents) {
        return;
    }
    const std::size_t drop = events_.size() - keepEvents;
    std::vector<std::string> leaves;
    leaves.reserve(keepEvents + 1);
    leaves.push_back(rootOf(leaves_));
    leaves.insert(leaves.end(), leaves_.end() - static_cast<std::ptrdiff_t>(keepEvents), leaves_.end());
    leaves_ = std::move(leaves);
    events_.erase(events_.begin(), events_.begin() + static_cast<std::ptrdiff_t>(drop));
    anchored_ = true;
}

bool TranscriptLog::anchored() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return anchored_;
}

std::size_t TranscriptLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leaves_.size();
}

void TranscriptLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    leaves_.clear();
    events_.clear();
    anchored_ = false;
}

} // namespace sky

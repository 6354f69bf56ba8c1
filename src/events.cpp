// =============================================================================
// events.cpp - Event bus and sinks
// =============================================================================

#include "yield/events.hpp"

#include <algorithm>

namespace yield {

const char* to_string(EventType type) noexcept {
    switch (type) {
        case EventType::PoolCreated: return "PoolCreated";
        case EventType::PoolUpdated: return "PoolUpdated";
        case EventType::PositionCreated: return "PositionCreated";
        case EventType::PositionClosed: return "PositionClosed";
        case EventType::SwapExecuted: return "SwapExecuted";
        case EventType::StakeCreated: return "StakeCreated";
        case EventType::Unstaked: return "Unstaked";
        case EventType::RewardClaimed: return "RewardClaimed";
        case EventType::ValidatorCreated: return "ValidatorCreated";
        case EventType::Delegated: return "Delegated";
        case EventType::ValidatorSlashed: return "ValidatorSlashed";
        case EventType::ProposalCreated: return "ProposalCreated";
        case EventType::VoteCast: return "VoteCast";
    }
    return "unknown";
}

nlohmann::json LedgerEvent::to_json() const {
    return nlohmann::json{
        {"type", yield::to_string(type)},
        {"sequence", sequence},
        {"timestamp", timestamp},
        {"payload", payload}
    };
}

// =============================================================================
// Sinks
// =============================================================================

void JsonLinesSink::on_event(const LedgerEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << event.to_json().dump() << '\n';
}

void RecordingSink::on_event(const LedgerEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
}

std::vector<LedgerEvent> RecordingSink::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<LedgerEvent> RecordingSink::events_of(EventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LedgerEvent> out;
    for (const auto& e : events_) {
        if (e.type == type) out.push_back(e);
    }
    return out;
}

size_t RecordingSink::count(EventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
        [type](const LedgerEvent& e) { return e.type == type; }));
}

void RecordingSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

// =============================================================================
// EventBus
// =============================================================================

void EventBus::subscribe(IEventSink* sink) {
    if (!sink) return;
    std::unique_lock lock(sinks_mutex_);
    if (std::find(sinks_.begin(), sinks_.end(), sink) == sinks_.end()) {
        sinks_.push_back(sink);
    }
}

void EventBus::unsubscribe(IEventSink* sink) {
    std::unique_lock lock(sinks_mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void EventBus::publish(EventType type, uint64_t timestamp, nlohmann::json payload) {
    LedgerEvent event{type, sequence_.fetch_add(1) + 1, timestamp, std::move(payload)};

    std::shared_lock lock(sinks_mutex_);
    for (IEventSink* sink : sinks_) {
        sink->on_event(event);
    }
}

uint64_t EventBus::published() const {
    return sequence_.load();
}

} // namespace yield

#ifndef YIELD_EVENTS_HPP
#define YIELD_EVENTS_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <shared_mutex>
#include <vector>

#include <nlohmann/json.hpp>

namespace yield {

// =============================================================================
// Domain Events
// =============================================================================

enum class EventType : uint8_t {
    PoolCreated = 0,
    PoolUpdated = 1,
    PositionCreated = 2,
    PositionClosed = 3,
    SwapExecuted = 4,
    StakeCreated = 5,
    Unstaked = 6,
    RewardClaimed = 7,
    ValidatorCreated = 8,
    Delegated = 9,
    ValidatorSlashed = 10,
    ProposalCreated = 11,
    VoteCast = 12
};

const char* to_string(EventType type) noexcept;

struct LedgerEvent {
    EventType type;
    uint64_t sequence;      // assigned by the bus, unique per event
    uint64_t timestamp;
    nlohmann::json payload;

    nlohmann::json to_json() const;
};

// =============================================================================
// Sinks
// =============================================================================

// Receives events synchronously, usually while the emitting entity is still
// locked. Implementations must not call back into the ledgers.
class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void on_event(const LedgerEvent& event) = 0;
};

// Writes one JSON object per line (persistence hand-off)
class JsonLinesSink : public IEventSink {
public:
    explicit JsonLinesSink(std::ostream& out) : out_(out) {}
    void on_event(const LedgerEvent& event) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

// Keeps every event in memory
class RecordingSink : public IEventSink {
public:
    void on_event(const LedgerEvent& event) override;

    std::vector<LedgerEvent> events() const;
    std::vector<LedgerEvent> events_of(EventType type) const;
    size_t count(EventType type) const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<LedgerEvent> events_;
};

// =============================================================================
// EventBus
// =============================================================================

class EventBus {
public:
    EventBus() = default;

    // Non-copyable
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Sinks are not owned and must outlive the bus
    void subscribe(IEventSink* sink);
    void unsubscribe(IEventSink* sink);

    void publish(EventType type, uint64_t timestamp, nlohmann::json payload);

    uint64_t published() const;

private:
    mutable std::shared_mutex sinks_mutex_;
    std::vector<IEventSink*> sinks_;
    std::atomic<uint64_t> sequence_{0};
};

} // namespace yield

#endif // YIELD_EVENTS_HPP

#pragma once

#include "Errors.hpp"
#include "Types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rune {

enum class EventKind {
    audio_levels,
    processing_status,
    transcription_result,
    transcription_added,
    settings_changed,
    permissions_changed,
    pipeline_error
};

/// Event name on the wire ("audio-levels", "audio-processing-status", ...).
const char* event_name(EventKind kind);

/// One published event.  Only the fields relevant to `kind` are set.
struct Event {
    EventKind        kind = EventKind::processing_status;
    uint64_t         sequence = 0;            // bus-wide publish order

    LevelFrame       levels{};                // audio_levels
    ProcessingStatus status = ProcessingStatus::idle;  // processing_status
    std::string      session_id;
    std::string      text;                    // transcription_result
    uint64_t         revision = 0;            // transcription_result
    std::optional<TranscriptionRecord> record;  // transcription_added
    std::optional<ErrorCode> error_code;        // pipeline_error
    std::string      message;                   // pipeline_error
    nlohmann::json   data;                      // settings_changed / permissions_changed
};

struct SubscriptionOptions {
    std::size_t level_capacity = 32;   // level frames kept before dropping the oldest
};

/// Receive handle for one subscriber.
///
/// Delivery policy per kind:
/// - audio_levels: bounded queue, the oldest frame is dropped when full.
/// - transcription_result: single slot, a newer revision replaces an
///   undelivered older one; each revision is delivered at most once.
/// - everything else (status, records, errors, notifications): unbounded
///   FIFO, never dropped.
/// `next()` always returns the pending event with the lowest sequence, so
/// events come out in publish order minus whatever the policies dropped.
class Subscription {
public:
    explicit Subscription(SubscriptionOptions options);

    /// Wait up to `timeout` for the next event.
    std::optional<Event> next(std::chrono::milliseconds timeout);

    /// Non-blocking variant of next().
    std::optional<Event> try_next();

    /// Level frames discarded because this subscriber fell behind.
    uint64_t dropped_levels() const;

    /// Stop receiving.  Pending events are discarded; next() returns
    /// immediately from then on.
    void close();
    bool closed() const;

private:
    friend class EventBus;

    void push(const Event& event);
    std::optional<Event> pop_locked();

    SubscriptionOptions     options_;
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<Event>       levels_;
    std::deque<Event>       events_;
    std::optional<Event>    transcript_;
    std::string             delivered_session_;
    uint64_t                delivered_revision_ = 0;
    uint64_t                dropped_levels_ = 0;
    bool                    closed_ = false;
};

/// Process-wide publish/subscribe channel between the pipeline and its
/// observers.  Subscribers that are not listening miss events; there is
/// no replay.
class EventBus {
public:
    EventBus() = default;

    // Non-copyable.
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// The bus keeps only a weak reference; dropping the handle unsubscribes.
    std::shared_ptr<Subscription> subscribe(SubscriptionOptions options = {});

    /// Stamp `event` with the next sequence number and fan it out.
    void publish(Event event);

    void publish_levels(const LevelFrame& levels);
    void publish_status(ProcessingStatus status, const std::string& session_id);
    void publish_transcript(const std::string& session_id, const std::string& text,
                            uint64_t revision);
    void publish_record(const std::string& session_id, const TranscriptionRecord& record);
    void publish_error(ErrorCode code, const std::string& message,
                       const std::string& session_id = {});
    void publish_settings(const nlohmann::json& settings);
    void publish_permissions(const nlohmann::json& permissions);

    std::size_t subscriber_count() const;

private:
    mutable std::mutex                        mu_;
    uint64_t                                  sequence_ = 0;
    std::vector<std::weak_ptr<Subscription>>  subscribers_;
};

} // namespace rune

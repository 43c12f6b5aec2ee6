#include "EventBus.hpp"

#include "Log.hpp"

#include <algorithm>
#include <utility>

namespace rune {

const char* event_name(EventKind kind) {
    switch (kind) {
        case EventKind::audio_levels:         return "audio-levels";
        case EventKind::processing_status:    return "audio-processing-status";
        case EventKind::transcription_result: return "transcription-result";
        case EventKind::transcription_added:  return "transcription-added";
        case EventKind::settings_changed:     return "settings-changed";
        case EventKind::permissions_changed:  return "permissions-changed";
        case EventKind::pipeline_error:       return "pipeline-error";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Subscription
// ---------------------------------------------------------------------------

Subscription::Subscription(SubscriptionOptions options)
    : options_(options) {
    options_.level_capacity = std::max<std::size_t>(1, options_.level_capacity);
}

void Subscription::push(const Event& event) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (closed_) return;

        switch (event.kind) {
            case EventKind::audio_levels:
                if (levels_.size() >= options_.level_capacity) {
                    levels_.pop_front();
                    ++dropped_levels_;
                }
                levels_.push_back(event);
                break;

            case EventKind::transcription_result:
                if (event.session_id == delivered_session_
                    && event.revision <= delivered_revision_) {
                    return;
                }
                if (transcript_ && transcript_->session_id == event.session_id
                    && transcript_->revision >= event.revision) {
                    return;
                }
                transcript_ = event;
                break;

            default:
                events_.push_back(event);
                break;
        }
    }
    cv_.notify_one();
}

std::optional<Event> Subscription::pop_locked() {
    // Pick the queue whose head was published first.
    enum class Source { none, levels, events, transcript };
    Source   source = Source::none;
    uint64_t lowest = 0;

    auto consider = [&](Source s, uint64_t seq) {
        if (source == Source::none || seq < lowest) {
            source = s;
            lowest = seq;
        }
    };
    if (!levels_.empty()) consider(Source::levels, levels_.front().sequence);
    if (!events_.empty()) consider(Source::events, events_.front().sequence);
    if (transcript_)      consider(Source::transcript, transcript_->sequence);

    std::optional<Event> out;
    switch (source) {
        case Source::levels:
            out = std::move(levels_.front());
            levels_.pop_front();
            break;
        case Source::events:
            out = std::move(events_.front());
            events_.pop_front();
            break;
        case Source::transcript:
            out = std::move(transcript_);
            transcript_.reset();
            delivered_session_  = out->session_id;
            delivered_revision_ = out->revision;
            break;
        case Source::none:
            break;
    }
    return out;
}

std::optional<Event> Subscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait_for(lock, timeout, [this] {
        return closed_ || !levels_.empty() || !events_.empty() || transcript_.has_value();
    });
    if (closed_) return std::nullopt;
    return pop_locked();
}

std::optional<Event> Subscription::try_next() {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) return std::nullopt;
    return pop_locked();
}

uint64_t Subscription::dropped_levels() const {
    std::lock_guard<std::mutex> lock(mu_);
    return dropped_levels_;
}

void Subscription::close() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        closed_ = true;
        levels_.clear();
        events_.clear();
        transcript_.reset();
    }
    cv_.notify_all();
}

bool Subscription::closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
}

// ---------------------------------------------------------------------------
// EventBus
// ---------------------------------------------------------------------------

std::shared_ptr<Subscription> EventBus::subscribe(SubscriptionOptions options) {
    auto sub = std::make_shared<Subscription>(options);
    std::lock_guard<std::mutex> lock(mu_);
    subscribers_.push_back(sub);
    return sub;
}

void EventBus::publish(Event event) {
    std::lock_guard<std::mutex> lock(mu_);
    event.sequence = ++sequence_;

    const std::size_t before = subscribers_.size();
    subscribers_.erase(
        std::remove_if(subscribers_.begin(), subscribers_.end(),
                       [](const std::weak_ptr<Subscription>& w) {
                           auto s = w.lock();
                           return !s || s->closed();
                       }),
        subscribers_.end());
    if (subscribers_.size() != before) {
        log::debug("events", "dropped " + std::to_string(before - subscribers_.size())
                                 + " departed subscriber(s)");
    }

    for (auto& weak : subscribers_) {
        if (auto sub = weak.lock()) sub->push(event);
    }
}

void EventBus::publish_levels(const LevelFrame& levels) {
    Event e;
    e.kind   = EventKind::audio_levels;
    e.levels = levels;
    publish(std::move(e));
}

void EventBus::publish_status(ProcessingStatus status, const std::string& session_id) {
    Event e;
    e.kind       = EventKind::processing_status;
    e.status     = status;
    e.session_id = session_id;
    publish(std::move(e));
}

void EventBus::publish_transcript(const std::string& session_id, const std::string& text,
                                  uint64_t revision) {
    Event e;
    e.kind       = EventKind::transcription_result;
    e.session_id = session_id;
    e.text       = text;
    e.revision   = revision;
    publish(std::move(e));
}

void EventBus::publish_record(const std::string& session_id, const TranscriptionRecord& record) {
    Event e;
    e.kind       = EventKind::transcription_added;
    e.session_id = session_id;
    e.record     = record;
    e.text       = record.text;
    publish(std::move(e));
}

void EventBus::publish_error(ErrorCode code, const std::string& message,
                             const std::string& session_id) {
    Event e;
    e.kind       = EventKind::pipeline_error;
    e.error_code = code;
    e.message    = message;
    e.session_id = session_id;
    publish(std::move(e));
}

void EventBus::publish_settings(const nlohmann::json& settings) {
    Event e;
    e.kind = EventKind::settings_changed;
    e.data = settings;
    publish(std::move(e));
}

void EventBus::publish_permissions(const nlohmann::json& permissions) {
    Event e;
    e.kind = EventKind::permissions_changed;
    e.data = permissions;
    publish(std::move(e));
}

std::size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::size_t n = 0;
    for (const auto& weak : subscribers_) {
        auto sub = weak.lock();
        if (sub && !sub->closed()) ++n;
    }
    return n;
}

} // namespace rune

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace signflow {

enum class HeadPose { Neutral, Nod, Shake };
enum class Brows { Neutral, Raised };
enum class Mouth { Closed, Open };

const char* head_pose_name(HeadPose pose);
const char* brows_name(Brows brows);
const char* mouth_name(Mouth mouth);

// Face/head metadata from an analyzer outside the hand path
struct NonManualAnnotation {
    int64_t timestamp_ms{0};
    HeadPose head_pose{HeadPose::Neutral};
    Brows brows{Brows::Neutral};
    Mouth mouth{Mouth::Closed};
};

struct SequenceCommitted {
    std::vector<std::string> tokens;
    std::vector<NonManualAnnotation> nonmanuals;
    std::string origin{"UNKNOWN"};
    float confidence{0.0f};
    int64_t timestamp_ms{0};
};

struct AlphabetWordCommitted {
    std::string word;
    int64_t timestamp_ms{0};
};

using GlossEvent = std::variant<SequenceCommitted, AlphabetWordCommitted>;

// {"type":"sequence",...} or {"type":"word",...}
std::string event_to_json(const GlossEvent& event);

/**
 * @brief Fire-and-forget fan-out of committed events
 *
 * Handlers run synchronously on the publishing thread, outside the bus
 * lock, so a handler may subscribe or unsubscribe. The most recent event
 * of each kind is kept for late readers.
 */
class EventBus {
public:
    using Handler = std::function<void(const GlossEvent&)>;
    using SubscriptionId = uint64_t;

    EventBus() = default;

    SubscriptionId subscribe(Handler handler);
    void unsubscribe(SubscriptionId id);
    size_t subscriber_count() const;

    // False when the event carries no tokens or an empty word
    bool publish(const GlossEvent& event);

    std::optional<SequenceCommitted> last_sequence() const;
    std::optional<AlphabetWordCommitted> last_word() const;

    uint64_t published() const;

    bool verbose{false};

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Handler> handlers_;
    SubscriptionId next_id_{1};
    std::optional<SequenceCommitted> last_sequence_;
    std::optional<AlphabetWordCommitted> last_word_;
    uint64_t published_{0};

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
};

} // namespace signflow

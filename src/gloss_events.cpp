#include "signflow/gloss_events.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

namespace signflow {

const char* head_pose_name(HeadPose pose) {
    switch (pose) {
        case HeadPose::Nod: return "nod";
        case HeadPose::Shake: return "shake";
        case HeadPose::Neutral: return "neutral";
    }
    return "neutral";
}

const char* brows_name(Brows brows) {
    return brows == Brows::Raised ? "raised" : "neutral";
}

const char* mouth_name(Mouth mouth) {
    return mouth == Mouth::Open ? "open" : "closed";
}

namespace {

struct EventJson {
    nlohmann::json operator()(const SequenceCommitted& e) const {
        nlohmann::json j;
        j["type"] = "sequence";
        j["tokens"] = e.tokens;
        j["origin"] = e.origin;
        j["confidence"] = e.confidence;
        j["timestamp"] = e.timestamp_ms;
        j["nonmanuals"] = nlohmann::json::array();
        for (const auto& n : e.nonmanuals) {
            j["nonmanuals"].push_back({
                {"timestamp", n.timestamp_ms},
                {"head_pose", head_pose_name(n.head_pose)},
                {"brows", brows_name(n.brows)},
                {"mouth", mouth_name(n.mouth)}
            });
        }
        return j;
    }

    nlohmann::json operator()(const AlphabetWordCommitted& e) const {
        return {{"type", "word"}, {"word", e.word}, {"timestamp", e.timestamp_ms}};
    }
};

} // namespace

std::string event_to_json(const GlossEvent& event) {
    return std::visit(EventJson{}, event).dump();
}

EventBus::SubscriptionId EventBus::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    handlers_[id] = std::move(handler);
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(id);
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

bool EventBus::publish(const GlossEvent& event) {
    std::vector<Handler> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const auto* seq = std::get_if<SequenceCommitted>(&event)) {
            if (seq->tokens.empty()) {
                std::cerr << "[EventBus] Dropping sequence event without tokens\n";
                return false;
            }
            last_sequence_ = *seq;
        } else if (const auto* word = std::get_if<AlphabetWordCommitted>(&event)) {
            if (word->word.empty()) {
                std::cerr << "[EventBus] Dropping empty alphabet word\n";
                return false;
            }
            last_word_ = *word;
        }
        ++published_;
        targets.reserve(handlers_.size());
        for (const auto& entry : handlers_) targets.push_back(entry.second);
    }

    if (verbose) std::cerr << "[EventBus] " << event_to_json(event) << "\n";

    for (const auto& handler : targets) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            std::cerr << "[EventBus] Subscriber threw: " << e.what() << "\n";
        }
    }
    return true;
}

std::optional<SequenceCommitted> EventBus::last_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_sequence_;
}

std::optional<AlphabetWordCommitted> EventBus::last_word() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_word_;
}

uint64_t EventBus::published() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

} // namespace signflow

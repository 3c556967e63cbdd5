#include "signflow/sequence_accumulator.hpp"
#include "signflow/label_map.hpp"
#include <iostream>
#include <algorithm>

namespace signflow {

std::string AccumulatorSnapshot::display_text() const {
    std::string text;
    for (const auto& token : tokens) {
        if (!text.empty()) text += ' ';
        text += token;
    }
    if (!current_word.empty()) {
        if (!text.empty()) text += ' ';
        text += "[" + current_word + "]";
    }
    return text;
}

SequenceAccumulator::SequenceAccumulator() = default;

SequenceAccumulator::SequenceAccumulator(const AccumulatorConfig& config)
    : config_(config) {
}

void SequenceAccumulator::set_event_sink(EventSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void SequenceAccumulator::set_config(const AccumulatorConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

AccumulatorConfig SequenceAccumulator::get_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void SequenceAccumulator::append(const std::string& token, int64_t now_ms) {
    if (token.empty()) return;
    std::vector<GlossEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (LabelMap::is_alphabet_letter(token)) {
            word_ += token;
            last_letter_ms_ = now_ms;
            last_input_ = LastInput::Alphabet;
            // Letters count toward the cap like tokens do
            if (tokens_.size() + word_.size() >= static_cast<size_t>(config_.capacity)) {
                commit_word_locked(now_ms, events);
            }
        } else {
            commit_word_locked(now_ms, events);
            append_main_locked(token, now_ms, events);
        }
    }
    dispatch(events);
}

void SequenceAccumulator::append_main_locked(const std::string& token, int64_t now_ms,
                                             std::vector<GlossEvent>& out) {
    if (tokens_.size() >= static_cast<size_t>(config_.capacity)) {
        std::cerr << "[Accumulator] Sequence full, dropping token " << token << "\n";
        return;
    }
    tokens_.push_back(token);
    last_token_ms_ = now_ms;
    last_input_ = LastInput::Main;
    if (tokens_.size() >= static_cast<size_t>(config_.capacity)) {
        commit_sequence_locked(now_ms, out);
    }
}

void SequenceAccumulator::commit_word_locked(int64_t now_ms, std::vector<GlossEvent>& out) {
    if (word_.empty()) return;
    std::string word = std::move(word_);
    word_.clear();
    out.emplace_back(AlphabetWordCommitted{word, now_ms});
    append_main_locked(word, now_ms, out);
}

void SequenceAccumulator::commit_sequence_locked(int64_t now_ms, std::vector<GlossEvent>& out) {
    if (tokens_.empty()) return;
    SequenceCommitted event;
    event.tokens = std::move(tokens_);
    event.nonmanuals = std::move(nonmanuals_);
    event.origin = origin_;
    event.confidence = confidence_;
    event.timestamp_ms = now_ms;
    out.emplace_back(std::move(event));
    reset_locked();
}

void SequenceAccumulator::reset_locked() {
    tokens_.clear();
    word_.clear();
    nonmanuals_.clear();
    last_input_ = LastInput::None;
    origin_ = "UNKNOWN";
    confidence_ = 0.0f;
}

void SequenceAccumulator::dispatch(const std::vector<GlossEvent>& events) {
    if (events.empty()) return;
    EventSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink = sink_;
    }
    if (!sink) return;
    for (const auto& event : events) sink(event);
}

void SequenceAccumulator::note_result(const std::string& origin, float confidence) {
    std::lock_guard<std::mutex> lock(mutex_);
    origin_ = origin.empty() ? "UNKNOWN" : origin;
    confidence_ = confidence;
}

void SequenceAccumulator::add_nonmanual(const NonManualAnnotation& annotation) {
    std::lock_guard<std::mutex> lock(mutex_);
    nonmanuals_.push_back(annotation);
}

void SequenceAccumulator::tick(int64_t now_ms) {
    std::vector<GlossEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!word_.empty() && now_ms - last_letter_ms_ >= config_.alphabet_idle_ms) {
            commit_word_locked(now_ms, events);
        }
        if (config_.silence_commit_ms > 0 && word_.empty() && !tokens_.empty() &&
            now_ms - last_token_ms_ >= config_.silence_commit_ms) {
            commit_sequence_locked(now_ms, events);
        }
    }
    dispatch(events);
}

void SequenceAccumulator::backspace() {
    std::lock_guard<std::mutex> lock(mutex_);
    bool prefer_word = last_input_ == LastInput::Alphabet || tokens_.empty();
    if (prefer_word && !word_.empty()) {
        word_.pop_back();
    } else if (!tokens_.empty()) {
        tokens_.pop_back();
    } else if (!word_.empty()) {
        word_.pop_back();
    }
    if (tokens_.empty() && word_.empty()) last_input_ = LastInput::None;
}

void SequenceAccumulator::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked();
}

std::vector<std::string> SequenceAccumulator::commit(int64_t now_ms) {
    std::vector<GlossEvent> events;
    std::vector<std::string> tokens;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        commit_word_locked(now_ms, events);
        commit_sequence_locked(now_ms, events);
    }
    for (const auto& event : events) {
        if (const auto* seq = std::get_if<SequenceCommitted>(&event)) tokens = seq->tokens;
    }
    dispatch(events);
    return tokens;
}

void SequenceAccumulator::discard_word() {
    std::lock_guard<std::mutex> lock(mutex_);
    word_.clear();
    if (last_input_ == LastInput::Alphabet) {
        last_input_ = tokens_.empty() ? LastInput::None : LastInput::Main;
    }
}

bool SequenceAccumulator::full() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size() >= static_cast<size_t>(config_.capacity);
}

size_t SequenceAccumulator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

AccumulatorSnapshot SequenceAccumulator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    AccumulatorSnapshot snap;
    snap.tokens = tokens_;
    snap.current_word = word_;
    snap.alphabet_mode = !word_.empty();
    snap.last_token_ms = std::max(last_token_ms_, last_letter_ms_);
    snap.state = tokens_.empty() && word_.empty() ? BufferState::Empty : BufferState::Filling;
    return snap;
}

} // namespace signflow

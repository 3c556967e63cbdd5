#pragma once

#include "signflow/gloss_events.hpp"
#include "signflow/pipeline_config.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace signflow {

enum class BufferState {
    Empty,    // nothing buffered
    Filling   // tokens or letters pending
};

struct AccumulatorSnapshot {
    std::vector<std::string> tokens;
    std::string current_word;      // letters not yet committed as a word
    bool alphabet_mode{false};
    int64_t last_token_ms{0};
    BufferState state{BufferState::Empty};

    // "HELLO MY [NA]" style text for display
    std::string display_text() const;
};

/**
 * @brief Builds committed sequences from accepted tokens
 *
 * Single letters go to an alphabet sub-buffer and are committed as one
 * word token. Every mutating call takes the same mutex, so commands from
 * a UI thread and appends from the worker never interleave. Events are
 * delivered to the sink after the lock is released.
 */
class SequenceAccumulator {
public:
    using EventSink = std::function<void(const GlossEvent&)>;

    SequenceAccumulator();
    explicit SequenceAccumulator(const AccumulatorConfig& config);

    void set_event_sink(EventSink sink);
    void set_config(const AccumulatorConfig& config);
    AccumulatorConfig get_config() const;

    void append(const std::string& token, int64_t now_ms);

    // Metadata for the next committed sequence
    void note_result(const std::string& origin, float confidence);
    void add_nonmanual(const NonManualAnnotation& annotation);

    // Alphabet idle and silence timeouts
    void tick(int64_t now_ms);

    void backspace();
    void clear();

    // Commits the pending word, then the sequence; returns the tokens
    std::vector<std::string> commit(int64_t now_ms);

    // Drops the pending alphabet word without emitting it
    void discard_word();

    bool full() const;
    size_t size() const;
    AccumulatorSnapshot snapshot() const;

private:
    enum class LastInput { None, Main, Alphabet };

    // Callers hold mutex_; produced events land in `out`
    void append_main_locked(const std::string& token, int64_t now_ms, std::vector<GlossEvent>& out);
    void commit_word_locked(int64_t now_ms, std::vector<GlossEvent>& out);
    void commit_sequence_locked(int64_t now_ms, std::vector<GlossEvent>& out);
    void reset_locked();
    void dispatch(const std::vector<GlossEvent>& events);

    mutable std::mutex mutex_;
    AccumulatorConfig config_;
    EventSink sink_;

    std::vector<std::string> tokens_;
    std::string word_;
    int64_t last_token_ms_{0};
    int64_t last_letter_ms_{0};
    LastInput last_input_{LastInput::None};

    std::string origin_{"UNKNOWN"};
    float confidence_{0.0f};
    std::vector<NonManualAnnotation> nonmanuals_;

    SequenceAccumulator(const SequenceAccumulator&) = delete;
    SequenceAccumulator& operator=(const SequenceAccumulator&) = delete;
};

} // namespace signflow

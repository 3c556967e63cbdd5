#pragma once

#include <atomic>
#include <cstdint>

namespace signflow {

struct DiagnosticsSnapshot {
    uint64_t frames_received = 0;
    uint64_t frames_dropped = 0;       // replaced in the mailbox while busy
    uint64_t frames_skipped = 0;       // adaptive frame skip
    uint64_t frames_rejected = 0;      // gate reject
    uint64_t frames_still = 0;         // gate skip on still hands
    uint64_t frames_processed = 0;
    uint64_t full_detections = 0;
    uint64_t tracking_frames = 0;
    uint64_t detector_errors = 0;
    uint64_t inferences = 0;
    uint64_t inference_failures = 0;
    uint64_t tokens_accepted = 0;
    uint64_t sequences_committed = 0;
    uint64_t words_committed = 0;
    uint64_t stale_results = 0;        // tagged with a superseded session
    uint64_t handler_errors = 0;       // result or degraded handler threw
};

// Owned by the caller and shared by reference; safe to read while the
// pipeline runs.
struct Diagnostics {
    std::atomic<uint64_t> frames_received{0};
    std::atomic<uint64_t> frames_dropped{0};
    std::atomic<uint64_t> frames_skipped{0};
    std::atomic<uint64_t> frames_rejected{0};
    std::atomic<uint64_t> frames_still{0};
    std::atomic<uint64_t> frames_processed{0};
    std::atomic<uint64_t> full_detections{0};
    std::atomic<uint64_t> tracking_frames{0};
    std::atomic<uint64_t> detector_errors{0};
    std::atomic<uint64_t> inferences{0};
    std::atomic<uint64_t> inference_failures{0};
    std::atomic<uint64_t> tokens_accepted{0};
    std::atomic<uint64_t> sequences_committed{0};
    std::atomic<uint64_t> words_committed{0};
    std::atomic<uint64_t> stale_results{0};
    std::atomic<uint64_t> handler_errors{0};

    DiagnosticsSnapshot snapshot() const {
        DiagnosticsSnapshot s;
        s.frames_received = frames_received.load();
        s.frames_dropped = frames_dropped.load();
        s.frames_skipped = frames_skipped.load();
        s.frames_rejected = frames_rejected.load();
        s.frames_still = frames_still.load();
        s.frames_processed = frames_processed.load();
        s.full_detections = full_detections.load();
        s.tracking_frames = tracking_frames.load();
        s.detector_errors = detector_errors.load();
        s.inferences = inferences.load();
        s.inference_failures = inference_failures.load();
        s.tokens_accepted = tokens_accepted.load();
        s.sequences_committed = sequences_committed.load();
        s.words_committed = words_committed.load();
        s.stale_results = stale_results.load();
        s.handler_errors = handler_errors.load();
        return s;
    }

    void reset() {
        frames_received = 0;
        frames_dropped = 0;
        frames_skipped = 0;
        frames_rejected = 0;
        frames_still = 0;
        frames_processed = 0;
        full_detections = 0;
        tracking_frames = 0;
        detector_errors = 0;
        inferences = 0;
        inference_failures = 0;
        tokens_accepted = 0;
        sequences_committed = 0;
        words_committed = 0;
        stale_results = 0;
        handler_errors = 0;
    }
};

} // namespace signflow

#pragma once

#include "signflow/adaptive_controller.hpp"
#include "signflow/cadence_controller.hpp"
#include "signflow/classifier.hpp"
#include "signflow/confidence_gate.hpp"
#include "signflow/diagnostics.hpp"
#include "signflow/feature_extractor.hpp"
#include "signflow/gloss_events.hpp"
#include "signflow/landmarks.hpp"
#include "signflow/motion_analysis.hpp"
#include "signflow/pipeline_config.hpp"
#include "signflow/sequence_accumulator.hpp"
#include "signflow/temporal_smoother.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace signflow {

// Raw camera image handed to a landmark detector
struct CameraFrame {
    int64_t timestamp_ms{0};
    uint32_t width{0};
    uint32_t height{0};
    std::vector<uint8_t> rgb;   // RGB888, row-major
};

/**
 * @brief External hand/pose/face landmark detector
 *
 * Sync mode calls detect() on the worker thread. Async mode calls
 * submit() and expects the result later through `done`, tagged with the
 * session id it was submitted under.
 */
class LandmarkDetector {
public:
    using ResultCallback = std::function<void(LandmarkFrame)>;

    virtual ~LandmarkDetector() = default;

    virtual std::string name() const = 0;

    // std::nullopt on a detector failure
    virtual std::optional<LandmarkFrame> detect(const CameraFrame& frame, bool full_detection) = 0;

    // Default runs detect() inline
    virtual void submit(const CameraFrame& frame, uint64_t session_id, bool full_detection,
                        ResultCallback done);
};

/**
 * @brief Gate -> cadence -> features -> classifier -> smoother -> accumulator
 *
 * One worker thread owns every per-frame stage. Intake is a single slot per
 * input kind: a frame arriving while the slot is still occupied replaces it
 * and the older one is counted as dropped.
 *
 * Frames and detector results carry the session id they were produced
 * under; anything tagged with a superseded session is discarded on arrival.
 * A session id of 0 means "current session".
 */
class RecognitionPipeline {
public:
    using ResultHandler = std::function<void(const RecognitionResult&)>;
    using DegradedHandler = std::function<void(float fps, Profile suggested)>;

    RecognitionPipeline(ProfileRegistry& registry, EventBus& bus, Diagnostics& diagnostics);
    ~RecognitionPipeline();

    // Verifies assets, then initializes the feature extractor and the
    // classifier. False on any configuration error.
    bool init(std::vector<std::unique_ptr<ClassifierBackend>> backends,
              std::unique_ptr<LandmarkDetector> detector = nullptr);

    bool start();
    void stop();
    bool is_running() const { return running_; }

    // True when the worker stopped on a fatal error
    bool failed() const { return failed_; }

    uint64_t begin_session();
    uint64_t session_id() const { return session_; }

    void pause();
    void resume();
    bool paused() const { return paused_; }

    // Intake; false when paused or not running
    bool submit_landmarks(LandmarkFrame frame);
    bool submit_camera_frame(CameraFrame frame);

    // Async detector delivery
    void on_detector_result(LandmarkFrame frame);

    // Cadence decision for callers that run their own detector
    bool request_full_detection();

    // Runs one frame through every stage on the calling thread
    void process(const LandmarkFrame& frame);

    // Timeouts without a new frame
    void tick(int64_t now_ms);

    // User commands
    void backspace();
    void clear();
    std::vector<std::string> commit();
    void push_nonmanual(const NonManualAnnotation& annotation);

    void set_result_handler(ResultHandler handler);
    void set_degraded_handler(DegradedHandler handler);

    std::optional<RecognitionResult> latest_result() const;
    AccumulatorSnapshot sequence() const { return accumulator_.snapshot(); }

    // Diagnostics surface
    float current_fps() const { return fps_; }
    int frame_skip() const { return frame_skip_; }
    int detect_cadence() const { return cadence_value_; }
    bool degraded() const { return degraded_; }
    DetectorMode detection_mode() const;
    std::string detection_backend() const;
    std::string classifier_backend() const { return classifier_.active_backend(); }
    std::string classifier_variant() const { return classifier_.model_variant(); }
    std::string profile_label() const;

private:
    void worker_loop();
    void run_detector(const CameraFrame& frame);
    bool verify_assets(const PipelineConfig& config) const;
    void apply_config(const std::shared_ptr<const PipelineConfig>& config);
    void reset_session_state();
    void handle_event(const GlossEvent& event);
    bool stale(uint64_t session) const;

    ProfileRegistry& registry_;
    EventBus& bus_;
    Diagnostics& diagnostics_;

    std::shared_ptr<const PipelineConfig> config_;
    uint64_t applied_version_{0};
    std::unique_ptr<LandmarkDetector> detector_;

    ConfidenceGate gate_;
    CadenceController cadence_;
    FeatureExtractor extractor_;
    ClassifierAdapter classifier_;
    TemporalSmoother smoother_;
    SequenceAccumulator accumulator_;
    AdaptiveController adaptive_;
    MotionVarianceDetector motion_;
    HandsDownDetector hands_down_;

    // Worker-side state, guarded by process_mutex_
    std::mutex process_mutex_;
    uint64_t frame_index_{0};
    uint64_t skip_counter_{0};
    uint64_t applied_session_{0};

    // Intake slots
    std::mutex slot_mutex_;
    std::condition_variable slot_cv_;
    std::optional<LandmarkFrame> landmark_slot_;
    std::optional<CameraFrame> camera_slot_;

    mutable std::mutex result_mutex_;
    std::optional<RecognitionResult> latest_result_;
    ResultHandler on_result_;
    DegradedHandler on_degraded_;

    std::atomic<uint64_t> session_{1};
    std::atomic<int64_t> last_frame_ms_{0};
    std::atomic<float> fps_{0.0f};
    std::atomic<int> frame_skip_{1};
    std::atomic<int> cadence_value_{5};
    std::atomic<bool> degraded_{false};
    std::atomic<bool> paused_{false};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> failed_{false};
    std::atomic<bool> running_{false};
    std::thread worker_;

    RecognitionPipeline(const RecognitionPipeline&) = delete;
    RecognitionPipeline& operator=(const RecognitionPipeline&) = delete;
};

} // namespace signflow

#include "signflow/recognition_pipeline.hpp"
#include "signflow/asset_manifest.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace signflow {

void LandmarkDetector::submit(const CameraFrame& frame, uint64_t session_id, bool full_detection,
                              ResultCallback done) {
    std::optional<LandmarkFrame> result = detect(frame, full_detection);
    if (!result || !done) return;
    result->session_id = session_id;
    result->full_detection = full_detection;
    done(std::move(*result));
}

RecognitionPipeline::RecognitionPipeline(ProfileRegistry& registry, EventBus& bus, Diagnostics& diagnostics)
    : registry_(registry), bus_(bus), diagnostics_(diagnostics)
{
    accumulator_.set_event_sink([this](const GlossEvent& event) { handle_event(event); });
    adaptive_.set_degraded_callback([this](float fps) {
        degraded_ = true;
        Profile current = config_ ? config_->profile : Profile::Balanced;
        Profile suggested = lighter_profile(current);
        std::cerr << "[Pipeline] Running at " << fps << " fps, consider the "
                  << signflow::profile_label(suggested) << " profile\n";
        DegradedHandler handler;
        {
            std::lock_guard<std::mutex> lock(result_mutex_);
            handler = on_degraded_;
        }
        if (!handler) return;
        try {
            handler(fps, suggested);
        } catch (const std::exception& e) {
            ++diagnostics_.handler_errors;
            std::cerr << "[Pipeline] Degraded handler failed: " << e.what() << "\n";
        }
    });
}

RecognitionPipeline::~RecognitionPipeline() { stop(); }

bool RecognitionPipeline::verify_assets(const PipelineConfig& config) const {
    const std::string& manifest_path = config.classifier.manifest_path;
    if (manifest_path.empty()) return true;

    AssetManifest manifest;
    if (!manifest.load_from_file(manifest_path)) return false;
    const char* secret = std::getenv("SIGNFLOW_SECRET");
    if (secret && *secret && !manifest.verify_signature(secret)) return false;
    for (const std::string* asset : {&config.classifier.model_path, &config.classifier.labels_path,
                                     &config.classifier.origin_priors_path, &config.feature.scaler_path}) {
        if (asset->empty()) continue;
        if (!manifest.verify(*asset)) return false;
    }
    if (config.verbose) {
        std::cerr << "[Pipeline] Verified assets against " << manifest_path << "\n";
    }
    return true;
}

bool RecognitionPipeline::init(std::vector<std::unique_ptr<ClassifierBackend>> backends,
                               std::unique_ptr<LandmarkDetector> detector) {
    if (running_) {
        std::cerr << "[Pipeline] ERROR: init while running\n";
        return false;
    }
    initialized_ = false;
    auto config = registry_.active();
    if (!config->validate()) {
        std::cerr << "[Pipeline] ERROR: invalid configuration\n";
        return false;
    }
    if (config->detector_mode == DetectorMode::Async && !detector) {
        std::cerr << "[Pipeline] ERROR: async detector mode needs a landmark detector\n";
        return false;
    }
    if (!verify_assets(*config)) return false;
    if (!extractor_.init(config->feature)) return false;
    if (!classifier_.init(config->classifier, config->feature, std::move(backends))) return false;

    detector_ = std::move(detector);
    config_.reset();
    apply_config(config);
    applied_version_ = registry_.version();
    initialized_ = true;

    if (config->verbose) {
        std::cerr << "[Pipeline] Ready: profile " << signflow::profile_label(config->profile)
                  << ", classifier " << classifier_.active_backend()
                  << " (" << classifier_.model_variant() << "), detector " << detection_backend() << "\n";
    }
    return true;
}

void RecognitionPipeline::apply_config(const std::shared_ptr<const PipelineConfig>& config) {
    const PipelineConfig& c = *config;

    gate_.set_config(c.gate);
    cadence_.set_config(c.cadence);
    cadence_.verbose = c.verbose;

    const FeatureConfig& current = extractor_.get_config();
    if (config_ && (c.feature.window_length != current.window_length ||
                    c.feature.frame_dims != current.frame_dims ||
                    c.feature.reset_after_inference != current.reset_after_inference ||
                    c.feature.scaler_path != current.scaler_path)) {
        if (!extractor_.init(c.feature)) {
            std::cerr << "[Pipeline] ERROR: feature settings of profile " << signflow::profile_label(c.profile)
                      << " rejected, keeping the previous window\n";
        }
    }

    smoother_.set_config(c.smoother);
    accumulator_.set_config(c.accumulator);
    adaptive_.configure(c.adaptive, c.cadence);
    adaptive_.verbose = c.verbose;
    hands_down_.configure(c.accumulator.hands_down_ms, c.accumulator.hands_down_y);

    frame_skip_ = adaptive_.frame_skip();
    cadence_value_ = cadence_.cadence();
    degraded_ = false;
    config_ = config;
}

bool RecognitionPipeline::start() {
    if (!initialized_) {
        std::cerr << "[Pipeline] ERROR: start before a successful init\n";
        return false;
    }
    if (running_) return true;
    failed_ = false;
    running_ = true;
    worker_ = std::thread(&RecognitionPipeline::worker_loop, this);
    return true;
}

void RecognitionPipeline::stop() {
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        running_ = false;
    }
    slot_cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
}

void RecognitionPipeline::pause() {
    paused_ = true;
    std::lock_guard<std::mutex> lock(slot_mutex_);
    landmark_slot_.reset();
    camera_slot_.reset();
}

void RecognitionPipeline::resume() {
    paused_ = false;
}

uint64_t RecognitionPipeline::begin_session() {
    uint64_t id = ++session_;
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        landmark_slot_.reset();
        camera_slot_.reset();
    }
    // The worker resets its own state when it sees the new id
    accumulator_.discard_word();
    if (registry_.active()->verbose) std::cerr << "[Pipeline] Session " << id << "\n";
    return id;
}

bool RecognitionPipeline::stale(uint64_t session) const {
    return session != 0 && session != session_;
}

void RecognitionPipeline::reset_session_state() {
    gate_.reset();
    cadence_.reset();
    extractor_.reset();
    smoother_.reset();
    motion_.reset();
    hands_down_.reset();
    frame_index_ = 0;
    skip_counter_ = 0;
}

bool RecognitionPipeline::submit_landmarks(LandmarkFrame frame) {
    if (!running_ || paused_) return false;
    ++diagnostics_.frames_received;
    if (frame.session_id == 0) frame.session_id = session_;
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        if (landmark_slot_) ++diagnostics_.frames_dropped;
        landmark_slot_ = std::move(frame);
    }
    slot_cv_.notify_one();
    return true;
}

bool RecognitionPipeline::submit_camera_frame(CameraFrame frame) {
    if (!running_ || paused_) return false;
    if (!detector_) {
        std::cerr << "[Pipeline] ERROR: camera frame without a landmark detector\n";
        return false;
    }
    ++diagnostics_.frames_received;
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        if (camera_slot_) ++diagnostics_.frames_dropped;
        camera_slot_ = std::move(frame);
    }
    slot_cv_.notify_one();
    return true;
}

void RecognitionPipeline::on_detector_result(LandmarkFrame frame) {
    if (stale(frame.session_id)) {
        ++diagnostics_.stale_results;
        return;
    }
    if (!running_ || paused_) return;
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        if (landmark_slot_) ++diagnostics_.frames_dropped;
        landmark_slot_ = std::move(frame);
    }
    slot_cv_.notify_one();
}

bool RecognitionPipeline::request_full_detection() {
    std::lock_guard<std::mutex> lock(process_mutex_);
    return cadence_.should_run_full_detection(frame_index_++);
}

void RecognitionPipeline::worker_loop() {
    while (running_) {
        std::optional<LandmarkFrame> landmarks;
        std::optional<CameraFrame> camera;
        {
            std::unique_lock<std::mutex> lock(slot_mutex_);
            slot_cv_.wait(lock, [&]
                          { return landmark_slot_ || camera_slot_ || !running_; });
            if (!running_)
                break;
            if (landmark_slot_) {
                landmarks = std::move(*landmark_slot_);
                landmark_slot_.reset();
            } else {
                camera = std::move(*camera_slot_);
                camera_slot_.reset();
            }
        }
        try {
            if (landmarks) process(*landmarks);
            else if (camera) run_detector(*camera);
        } catch (const std::invalid_argument& e) {
            std::cerr << "[Pipeline] ERROR: " << e.what() << ", stopping\n";
            failed_ = true;
            running_ = false;
        }
    }
}

void RecognitionPipeline::run_detector(const CameraFrame& frame) {
    uint64_t session = session_;
    bool full = request_full_detection();
    DetectorMode mode = detection_mode();

    std::optional<LandmarkFrame> result;
    try {
        if (mode == DetectorMode::Async) {
            detector_->submit(frame, session, full,
                              [this](LandmarkFrame f) { on_detector_result(std::move(f)); });
            return;
        }
        result = detector_->detect(frame, full);
    } catch (const std::exception& e) {
        ++diagnostics_.detector_errors;
        std::cerr << "[Pipeline] Detector " << detector_->name() << " failed: " << e.what() << "\n";
        return;
    }
    if (!result) {
        ++diagnostics_.detector_errors;
        return;
    }
    result->session_id = session;
    result->full_detection = full;
    if (result->timestamp_ms == 0) result->timestamp_ms = frame.timestamp_ms;
    process(*result);
}

void RecognitionPipeline::process(const LandmarkFrame& frame) {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (!initialized_) return;

    if (stale(frame.session_id)) {
        ++diagnostics_.stale_results;
        return;
    }
    uint64_t session = session_;
    if (session != applied_session_) {
        reset_session_state();
        applied_session_ = session;
    }
    uint64_t version = registry_.version();
    if (version != applied_version_) {
        apply_config(registry_.active());
        applied_version_ = version;
    }

    int64_t now = frame.timestamp_ms;
    last_frame_ms_ = now;

    if (adaptive_.record_frame(now) != AdaptiveStep::None) {
        cadence_.set_default_cadence(adaptive_.cadence());
    }
    fps_ = adaptive_.current_fps();
    frame_skip_ = adaptive_.frame_skip();
    cadence_value_ = cadence_.cadence();

    if (skip_counter_++ % static_cast<uint64_t>(std::max(1, adaptive_.frame_skip())) != 0) {
        ++diagnostics_.frames_skipped;
        accumulator_.tick(now);
        return;
    }

    if (frame.full_detection) ++diagnostics_.full_detections;
    else ++diagnostics_.tracking_frames;

    auto visible = filter_ghost_hands(frame.hands, config_->gate.min_hand_span, config_->gate.min_valid_values);
    cadence_.on_tracking_result(static_cast<int>(visible.size()));
    cadence_value_ = cadence_.cadence();

    if (hands_down_.update(frame)) {
        if (config_->verbose) std::cerr << "[Pipeline] Hands down, committing sequence\n";
        accumulator_.commit(now);
    }

    LandmarkFrame admitted;
    GateDecision decision = gate_.admit(frame, &admitted);
    if (decision != GateDecision::Process) {
        if (decision == GateDecision::Reject) ++diagnostics_.frames_rejected;
        else ++diagnostics_.frames_still;
        accumulator_.tick(now);
        return;
    }

    motion_.add_frame(admitted);
    std::optional<FeatureWindow> window = extractor_.process(admitted, now);
    ++diagnostics_.frames_processed;

    if (window) {
        ++diagnostics_.inferences;
        std::optional<RecognitionResult> result = classifier_.infer(*window);
        if (classifier_.consume_static_output()) extractor_.reset();

        if (!result) {
            ++diagnostics_.inference_failures;
        } else if (stale(frame.session_id) || session_ != session) {
            // Session switched during inference
            ++diagnostics_.stale_results;
        } else {
            result->session_id = session;
            result->is_dynamic = motion_.is_dynamic();

            SmootherDecision verdict = smoother_.evaluate(*result, now, accumulator_.full());
            if (verdict.display_update) {
                ResultHandler handler;
                {
                    std::lock_guard<std::mutex> result_lock(result_mutex_);
                    latest_result_ = *result;
                    handler = on_result_;
                }
                if (handler) {
                    try {
                        handler(*result);
                    } catch (const std::exception& e) {
                        ++diagnostics_.handler_errors;
                        std::cerr << "[Pipeline] Result handler failed: " << e.what() << "\n";
                    }
                }
            }
            if (verdict.accepted()) {
                ++diagnostics_.tokens_accepted;
                accumulator_.note_result(result->origin.value_or("UNKNOWN"), result->confidence);
                accumulator_.append(result->label, now);
            } else if (config_->verbose) {
                std::cerr << "[Pipeline] " << result->label << " not accepted: "
                          << verdict_name(verdict.verdict) << " (" << verdict.smoothed_confidence << ")\n";
            }
        }
    }

    accumulator_.tick(now);
}

void RecognitionPipeline::tick(int64_t now_ms) {
    accumulator_.tick(now_ms);
}

void RecognitionPipeline::handle_event(const GlossEvent& event) {
    if (std::holds_alternative<SequenceCommitted>(event)) ++diagnostics_.sequences_committed;
    else ++diagnostics_.words_committed;
    bus_.publish(event);
}

void RecognitionPipeline::backspace() {
    accumulator_.backspace();
}

void RecognitionPipeline::clear() {
    accumulator_.clear();
}

std::vector<std::string> RecognitionPipeline::commit() {
    return accumulator_.commit(last_frame_ms_);
}

void RecognitionPipeline::push_nonmanual(const NonManualAnnotation& annotation) {
    accumulator_.add_nonmanual(annotation);
}

void RecognitionPipeline::set_result_handler(ResultHandler handler) {
    std::lock_guard<std::mutex> lock(result_mutex_);
    on_result_ = std::move(handler);
}

void RecognitionPipeline::set_degraded_handler(DegradedHandler handler) {
    std::lock_guard<std::mutex> lock(result_mutex_);
    on_degraded_ = std::move(handler);
}

std::optional<RecognitionResult> RecognitionPipeline::latest_result() const {
    std::lock_guard<std::mutex> lock(result_mutex_);
    return latest_result_;
}

DetectorMode RecognitionPipeline::detection_mode() const {
    return registry_.active()->detector_mode;
}

std::string RecognitionPipeline::detection_backend() const {
    return detector_ ? detector_->name() : "EXTERNAL";
}

std::string RecognitionPipeline::profile_label() const {
    return signflow::profile_label(registry_.active()->profile);
}

} // namespace signflow

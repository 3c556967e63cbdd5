#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "signflow/classifier.hpp"
#include "signflow/classifier_tflite.hpp"
#include "signflow/diagnostics.hpp"
#include "signflow/gloss_events.hpp"
#include "signflow/pipeline_config.hpp"
#include "signflow/recognition_pipeline.hpp"

using signflow::LandmarkFrame;

namespace {

void usage()
{
    std::cout << "Usage: signflow_replay [options] <frames.jsonl>\n\n"
              << "Runs recorded landmark frames through the recognition pipeline and\n"
              << "prints every committed event as one JSON line.\n\n"
              << "Options:\n"
              << "  --profile <name|file.json>  Ultra Lite, Lite, Balanced, Accuracy or a profile file\n"
              << "  --model <path>              TFLite gloss model (env SIGNFLOW_MODEL_PATH)\n"
              << "  --labels <path>             Label list JSON\n"
              << "  --manifest <path>           SHA-256 asset manifest\n"
              << "  --verbose                   Log pipeline decisions to stderr\n"
              << "  --help                      Show this help\n\n"
              << "Without a model, gloss logits are read from each record's \"logits\" field.\n";
}

std::vector<signflow::Point3> parse_points(const nlohmann::json& arr)
{
    std::vector<signflow::Point3> points;
    for (const auto& p : arr)
    {
        signflow::Point3 pt;
        pt.x = p.at(0).get<float>();
        pt.y = p.at(1).get<float>();
        pt.z = p.size() > 2 ? p.at(2).get<float>() : 0.0f;
        points.push_back(pt);
    }
    return points;
}

LandmarkFrame parse_frame(const nlohmann::json& rec)
{
    LandmarkFrame frame;
    frame.timestamp_ms = rec.value("t", int64_t{0});
    frame.width = rec.value("width", 0u);
    frame.height = rec.value("height", 0u);
    frame.full_detection = rec.value("full", true);
    if (rec.contains("hands"))
    {
        for (const auto& h : rec.at("hands"))
        {
            signflow::HandLandmarks hand;
            hand.handedness = h.value("label", std::string());
            hand.score = h.value("score", 0.0f);
            hand.points = parse_points(h.at("points"));
            frame.hands.push_back(std::move(hand));
        }
    }
    if (rec.contains("pose"))
    {
        for (const auto& p : rec.at("pose"))
        {
            signflow::PosePoint pt;
            pt.position = {p.at(0).get<float>(), p.at(1).get<float>(), p.size() > 2 ? p.at(2).get<float>() : 0.0f};
            pt.visibility = p.size() > 3 ? p.at(3).get<float>() : 1.0f;
            frame.pose.push_back(pt);
        }
    }
    if (rec.contains("face"))
        frame.face = parse_points(rec.at("face"));
    return frame;
}

signflow::NonManualAnnotation parse_nonmanual(const nlohmann::json& rec, int64_t t)
{
    signflow::NonManualAnnotation a;
    a.timestamp_ms = t;
    std::string head = rec.value("head_pose", std::string("neutral"));
    if (head == "nod") a.head_pose = signflow::HeadPose::Nod;
    else if (head == "shake") a.head_pose = signflow::HeadPose::Shake;
    if (rec.value("brows", std::string()) == "raised") a.brows = signflow::Brows::Raised;
    if (rec.value("mouth", std::string()) == "open") a.mouth = signflow::Mouth::Open;
    return a;
}

} // namespace

int main(int argc, char **argv)
{
    std::string profile_arg;
    std::string model_path;
    std::string labels_path;
    std::string manifest_path;
    std::string input_path;
    bool verbose = false;

    if (const char *env = std::getenv("SIGNFLOW_MODEL_PATH"))
        model_path = env;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--profile" && i + 1 < argc)
        {
            profile_arg = argv[++i];
        }
        else if (arg == "--model" && i + 1 < argc)
        {
            model_path = argv[++i];
        }
        else if (arg == "--labels" && i + 1 < argc)
        {
            labels_path = argv[++i];
        }
        else if (arg == "--manifest" && i + 1 < argc)
        {
            manifest_path = argv[++i];
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            verbose = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            usage();
            return 0;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "Unknown option: " << arg << "\n";
            usage();
            return 2;
        }
        else
        {
            input_path = arg;
        }
    }

    if (input_path.empty())
    {
        usage();
        return 2;
    }

    // Profile: a preset name or a JSON profile file
    signflow::PipelineConfig config;
    if (!profile_arg.empty())
    {
        signflow::Profile profile;
        if (profile_arg.size() > 5 && profile_arg.compare(profile_arg.size() - 5, 5, ".json") == 0)
        {
            if (!config.load_from_file(profile_arg))
                return 1;
        }
        else if (signflow::parse_profile(profile_arg, profile))
        {
            config = signflow::PipelineConfig::preset(profile);
        }
        else
        {
            std::cerr << "Unknown profile: " << profile_arg << "\n";
            return 2;
        }
    }
    config.detector_mode = signflow::DetectorMode::Sync;
    if (!model_path.empty()) config.classifier.model_path = model_path;
    if (!labels_path.empty()) config.classifier.labels_path = labels_path;
    if (!manifest_path.empty()) config.classifier.manifest_path = manifest_path;
    if (verbose)
    {
        config.verbose = true;
        config.classifier.verbose = true;
    }

    signflow::ProfileRegistry registry;
    if (!registry.set_active(config))
        return 1;

    signflow::EventBus bus;
    signflow::Diagnostics diagnostics;
    signflow::RecognitionPipeline pipeline(registry, bus, diagnostics);

    bus.subscribe([](const signflow::GlossEvent &event) {
        std::cout << signflow::event_to_json(event) << std::endl;
    });

    std::vector<std::unique_ptr<signflow::ClassifierBackend>> backends;
    if (!config.classifier.model_path.empty())
    {
        if (!signflow::tflite::TFLiteClassifierBackend::is_available())
            std::cerr << "[Main] Built without TensorFlow Lite, model " << config.classifier.model_path
                      << " cannot be loaded\n";
        backends.push_back(std::make_unique<signflow::tflite::TFLiteClassifierBackend>());
    }
    // Recorded logits stand in when no model loads
    auto replay_backend = std::make_unique<signflow::ReplayClassifierBackend>();
    signflow::ReplayClassifierBackend *replay = replay_backend.get();
    backends.push_back(std::move(replay_backend));

    if (!pipeline.init(std::move(backends)))
    {
        std::cerr << "Pipeline initialization failed\n";
        return 1;
    }
    // The adapter destroys backends it did not pick
    if (pipeline.classifier_backend() != "REPLAY")
        replay = nullptr;

    std::ifstream in(input_path);
    if (!in.is_open())
    {
        std::cerr << "Failed to open " << input_path << " for reading\n";
        return 2;
    }

    std::string line;
    size_t line_no = 0;
    size_t frames = 0;
    while (std::getline(in, line))
    {
        ++line_no;
        if (line.empty() || line[0] == '#') continue;

        nlohmann::json rec;
        try
        {
            rec = nlohmann::json::parse(line);
        }
        catch (const nlohmann::json::exception &e)
        {
            std::cerr << input_path << ":" << line_no << ": JSON parse error: " << e.what() << "\n";
            continue;
        }

        try
        {
            int64_t t = rec.value("t", int64_t{0});
            if (rec.contains("command"))
            {
                std::string cmd = rec.at("command").get<std::string>();
                if (cmd == "commit") pipeline.commit();
                else if (cmd == "backspace") pipeline.backspace();
                else if (cmd == "clear") pipeline.clear();
                else if (cmd == "session") pipeline.begin_session();
                else if (cmd == "tick") pipeline.tick(t);
                else std::cerr << input_path << ":" << line_no << ": unknown command " << cmd << "\n";
                continue;
            }
            if (rec.contains("nonmanual"))
                pipeline.push_nonmanual(parse_nonmanual(rec.at("nonmanual"), t));

            if (replay)
            {
                if (rec.contains("logits"))
                    replay->set_logits(rec.at("logits").get<std::vector<float>>(),
                                       rec.value("origin_logits", std::vector<float>()));
                else
                    replay->clear_logits();
            }
            pipeline.process(parse_frame(rec));
            ++frames;
        }
        catch (const nlohmann::json::exception &e)
        {
            std::cerr << input_path << ":" << line_no << ": bad record: " << e.what() << "\n";
        }
    }

    // Flush whatever is still pending
    pipeline.commit();

    if (verbose)
    {
        auto s = diagnostics.snapshot();
        std::cerr << "[Replay] frames=" << frames
                  << " processed=" << s.frames_processed
                  << " rejected=" << s.frames_rejected
                  << " still=" << s.frames_still
                  << " skipped=" << s.frames_skipped
                  << " inferences=" << s.inferences
                  << " failures=" << s.inference_failures
                  << " tokens=" << s.tokens_accepted
                  << " sequences=" << s.sequences_committed
                  << " words=" << s.words_committed << "\n"
                  << "[Replay] classifier " << pipeline.classifier_backend()
                  << " (" << pipeline.classifier_variant() << "), profile " << pipeline.profile_label()
                  << ", fps " << pipeline.current_fps() << "\n";
    }
    return 0;
}

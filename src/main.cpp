#include "Calibration.hpp"
#include "Config.hpp"
#include "JsonIO.hpp"
#include "Pipeline.hpp"
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

// -----------------------------------------------------------------------------
// Top-down rendering of one tracked frame onto the pitch

static void draw_vis(const std::string& dir, long frame, const FrameSnapshot& snap,
                     const PitchModel& pitch, int W = 1050)
{
    const double scale = W / pitch.length;
    const int H = int(pitch.width * scale);
    auto px = [&](const cv::Point2d& p) { return cv::Point(int(p.x * scale), int(p.y * scale)); };

    cv::Mat img(H, W, CV_8UC3, cv::Scalar(40, 110, 40));
    cv::rectangle(img, {0, 0, W - 1, H - 1}, cv::Scalar(255, 255, 255), 2);
    cv::line(img, px({pitch.length / 2, 0}), px({pitch.length / 2, pitch.width}),
             cv::Scalar(255, 255, 255), 1);
    for (int side = 0; side < 2; ++side) {
        double x = side ? pitch.length : 0.0;
        cv::line(img, px({x, (pitch.width - pitch.goal_width) / 2}),
                 px({x, (pitch.width + pitch.goal_width) / 2}), cv::Scalar(0, 255, 255), 4);
    }

    for (const auto& e : snap.entries) {
        cv::Scalar colour = e.cls == DetectionClass::Ball    ? cv::Scalar(255, 255, 255)
                          : e.cls == DetectionClass::Referee ? cv::Scalar(0, 0, 0)
                          : e.team == 0                      ? cv::Scalar(0, 0, 220)
                          : e.team == 1                      ? cv::Scalar(220, 120, 0)
                                                             : cv::Scalar(160, 160, 160);
        int radius = e.cls == DetectionClass::Ball ? 4 : 7;
        int thickness = e.status == TrackStatus::Coasting ? 1 : cv::FILLED;
        cv::circle(img, px(e.position), radius, colour, thickness);
        if (e.cls != DetectionClass::Ball)
            cv::putText(img, std::to_string(e.track_id), px(e.position) + cv::Point(8, -8),
                        cv::FONT_HERSHEY_SIMPLEX, 0.4, cv::Scalar(255, 255, 255), 1);
    }

    std::ostringstream fn;
    fn << dir << "/frame_" << std::setw(6) << std::setfill('0') << frame << ".png";
    cv::imwrite(fn.str(), img);
}

// -----------------------------------------------------------------------------

static int analyse(const std::string& in_path, const std::string& out_path,
                   const std::string& vis_dir, const PipelineConfig& cfg,
                   CalibrationCache& calibrations)
{
    JsonDetectionSource source(in_path);
    std::cout << "[main] " << in_path << ": " << source.size() << " frames\n";

    AnalysisPipeline pipeline(cfg, &calibrations);
    if (!vis_dir.empty()) {
        fs::create_directories(vis_dir);
        pipeline.on_snapshot([&](const FrameSnapshot& s) {
            draw_vis(vis_dir, s.frame, s, cfg.pitch);
        });
    }

    AnalysisResult result = pipeline.run(source);
    std::ofstream(out_path) << std::setw(2)
                            << report_to_json(result, cfg.pitch, source.iso_timestamps());
    std::cout << "[main] wrote " << out_path << "\n";

    if (!result.complete()) {
        std::cerr << "[main] " << in_path << ": partial result (" << to_string(result.completion)
                  << "): " << result.abort_reason << "\n";
        return 2;
    }
    return 0;
}

static std::string report_path(const std::string& out_path, const std::string& in_path)
{
    fs::path dir = fs::path(out_path).parent_path();
    return (dir / (fs::path(in_path).stem().string() + "_report.json")).string();
}

// -----------------------------------------------------------------------------

int main(int argc, char** argv)
{
    std::string config_path = "defaults.ini";
    std::vector<std::string> inputs;
    std::string out_path = "report.json";
    std::string vis_dir;

    // The config file may itself be named on the command line
    for (int i = 1; i + 1 < argc; ++i)
        if (std::string(argv[i]) == "--config") config_path = argv[i + 1];

    PipelineConfig cfg;
    try {
        IniFile ini = IniFile::load(config_path);
        cfg = PipelineConfig::from_ini(ini);
        if (auto v = ini.get("pipeline", "input")) inputs.push_back(*v);
        out_path = ini.get_string("pipeline", "output", out_path);
        vis_dir = ini.get_string("pipeline", "vis-dir", vis_dir);
    } catch (const std::exception& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 1;
    }

    CLI::App app{"Match analytics from per-frame detections"};
    app.add_option("--config", config_path, "INI file with defaults");
    app.add_option("--input", inputs, "Input detection JSON path(s)");
    app.add_option("--output", out_path, "Output report JSON path");
    app.add_option("--vis-dir", vis_dir, "Directory for top-down frame renderings");
    app.add_option("--max-dist", cfg.tracker.gating_distance, "Association gating distance (m)");
    app.add_option("--max-coast-frames", cfg.tracker.max_coast_frames,
                   "Missed frames before a track is lost");
    app.add_option("--control-radius", cfg.events.control_radius, "Ball control radius (m)");
    app.add_option("--kick-speed", cfg.events.kick_speed, "Kick speed threshold (m/s)");
    app.add_option("--sprint-speed", cfg.kinematics.sprint_speed, "Sprint speed threshold (m/s)");
    CLI11_PARSE(app, argc, argv);

    if (inputs.empty()) {
        std::cerr << "no --input given\n";
        return 1;
    }

    CalibrationCache calibrations;
    std::vector<std::future<int>> jobs;
    for (const auto& in : inputs) {
        std::string out = inputs.size() == 1 ? out_path : report_path(out_path, in);
        std::string vis = vis_dir.empty() || inputs.size() == 1
                              ? vis_dir
                              : (fs::path(vis_dir) / fs::path(in).stem()).string();
        jobs.push_back(std::async(std::launch::async, [=, &cfg, &calibrations] {
            try {
                return analyse(in, out, vis, cfg, calibrations);
            } catch (const std::exception& e) {
                std::cerr << "[main] " << in << ": " << e.what() << "\n";
                return 1;
            }
        }));
    }

    int status = 0;
    for (auto& j : jobs) status = std::max(status, j.get());
    std::cout << "Analysis complete. Inputs: " << inputs.size() << "\n";
    return status;
}

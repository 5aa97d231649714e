#pragma once
#include "Pipeline.hpp"
#include "Report.hpp"
#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

double      parse_iso(const std::string& s);
std::string format_iso(double sec);

/**
 * Detection stream stored as a JSON array of frames:
 *   [{"frame": 0, "timestamp": "2024-05-01T15:00:00.040000" | 0.04,
 *     "detections": [{"class": "player", "x", "y", "w", "h",
 *                     "confidence", "team"}]}]
 * A detection that cannot be decoded marks its frame malformed instead of
 * failing the whole file.
 */
class JsonDetectionSource : public DetectionSource
{
public:
    /** Throws std::runtime_error when the file is missing or not a JSON array. */
    explicit JsonDetectionSource(const std::string& path);
    static JsonDetectionSource from_json(const nlohmann::ordered_json& frames);

    std::optional<FrameBatch> next() override;

    size_t size() const { return frames_.size(); }
    /** True when the stream carried ISO-8601 timestamps. */
    bool   iso_timestamps() const { return iso_; }

private:
    JsonDetectionSource() = default;
    void load(const nlohmann::ordered_json& frames);

    std::vector<FrameBatch> frames_;
    size_t pos_ = 0;
    bool   iso_ = false;
};

FrameBatch parse_frame(const nlohmann::ordered_json& f, long index, bool* iso = nullptr);

/** Timestamps are written back as ISO-8601 when `iso` is set, else as seconds. */
nlohmann::ordered_json report_to_json(const AnalysisResult& r, const PitchModel& pitch,
                                      bool iso = false);
nlohmann::ordered_json tactical_to_json(const TacticalSummary& t, const PitchModel& pitch,
                                        bool iso = false);

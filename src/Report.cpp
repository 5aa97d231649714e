#include "Report.hpp"

using namespace std;

const char* to_string(Completion c)
{
    switch (c) {
        case Completion::Complete:         return "complete";
        case Completion::Aborted:          return "aborted";
        case Completion::SequenceRejected: return "sequence_rejected";
        case Completion::SourceFailed:     return "source_failed";
    }
    return "unknown";
}

vector<TrackReport> ReportAssembler::tracks(const TrackStore& store,
                                            const map<int, KinematicProfile>& profiles)
{
    vector<TrackReport> out;
    out.reserve(store.size());
    for (const auto& [id, t] : store.all()) {
        TrackReport r;
        r.id = id;
        r.cls = t.cls;
        r.team = t.team();
        r.status = t.status;
        r.first_ts = t.created_ts;
        r.last_ts = t.last_ts;
        r.samples = t.samples.size();
        auto it = profiles.find(id);
        if (it != profiles.end()) r.kinematics = it->second.summary;
        out.push_back(move(r));
    }
    return out;
}

array<TeamTechnical, 2> ReportAssembler::technical(const vector<Event>& events)
{
    array<TeamTechnical, 2> tech;
    for (const auto& e : events) {
        if (e.team != 0 && e.team != 1) continue;
        TeamTechnical& t = tech[e.team];

        switch (e.type) {
            case EventType::Pass:
                t.passes++;
                if (e.pass.outcome == PassOutcome::Complete) t.completed++;
                else t.intercepted++;
                switch (e.pass.length_class) {
                    case PassLength::Short:  t.short_passes++;  break;
                    case PassLength::Medium: t.medium_passes++; break;
                    case PassLength::Long:   t.long_passes++;   break;
                }
                switch (e.pass.direction) {
                    case PassDirection::Forward:  t.forward++;  break;
                    case PassDirection::Backward: t.backward++; break;
                    case PassDirection::Lateral:  t.lateral++;  break;
                }
                break;
            case EventType::Shot:
                t.shots++;
                if (e.shot.on_target) t.on_target++;
                break;
            case EventType::Goal:
                t.goals++;
                break;
            case EventType::PossessionChange:
                t.possessions_won++;
                break;
        }
    }

    for (auto& t : tech) {
        if (t.passes > 0) t.pass_accuracy = 100.0 * t.completed / t.passes;
        if (t.shots > 0)  t.shot_accuracy = 100.0 * t.on_target / t.shots;
    }
    return tech;
}

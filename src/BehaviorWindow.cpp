#include "BehaviorWindow.hpp"

#include <algorithm>

namespace proctor {

const char* pattern_flag_to_string(PatternFlag flag) {
    switch (flag) {
        case PatternFlag::FREQUENT_DEVIATIONS: return "frequent_deviations";
        case PatternFlag::REPEATED_OBJECTS:    return "repeated_objects";
        case PatternFlag::MULTIPLE_PERSONS:    return "multiple_persons";
    }
    return "unknown";
}

std::string pattern_flag_description(PatternFlag flag) {
    switch (flag) {
        case PatternFlag::FREQUENT_DEVIATIONS: return "Frequent gaze deviations detected";
        case PatternFlag::REPEATED_OBJECTS:    return "Repeated forbidden object detections";
        case PatternFlag::MULTIPLE_PERSONS:    return "Multiple persons frequently present";
    }
    return "Unknown pattern";
}

int BehaviorWindow::count_deviations(const std::deque<BehaviorRecord>& records) {
    return static_cast<int>(std::count_if(records.begin(), records.end(),
        [](const BehaviorRecord& r) { return r.gaze_deviation; }));
}

int BehaviorWindow::count_object_runs(const std::deque<BehaviorRecord>& records) {
    // A sustained streak counts once; its recurrence after a clean frame counts again
    int runs = 0;
    bool in_run = false;
    for (const auto& record : records) {
        bool has_objects = !record.forbidden_items.empty();
        if (has_objects && !in_run) runs++;
        in_run = has_objects;
    }
    return runs;
}

double BehaviorWindow::average_person_count(const std::deque<BehaviorRecord>& records) {
    if (records.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& record : records) sum += record.person_count;
    return sum / static_cast<double>(records.size());
}

double BehaviorWindow::pattern_score(int deviations, int object_runs, double avg_persons, int window_size) {
    double deviation_ratio = window_size > 0 ? static_cast<double>(deviations) / window_size : 0.0;
    double object_ratio = window_size > 0 ? static_cast<double>(object_runs) / window_size : 0.0;

    double score = deviation_ratio * 30.0
                 + object_ratio * 40.0
                 + std::max(0.0, avg_persons - 1.0) * 30.0;
    return std::clamp(score, 0.0, 100.0);
}

BehaviorSnapshot BehaviorWindow::update(BehaviorWindowState& state,
                                        const BehaviorRecord& record,
                                        int window_size,
                                        const PatternConfig& patterns) {
    size_t capacity = static_cast<size_t>(std::max(1, window_size));

    state.records.push_back(record);
    while (state.records.size() > capacity) {
        state.records.pop_front();
    }

    // Lifetime totals
    if (state.total_frames == 0) state.first_timestamp = record.timestamp;
    state.last_timestamp = record.timestamp;
    state.total_frames++;
    if (record.gaze_deviation) state.total_deviation_frames++;
    if (!record.forbidden_items.empty()) state.total_object_frames++;
    if (record.person_count > 1) state.total_multi_person_frames++;
    state.total_forbidden_items += record.forbidden_items.size();
    state.max_person_count = std::max(state.max_person_count, record.person_count);

    return snapshot(state, static_cast<int>(capacity), patterns);
}

BehaviorSnapshot BehaviorWindow::snapshot(const BehaviorWindowState& state,
                                          int window_size,
                                          const PatternConfig& patterns) {
    BehaviorSnapshot snap;
    snap.window_size = std::max(1, window_size);
    snap.window_frames = static_cast<int>(state.records.size());
    snap.repeated_deviations = count_deviations(state.records);
    snap.repeated_objects = count_object_runs(state.records);
    snap.avg_person_count = average_person_count(state.records);
    snap.pattern_score = pattern_score(snap.repeated_deviations, snap.repeated_objects,
                                       snap.avg_person_count, snap.window_size);

    if (snap.repeated_deviations > snap.window_size * patterns.frequent_deviation_ratio) {
        snap.flags.push_back(PatternFlag::FREQUENT_DEVIATIONS);
    }
    if (snap.repeated_objects > snap.window_size * patterns.repeated_object_ratio) {
        snap.flags.push_back(PatternFlag::REPEATED_OBJECTS);
    }
    if (snap.avg_person_count > patterns.multiple_person_average) {
        snap.flags.push_back(PatternFlag::MULTIPLE_PERSONS);
    }

    if (snap.flags.empty()) {
        snap.analysis_summary = "Normal behavior";
    } else {
        for (size_t i = 0; i < snap.flags.size(); ++i) {
            if (i > 0) snap.analysis_summary += "; ";
            snap.analysis_summary += pattern_flag_description(snap.flags[i]);
        }
    }
    return snap;
}

SessionStatistics BehaviorWindow::statistics(const BehaviorWindowState& state) {
    SessionStatistics stats;
    stats.total_frames = state.total_frames;
    stats.deviation_frames = state.total_deviation_frames;
    stats.object_frames = state.total_object_frames;
    stats.multi_person_frames = state.total_multi_person_frames;
    stats.forbidden_items = state.total_forbidden_items;
    stats.max_person_count = state.max_person_count;

    if (state.total_frames > 0) {
        stats.deviation_rate = static_cast<double>(state.total_deviation_frames) / state.total_frames;
        stats.object_rate = static_cast<double>(state.total_object_frames) / state.total_frames;
        stats.duration_seconds = std::max(0.0, state.last_timestamp - state.first_timestamp);
    }
    return stats;
}

} // namespace proctor

#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace proctor {

/**
 * @brief What one processed frame contributed to the behavior history
 */
struct BehaviorRecord {
    double timestamp = 0.0;
    bool gaze_deviation = false;
    std::vector<std::string> forbidden_items;   // Labels
    int person_count = 0;
};

/**
 * @brief Thresholds for the pattern flags (fractions of the window size)
 */
struct PatternConfig {
    double frequent_deviation_ratio = 0.3;
    double repeated_object_ratio = 0.2;
    double multiple_person_average = 1.5;
};

/**
 * @brief Per-session history: bounded FIFO plus lifetime totals
 */
struct BehaviorWindowState {
    std::deque<BehaviorRecord> records;   // Oldest first

    uint64_t total_frames = 0;
    uint64_t total_deviation_frames = 0;
    uint64_t total_object_frames = 0;
    uint64_t total_multi_person_frames = 0;
    uint64_t total_forbidden_items = 0;
    int max_person_count = 0;
    double first_timestamp = 0.0;
    double last_timestamp = 0.0;
};

enum class PatternFlag {
    FREQUENT_DEVIATIONS,
    REPEATED_OBJECTS,
    MULTIPLE_PERSONS
};

const char* pattern_flag_to_string(PatternFlag flag);

/**
 * @brief Human readable line for a pattern flag, used as a violation
 */
std::string pattern_flag_description(PatternFlag flag);

/**
 * @brief Window metrics after an update
 */
struct BehaviorSnapshot {
    int repeated_deviations = 0;      // Records with gaze deviation
    int repeated_objects = 0;         // Maximal runs of records with forbidden items
    double avg_person_count = 0.0;
    double pattern_score = 0.0;       // 0-100, display only
    int window_frames = 0;
    int window_size = 0;
    std::vector<PatternFlag> flags;
    std::string analysis_summary;
};

/**
 * @brief Lifetime totals for one session
 */
struct SessionStatistics {
    uint64_t total_frames = 0;
    uint64_t deviation_frames = 0;
    uint64_t object_frames = 0;
    uint64_t multi_person_frames = 0;
    uint64_t forbidden_items = 0;
    int max_person_count = 0;
    double deviation_rate = 0.0;
    double object_rate = 0.0;
    double duration_seconds = 0.0;
};

/**
 * @brief Fixed-size temporal window and the pattern metrics derived from it
 */
class BehaviorWindow {
public:
    /**
     * @brief Append a record, evict the oldest beyond window_size, recompute
     */
    static BehaviorSnapshot update(BehaviorWindowState& state,
                                   const BehaviorRecord& record,
                                   int window_size,
                                   const PatternConfig& patterns = PatternConfig());

    /**
     * @brief Metrics for the current contents without modifying them
     */
    static BehaviorSnapshot snapshot(const BehaviorWindowState& state,
                                     int window_size,
                                     const PatternConfig& patterns = PatternConfig());

    static int count_deviations(const std::deque<BehaviorRecord>& records);
    static int count_object_runs(const std::deque<BehaviorRecord>& records);
    static double average_person_count(const std::deque<BehaviorRecord>& records);

    static double pattern_score(int deviations, int object_runs, double avg_persons, int window_size);

    static SessionStatistics statistics(const BehaviorWindowState& state);
};

} // namespace proctor

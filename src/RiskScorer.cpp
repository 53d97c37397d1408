#include "RiskScorer.hpp"

#include <algorithm>
#include <cstdio>

namespace proctor {

namespace {

void add_unique(std::vector<std::string>& list, const std::string& item) {
    if (std::find(list.begin(), list.end(), item) == list.end()) {
        list.push_back(item);
    }
}

bool has_flag(const std::vector<PatternFlag>& flags, PatternFlag flag) {
    return std::find(flags.begin(), flags.end(), flag) != flags.end();
}

} // namespace

const char* alert_level_to_string(AlertLevel level) {
    switch (level) {
        case AlertLevel::NONE:     return "none";
        case AlertLevel::LOW:      return "low";
        case AlertLevel::MEDIUM:   return "medium";
        case AlertLevel::HIGH:     return "high";
        case AlertLevel::CRITICAL: return "critical";
    }
    return "unknown";
}

RiskScorer::RiskScorer(const ScoringConfig& config)
    : config_(config) {
}

AlertLevel RiskScorer::classify(int score, const ScoringConfig& config) {
    if (score <= 0) return AlertLevel::NONE;
    if (score <= config.low_max) return AlertLevel::LOW;
    if (score <= config.medium_max) return AlertLevel::MEDIUM;
    if (score <= config.high_max) return AlertLevel::HIGH;
    return AlertLevel::CRITICAL;
}

std::vector<std::string> RiskScorer::recommendations_for(AlertLevel level,
                                                         bool gaze,
                                                         bool forbidden_items,
                                                         bool multiple_persons,
                                                         const std::vector<PatternFlag>& flags) {
    std::vector<std::string> out;

    switch (level) {
        case AlertLevel::CRITICAL:
            add_unique(out, "Immediate intervention required");
            add_unique(out, "Flag session for manual review");
            add_unique(out, "Consider terminating session");
            break;
        case AlertLevel::HIGH:
            add_unique(out, "Issue warning to candidate");
            add_unique(out, "Increase monitoring intensity");
            add_unique(out, "Log incident for review");
            break;
        case AlertLevel::MEDIUM:
            add_unique(out, "Monitor situation closely");
            add_unique(out, "Log for pattern analysis");
            break;
        case AlertLevel::LOW:
        case AlertLevel::NONE:
            add_unique(out, "Continue normal monitoring");
            break;
    }

    if (gaze) {
        add_unique(out, "Remind candidate to face the screen");
    }
    if (forbidden_items) {
        add_unique(out, "Flag for manual review");
        add_unique(out, "Request removal of prohibited items");
        add_unique(out, "Verify workspace compliance");
    }
    if (multiple_persons || has_flag(flags, PatternFlag::MULTIPLE_PERSONS)) {
        add_unique(out, "Verify candidate identity");
        add_unique(out, "Request room scan");
    }
    if (has_flag(flags, PatternFlag::FREQUENT_DEVIATIONS)) {
        add_unique(out, "Investigate frequent attention shifts");
    }
    if (has_flag(flags, PatternFlag::REPEATED_OBJECTS)) {
        add_unique(out, "Persistent object violation - escalate");
    }
    return out;
}

RiskAssessment RiskScorer::score(const DeviationReport& deviation,
                                 const ObjectSignal& objects,
                                 const BehaviorSnapshot& behavior) const {
    return score(deviation, objects, behavior, config_);
}

RiskAssessment RiskScorer::score(const DeviationReport& deviation,
                                 const ObjectSignal& objects,
                                 const BehaviorSnapshot& behavior,
                                 const ScoringConfig& config) const {
    RiskAssessment assessment;
    int total = 0;

    // 1. Gaze
    int gaze_points = 0;
    int sustained_points = 0;
    if (deviation.deviating) {
        gaze_points = config.gaze_weight;
        assessment.violations.push_back("Gaze deviation detected");

        if (config.sustained_gaze_weight > 0 &&
            deviation.duration_accumulated >= config.sustained_gaze_seconds) {
            sustained_points = config.sustained_gaze_weight;
            char line[96];
            std::snprintf(line, sizeof(line), "Sustained gaze deviation: %.1fs",
                          deviation.duration_accumulated);
            assessment.violations.push_back(line);
        }
    }
    total += gaze_points + sustained_points;

    // 2. Forbidden items, one line each
    int item_points = 0;
    for (const auto& item : objects.forbidden_items) {
        item_points += config.forbidden_item_weight;
        assessment.violations.push_back("Forbidden item: " + item.label);
    }
    total += item_points;

    // 3. Persons
    int person_points = 0;
    bool multiple_persons = objects.person_count > 1;
    if (multiple_persons) {
        person_points = config.multiple_person_weight;
        assessment.violations.push_back("Multiple persons: " + std::to_string(objects.person_count));
    }
    total += person_points;

    // 4. Window repetition, score only
    int repeated_deviation_points = behavior.repeated_deviations * config.repeated_deviation_weight;
    int repeated_object_points = behavior.repeated_objects * config.repeated_object_weight;
    total += repeated_deviation_points + repeated_object_points;

    // 5. Pattern flags, lines only
    for (PatternFlag flag : behavior.flags) {
        assessment.violations.push_back("Pattern: " + pattern_flag_description(flag));
    }

    total = std::max(0, total);
    if (config.max_score > 0 && total > config.max_score) {
        assessment.details["uncapped_score"] = total;
        total = config.max_score;
    }

    assessment.risk_score = total;
    assessment.alert_level = classify(total, config);
    assessment.recommendations = recommendations_for(assessment.alert_level,
                                                     deviation.deviating,
                                                     !objects.forbidden_items.empty(),
                                                     multiple_persons,
                                                     behavior.flags);

    assessment.details["gaze"] = gaze_points;
    assessment.details["sustained_gaze"] = sustained_points;
    assessment.details["forbidden_items"] = item_points;
    assessment.details["multiple_persons"] = person_points;
    assessment.details["repeated_deviations"] = repeated_deviation_points;
    assessment.details["repeated_objects"] = repeated_object_points;
    assessment.details["deviation_duration"] = deviation.duration_accumulated;
    assessment.details["pattern_score"] = behavior.pattern_score;
    return assessment;
}

} // namespace proctor

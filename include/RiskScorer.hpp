#pragma once

#include "BehaviorWindow.hpp"
#include "HeadPoseEstimator.hpp"
#include "ObjectSignalFilter.hpp"

#include <map>
#include <string>
#include <vector>

namespace proctor {

enum class AlertLevel {
    NONE,
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

const char* alert_level_to_string(AlertLevel level);

/**
 * @brief Point weights and alert bands
 *
 * Alert bands are inclusive upper bounds: score <= low_max is low,
 * <= medium_max is medium, <= high_max is high, anything above is critical.
 */
struct ScoringConfig {
    int gaze_weight = 20;
    int forbidden_item_weight = 30;      // Per item
    int multiple_person_weight = 40;
    int repeated_deviation_weight = 10;  // Per deviating record in the window
    int repeated_object_weight = 10;     // Per object streak in the window

    // Extra points once a deviation has lasted this long (0 weight = off)
    double sustained_gaze_seconds = 3.0;
    int sustained_gaze_weight = 0;

    int low_max = 30;
    int medium_max = 70;
    int high_max = 100;

    int max_score = 0;                   // 0 = uncapped
};

struct RiskAssessment {
    int risk_score = 0;
    std::vector<std::string> violations;       // gaze, objects, persons, patterns
    AlertLevel alert_level = AlertLevel::NONE;
    std::vector<std::string> recommendations;
    std::map<std::string, double> details;     // Contribution per category
};

/**
 * @brief Deterministic weighted scoring of one processed frame
 *
 * Holds no state between calls. Violations and details are produced in a
 * fixed order so identical inputs give identical assessments.
 */
class RiskScorer {
public:
    explicit RiskScorer(const ScoringConfig& config = ScoringConfig());

    RiskAssessment score(const DeviationReport& deviation,
                         const ObjectSignal& objects,
                         const BehaviorSnapshot& behavior) const;

    RiskAssessment score(const DeviationReport& deviation,
                         const ObjectSignal& objects,
                         const BehaviorSnapshot& behavior,
                         const ScoringConfig& config) const;

    const ScoringConfig& config() const { return config_; }

    static AlertLevel classify(int score, const ScoringConfig& config);

    static std::vector<std::string> recommendations_for(AlertLevel level,
                                                        bool gaze,
                                                        bool forbidden_items,
                                                        bool multiple_persons,
                                                        const std::vector<PatternFlag>& flags);

private:
    ScoringConfig config_;
};

} // namespace proctor

#include "RiskScorer.hpp"
#include <algorithm>
#include <iostream>

using namespace proctor;

static int fails = 0;

static void assert_true(bool cond, const char* msg) {
    if (!cond) {
        std::cerr << "[FAIL] " << msg << std::endl;
        ++fails;
    } else {
        std::cout << "[PASS] " << msg << std::endl;
    }
}

static DeviationReport gaze(bool deviating, double duration = 0.0) {
    DeviationReport r;
    r.face_detected = true;
    r.deviating = deviating;
    r.duration_accumulated = duration;
    r.phase = deviating ? DeviationPhase::DEVIATING : DeviationPhase::NORMAL;
    return r;
}

static ObjectSignal objects(int persons, const std::vector<std::string>& labels = {}) {
    ObjectSignal s;
    s.person_count = persons;
    for (const auto& label : labels) {
        s.forbidden_items.push_back({label, 0.8f, cv::Rect2f(0, 0, 10, 10)});
    }
    return s;
}

static bool contains(const std::vector<std::string>& list, const std::string& item) {
    return std::find(list.begin(), list.end(), item) != list.end();
}

int main() {
    std::cout << "=== RiskScorer Test ===" << std::endl;

    RiskScorer scorer;
    BehaviorSnapshot quiet;

    // Test 1: Clean frame
    {
        RiskAssessment a = scorer.score(gaze(false), objects(1), quiet);
        assert_true(a.risk_score == 0, "clean frame scores zero");
        assert_true(a.alert_level == AlertLevel::NONE, "clean frame alert none");
        assert_true(a.violations.empty(), "no violations");
        assert_true(a.recommendations.size() == 1 && a.recommendations[0] == "Continue normal monitoring",
                    "routine recommendation");
    }

    // Test 2: Phone plus a second person is medium
    {
        RiskAssessment a = scorer.score(gaze(false), objects(2, {"phone"}), quiet);
        assert_true(a.risk_score == 70, "30 + 40 = 70");
        assert_true(a.alert_level == AlertLevel::MEDIUM, "70 is medium (inclusive bound)");
        assert_true(a.violations.size() == 2, "two violation lines");
        assert_true(a.violations[0] == "Forbidden item: phone", "item line");
        assert_true(a.violations[1] == "Multiple persons: 2", "person line");
        assert_true(contains(a.recommendations, "Request removal of prohibited items"), "item recommendation");
        assert_true(contains(a.recommendations, "Verify candidate identity"), "person recommendation");
    }

    // Test 3: Each extra item adds its weight and a line
    {
        RiskAssessment one = scorer.score(gaze(false), objects(1, {"phone"}), quiet);
        RiskAssessment two = scorer.score(gaze(false), objects(1, {"phone", "book"}), quiet);
        assert_true(two.risk_score == one.risk_score + 30, "second item adds 30");
        assert_true(two.violations.size() == one.violations.size() + 1, "second item adds a line");
        assert_true(two.violations[1] == "Forbidden item: book", "items listed in detection order");
    }

    // Test 4: Gaze only is low
    {
        RiskAssessment a = scorer.score(gaze(true, 0.5), objects(1), quiet);
        assert_true(a.risk_score == 20, "gaze weight 20");
        assert_true(a.alert_level == AlertLevel::LOW, "20 is low");
        assert_true(a.violations.size() == 1 && a.violations[0] == "Gaze deviation detected", "gaze line");
        assert_true(contains(a.recommendations, "Remind candidate to face the screen"), "gaze recommendation");
    }

    // Test 5: Window repetition adds points but no lines
    {
        BehaviorSnapshot window;
        window.repeated_deviations = 3;
        window.repeated_objects = 1;
        RiskAssessment a = scorer.score(gaze(true), objects(1), window);
        assert_true(a.risk_score == 20 + 30 + 10, "gaze + 3*10 + 1*10");
        assert_true(a.violations.size() == 1, "repetition adds no line");
        assert_true(a.details.at("repeated_deviations") == 30.0 && a.details.at("repeated_objects") == 10.0,
                    "repetition details");
    }

    // Test 6: Band edges
    {
        ScoringConfig c;
        assert_true(RiskScorer::classify(0, c) == AlertLevel::NONE, "0 none");
        assert_true(RiskScorer::classify(30, c) == AlertLevel::LOW, "30 low");
        assert_true(RiskScorer::classify(31, c) == AlertLevel::MEDIUM, "31 medium");
        assert_true(RiskScorer::classify(100, c) == AlertLevel::HIGH, "100 high");
        assert_true(RiskScorer::classify(101, c) == AlertLevel::CRITICAL, "101 critical");
    }

    // Test 7: Critical frame, uncapped by default
    {
        BehaviorSnapshot window;
        window.repeated_deviations = 5;
        window.flags = {PatternFlag::FREQUENT_DEVIATIONS};
        RiskAssessment a = scorer.score(gaze(true), objects(3, {"phone", "laptop"}), window);
        assert_true(a.risk_score == 20 + 60 + 40 + 50, "all contributions added");
        assert_true(a.alert_level == AlertLevel::CRITICAL, "critical alert");
        assert_true(a.recommendations[0] == "Immediate intervention required", "critical recommendation first");
        assert_true(contains(a.violations, "Pattern: Frequent gaze deviations detected"), "pattern line");
        assert_true(contains(a.recommendations, "Investigate frequent attention shifts"), "pattern recommendation");
        assert_true(a.details.count("uncapped_score") == 0, "no cap by default");
    }

    // Test 8: Configured cap
    {
        ScoringConfig capped;
        capped.max_score = 100;
        RiskAssessment a = scorer.score(gaze(true), objects(3, {"phone", "laptop"}), quiet, capped);
        assert_true(a.risk_score == 100, "score capped");
        assert_true(a.details.at("uncapped_score") == 120.0, "uncapped score kept in details");
        assert_true(a.alert_level == AlertLevel::HIGH, "capped at high_max stays high");
    }

    // Test 9: Sustained gaze weight
    {
        ScoringConfig sustained;
        sustained.sustained_gaze_weight = 15;
        RiskAssessment shortd = scorer.score(gaze(true, 1.0), objects(1), quiet, sustained);
        RiskAssessment longd = scorer.score(gaze(true, 4.2), objects(1), quiet, sustained);
        assert_true(shortd.risk_score == 20, "short deviation gets gaze weight only");
        assert_true(longd.risk_score == 35, "sustained deviation adds its weight");
        assert_true(contains(longd.violations, "Sustained gaze deviation: 4.2s"), "sustained line");
    }

    // Test 10: Same input, same output
    {
        BehaviorSnapshot window;
        window.repeated_objects = 2;
        window.flags = {PatternFlag::REPEATED_OBJECTS, PatternFlag::MULTIPLE_PERSONS};
        RiskAssessment a = scorer.score(gaze(true), objects(2, {"book"}), window);
        RiskAssessment b = scorer.score(gaze(true), objects(2, {"book"}), window);
        assert_true(a.risk_score == b.risk_score && a.violations == b.violations &&
                    a.recommendations == b.recommendations && a.details == b.details, "deterministic");
        assert_true(contains(a.recommendations, "Persistent object violation - escalate"), "streak recommendation");
        long request_scan = std::count(a.recommendations.begin(), a.recommendations.end(), "Request room scan");
        assert_true(request_scan == 1, "recommendations not duplicated");
    }

    if (fails == 0) {
        std::cout << "\nALL TESTS PASSED" << std::endl;
        return 0;
    }
    std::cout << "\nTESTS FAILED: " << fails << std::endl;
    return 1;
}

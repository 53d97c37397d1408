#include "ObjectSignalFilter.hpp"
#include <cmath>
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

static RawDetection det(int id, const std::string& name, float confidence,
                        cv::Rect2f box = cv::Rect2f(10, 10, 50, 50)) {
    RawDetection d;
    d.class_id = id;
    d.class_name = name;
    d.confidence = confidence;
    d.bbox = box;
    return d;
}

static RoiInfo full_frame() {
    RoiInfo roi;
    roi.original_size = cv::Size(640, 480);
    roi.region = cv::Rect(0, 0, 640, 480);
    return roi;
}

int main() {
    std::cout << "=== ObjectSignalFilter Test ===" << std::endl;

    ObjectSignalFilter filter;

    // Test 1: Empty input
    {
        ObjectSignal s = filter.filter({}, full_frame());
        assert_true(s.person_count == 0 && s.forbidden_items.empty(), "no detections, empty signal");
        assert_true(s.mean_confidence == 0.0f, "mean confidence zero without detections");
    }

    // Test 2: Person threshold is lower than the forbidden threshold
    {
        std::vector<RawDetection> input = {
            det(0, "person", 0.45f),
            det(0, "person", 0.39f),
            det(67, "cell phone", 0.45f),
        };
        ObjectSignal s = filter.filter(input, full_frame());
        assert_true(s.person_count == 1, "person at 0.45 counts, 0.39 does not");
        assert_true(s.forbidden_items.empty(), "phone at 0.45 is below 0.5");
        assert_true(s.all_detections.size() == 3, "all detections kept for diagnostics");
    }

    // Test 3: Person threshold is exclusive, forbidden threshold inclusive
    {
        std::vector<RawDetection> input = {
            det(0, "person", 0.4f),
            det(0, "person", 0.41f),
            det(73, "book", 0.5f),
        };
        ObjectSignal s = filter.filter(input, full_frame());
        assert_true(s.person_count == 1, "person at exactly 0.4 does not count, 0.41 does");
        assert_true(s.forbidden_items.size() == 1 && s.forbidden_items[0].label == "book",
                    "book at exactly 0.5 counts");
    }

    // Test 4: Labels by name and by id, in detection order
    {
        std::vector<RawDetection> input = {
            det(-1, "laptop", 0.9f),
            det(67, "", 0.8f),
            det(67, "cell phone", 0.7f),
            det(41, "cup", 0.99f),
        };
        ObjectSignal s = filter.filter(input, full_frame());
        assert_true(s.forbidden_items.size() == 3, "cup is allowed");
        assert_true(s.forbidden_items[0].label == "laptop", "name lookup");
        assert_true(s.forbidden_items[1].label == "phone", "id lookup for unnamed detection");
        assert_true(s.forbidden_items[2].label == "phone", "'cell phone' reported as phone");
    }

    // Test 5: Several forbidden items are all reported
    {
        std::vector<RawDetection> input = {
            det(67, "cell phone", 0.8f),
            det(67, "cell phone", 0.75f),
            det(73, "book", 0.6f),
        };
        ObjectSignal s = filter.filter(input, full_frame());
        assert_true(s.forbidden_items.size() == 3, "two phones and a book");
        assert_true(std::abs(s.mean_confidence - (0.8f + 0.75f + 0.6f) / 3.0f) < 1e-5f, "mean confidence");
    }

    // Test 6: Boxes are mapped out of the ROI
    {
        RoiInfo roi = full_frame();
        roi.enabled = true;
        roi.region = cv::Rect(20, 30, 400, 300);

        std::vector<RawDetection> input = { det(67, "cell phone", 0.9f, cv::Rect2f(5, 5, 40, 60)) };
        ObjectSignal s = filter.filter(input, roi);
        assert_true(s.forbidden_items.size() == 1, "phone found in ROI");
        assert_true(s.forbidden_items[0].bbox == cv::Rect2f(25, 35, 40, 60), "box offset to full frame");
        assert_true(s.all_detections[0].bbox == cv::Rect2f(25, 35, 40, 60), "diagnostic box offset too");
    }

    // Test 7: Custom mapping through configuration
    {
        ObjectFilterConfig config;
        config.forbidden_names = {{"headphones", "headphones"}};
        config.forbidden_ids.clear();
        config.person_confidence = 0.6f;

        std::vector<RawDetection> input = {
            det(-1, "headphones", 0.9f),
            det(67, "cell phone", 0.9f),
            det(0, "person", 0.5f),
        };
        ObjectSignal s = filter.filter(input, full_frame(), config);
        assert_true(s.forbidden_items.size() == 1 && s.forbidden_items[0].label == "headphones",
                    "only configured classes are forbidden");
        assert_true(s.person_count == 0, "configured person threshold applies");
    }

    // Test 8: Person detection by id when the name is missing
    {
        std::vector<RawDetection> input = { det(0, "", 0.8f), det(0, "", 0.7f) };
        ObjectSignal s = filter.filter(input, full_frame());
        assert_true(s.person_count == 2, "unnamed class 0 counts as person");
    }

    if (fails == 0) {
        std::cout << "\nALL TESTS PASSED" << std::endl;
        return 0;
    }
    std::cout << "\nTESTS FAILED: " << fails << std::endl;
    return 1;
}

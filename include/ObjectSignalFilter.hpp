#pragma once

#include "Providers.hpp"
#include "Preprocessor.hpp"
#include <map>
#include <string>
#include <vector>

namespace proctor {

/**
 * @brief Detection thresholds and forbidden class mapping (COCO ids by default)
 *
 * Persons use a lower threshold than forbidden items on purpose.
 */
struct ObjectFilterConfig {
    float forbidden_confidence = 0.5f;
    float person_confidence = 0.4f;      // Counted strictly above
    int person_class_id = 0;
    std::string person_class_name = "person";

    // Detector class name -> reported label
    std::map<std::string, std::string> forbidden_names = {
        {"cell phone", "phone"},
        {"phone", "phone"},
        {"book", "book"},
        {"laptop", "laptop"}
    };

    // Detector class id -> reported label, used when the name is empty or unknown
    std::map<int, std::string> forbidden_ids = {
        {67, "phone"},
        {73, "book"},
        {63, "laptop"}
    };
};

struct ForbiddenItem {
    std::string label;
    float confidence = 0.0f;
    cv::Rect2f bbox;        // Full-frame pixels
};

struct ObjectSignal {
    int person_count = 0;
    std::vector<ForbiddenItem> forbidden_items;   // Detection order
    std::vector<RawDetection> all_detections;     // Diagnostics only
    float mean_confidence = 0.0f;

    static ObjectSignal empty();
};

/**
 * @brief Turns raw detector boxes into person and forbidden item counts
 *
 * Overlap suppression is expected upstream; every qualifying box counts.
 */
class ObjectSignalFilter {
public:
    explicit ObjectSignalFilter(const ObjectFilterConfig& config = ObjectFilterConfig());

    ObjectSignal filter(const std::vector<RawDetection>& detections, const RoiInfo& roi) const;
    ObjectSignal filter(const std::vector<RawDetection>& detections, const RoiInfo& roi,
                        const ObjectFilterConfig& config) const;

    const ObjectFilterConfig& config() const { return config_; }

    static bool is_person(const RawDetection& detection, const ObjectFilterConfig& config);

    /**
     * @brief Forbidden label for a detection, empty if the class is allowed
     */
    static std::string forbidden_label(const RawDetection& detection, const ObjectFilterConfig& config);

private:
    ObjectFilterConfig config_;
};

} // namespace proctor

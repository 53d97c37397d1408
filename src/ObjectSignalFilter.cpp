#include "ObjectSignalFilter.hpp"

namespace proctor {

ObjectSignal ObjectSignal::empty() {
    return ObjectSignal();
}

ObjectSignalFilter::ObjectSignalFilter(const ObjectFilterConfig& config)
    : config_(config) {
}

bool ObjectSignalFilter::is_person(const RawDetection& detection, const ObjectFilterConfig& config) {
    if (!detection.class_name.empty()) {
        return detection.class_name == config.person_class_name;
    }
    return detection.class_id == config.person_class_id;
}

std::string ObjectSignalFilter::forbidden_label(const RawDetection& detection,
                                                const ObjectFilterConfig& config) {
    if (!detection.class_name.empty()) {
        auto by_name = config.forbidden_names.find(detection.class_name);
        if (by_name != config.forbidden_names.end()) {
            return by_name->second;
        }
    }

    auto by_id = config.forbidden_ids.find(detection.class_id);
    if (by_id != config.forbidden_ids.end()) {
        return by_id->second;
    }
    return "";
}

ObjectSignal ObjectSignalFilter::filter(const std::vector<RawDetection>& detections,
                                        const RoiInfo& roi) const {
    return filter(detections, roi, config_);
}

ObjectSignal ObjectSignalFilter::filter(const std::vector<RawDetection>& detections,
                                        const RoiInfo& roi,
                                        const ObjectFilterConfig& config) const {
    ObjectSignal signal;
    signal.all_detections.reserve(detections.size());

    double confidence_sum = 0.0;

    for (const auto& raw : detections) {
        RawDetection detection = raw;
        detection.bbox = roi.to_original(raw.bbox);
        signal.all_detections.push_back(detection);
        confidence_sum += detection.confidence;

        if (is_person(detection, config)) {
            // Persons must exceed their threshold; forbidden items only reach theirs
            if (detection.confidence > config.person_confidence) {
                signal.person_count++;
            }
            continue;
        }

        std::string label = forbidden_label(detection, config);
        if (!label.empty() && detection.confidence >= config.forbidden_confidence) {
            signal.forbidden_items.push_back({label, detection.confidence, detection.bbox});
        }
    }

    if (!detections.empty()) {
        signal.mean_confidence = static_cast<float>(confidence_sum / detections.size());
    }
    return signal;
}

} // namespace proctor

#include "Preprocessor.hpp"
#include <algorithm>
#include <cmath>

namespace proctor {

cv::Point2f RoiInfo::to_original(const cv::Point2f& roi_point) const {
    return cv::Point2f(roi_point.x + static_cast<float>(region.x),
                       roi_point.y + static_cast<float>(region.y));
}

cv::Rect2f RoiInfo::to_original(const cv::Rect2f& roi_rect) const {
    return cv::Rect2f(roi_rect.x + static_cast<float>(region.x),
                      roi_rect.y + static_cast<float>(region.y),
                      roi_rect.width,
                      roi_rect.height);
}

cv::Point2f RoiInfo::normalized_to_original(const cv::Point2f& normalized) const {
    return to_original(cv::Point2f(normalized.x * static_cast<float>(region.width),
                                   normalized.y * static_cast<float>(region.height)));
}

Preprocessor::Preprocessor(const PreprocessConfig& config)
    : config_(config) {
}

RoiInfo Preprocessor::compute_roi(const cv::Size& frame_size, const PreprocessConfig& config) {
    RoiInfo roi;
    roi.original_size = frame_size;
    roi.region = cv::Rect(0, 0, frame_size.width, frame_size.height);

    if (!config.enable_roi) {
        return roi;
    }

    double ratio = std::clamp(config.roi_ratio, 0.0, 1.0);
    int roi_height = static_cast<int>(frame_size.height * ratio);
    roi_height = std::max(1, std::min(roi_height, frame_size.height));

    roi.enabled = true;
    roi.region = cv::Rect(0, 0, frame_size.width, roi_height);
    return roi;
}

cv::Mat Preprocessor::equalize_luminance(const cv::Mat& bgr, double clip_limit, int tile_grid) {
    cv::Mat lab;
    cv::cvtColor(bgr, lab, cv::COLOR_BGR2Lab);

    std::vector<cv::Mat> channels;
    cv::split(lab, channels);

    cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(clip_limit, cv::Size(tile_grid, tile_grid));
    cv::Mat l_equalized;
    clahe->apply(channels[0], l_equalized);
    channels[0] = l_equalized;

    cv::Mat merged;
    cv::merge(channels, merged);

    cv::Mat out;
    cv::cvtColor(merged, out, cv::COLOR_Lab2BGR);
    return out;
}

cv::Mat Preprocessor::denoise(const cv::Mat& bgr, int diameter, double sigma_color, double sigma_space) {
    cv::Mat out;
    cv::bilateralFilter(bgr, out, diameter, sigma_color, sigma_space);
    return out;
}

cv::Mat Preprocessor::apply_gamma(const cv::Mat& bgr, double gamma) {
    cv::Mat lut(1, 256, CV_8U);
    double inv_gamma = gamma > 0.0 ? 1.0 / gamma : 1.0;
    for (int i = 0; i < 256; ++i) {
        lut.at<uchar>(i) = cv::saturate_cast<uchar>(std::pow(i / 255.0, inv_gamma) * 255.0);
    }

    cv::Mat out;
    cv::LUT(bgr, lut, out);
    return out;
}

PreprocessedFrame Preprocessor::apply(const cv::Mat& frame) const {
    return apply(frame, config_);
}

PreprocessedFrame Preprocessor::apply(const cv::Mat& frame, const PreprocessConfig& config) const {
    PreprocessedFrame result;
    result.roi = compute_roi(frame.size(), config);

    // Crop shares the input buffer; every later stage allocates its own
    cv::Mat image = result.roi.enabled ? frame(result.roi.region) : frame;
    if (result.roi.enabled) {
        result.stages_applied.push_back("roi");
    }

    if (config.enable_gamma) {
        image = apply_gamma(image, config.gamma);
        result.stages_applied.push_back("gamma");
    }

    if (config.enable_preprocessing && config.enable_clahe) {
        image = equalize_luminance(image, config.clahe_clip_limit, config.clahe_tile_grid);
        result.stages_applied.push_back("clahe");
    }

    if (config.enable_preprocessing && config.enable_denoise) {
        image = denoise(image, config.bilateral_diameter,
                        config.bilateral_sigma_color, config.bilateral_sigma_space);
        result.stages_applied.push_back("bilateral");
    }

    if (result.stages_applied.empty() || image.data == frame.data) {
        // Nothing allocated a new buffer; detach from the caller's frame
        image = image.clone();
    }

    result.image = image;
    return result;
}

} // namespace proctor

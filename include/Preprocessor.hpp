#pragma once

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <string>
#include <vector>

namespace proctor {

/**
 * @brief Image enhancement settings
 *
 * ROI is off by default: cropping to the upper part of the frame drops any
 * object below the crop line.
 */
struct PreprocessConfig {
    bool enable_preprocessing = true;   // Master switch for CLAHE + denoise
    bool enable_clahe = true;
    bool enable_denoise = true;
    bool enable_gamma = false;
    bool enable_roi = false;

    double clahe_clip_limit = 2.0;
    int clahe_tile_grid = 8;

    int bilateral_diameter = 5;
    double bilateral_sigma_color = 50.0;
    double bilateral_sigma_space = 50.0;

    double gamma = 1.2;                 // >1 brightens
    double roi_ratio = 0.7;             // Fraction of height kept from the top
};

/**
 * @brief Geometry of the region the detectors actually saw
 */
struct RoiInfo {
    bool enabled = false;
    cv::Size original_size;
    cv::Rect region;                    // In original frame pixels

    /**
     * @brief Map a point in ROI pixels to full-frame pixels
     */
    cv::Point2f to_original(const cv::Point2f& roi_point) const;

    /**
     * @brief Map a rectangle in ROI pixels to full-frame pixels
     */
    cv::Rect2f to_original(const cv::Rect2f& roi_rect) const;

    /**
     * @brief Map a point normalized to the ROI ([0,1]^2) to full-frame pixels
     */
    cv::Point2f normalized_to_original(const cv::Point2f& normalized) const;
};

struct PreprocessedFrame {
    cv::Mat image;
    RoiInfo roi;
    std::vector<std::string> stages_applied;
};

/**
 * @brief Lighting normalization and denoising ahead of feature extraction
 *
 * Stage order is fixed: ROI crop, gamma, CLAHE on luminance, bilateral
 * filter. The input image is never written to.
 */
class Preprocessor {
public:
    explicit Preprocessor(const PreprocessConfig& config = PreprocessConfig());

    PreprocessedFrame apply(const cv::Mat& frame) const;

    /**
     * @brief Run with a different configuration (per-call override)
     */
    PreprocessedFrame apply(const cv::Mat& frame, const PreprocessConfig& config) const;

    const PreprocessConfig& config() const { return config_; }

    static RoiInfo compute_roi(const cv::Size& frame_size, const PreprocessConfig& config);
    static cv::Mat equalize_luminance(const cv::Mat& bgr, double clip_limit, int tile_grid);
    static cv::Mat denoise(const cv::Mat& bgr, int diameter, double sigma_color, double sigma_space);
    static cv::Mat apply_gamma(const cv::Mat& bgr, double gamma);

private:
    PreprocessConfig config_;
};

} // namespace proctor

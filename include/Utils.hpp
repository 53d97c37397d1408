#pragma once

#include "PipelineResult.hpp"
#include <opencv2/core.hpp>
#include <chrono>
#include <string>

namespace proctor {
namespace utils {

/**
 * @brief Milliseconds elapsed since start (steady clock)
 */
double elapsed_ms(std::chrono::steady_clock::time_point start);

/**
 * @brief Get current timestamp string (for filenames)
 * @param format Format string (default: "%Y%m%d_%H%M%S")
 * @return Timestamp string
 */
std::string get_timestamp_string(const std::string& format = "%Y%m%d_%H%M%S");

/**
 * @brief Create directory if it doesn't exist
 * @param path Directory path
 * @return true if directory exists or was created
 */
bool ensure_directory_exists(const std::string& path);

/** Draw forbidden item boxes, pose and risk level onto a copy of the frame */
cv::Mat create_visualization(const cv::Mat& frame, const PipelineResult& result);

/** Save BGR frame as JPEG */
bool save_frame_as_jpeg(const cv::Mat& frame, const std::string& filename, int quality = 90);

} // namespace utils
} // namespace proctor

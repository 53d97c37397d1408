#include "Utils.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <sys/stat.h>
#include <sys/types.h>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

namespace proctor {
namespace utils {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

std::string get_timestamp_string(const std::string& format) {
    auto now = std::time(nullptr);
    auto tm = *std::localtime(&now);

    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    return oss.str();
}

bool ensure_directory_exists(const std::string& path) {
    struct stat info;

    if (stat(path.c_str(), &info) == 0) {
        return S_ISDIR(info.st_mode);
    }

    // Try to create directory
    return mkdir(path.c_str(), 0755) == 0;
}

cv::Mat create_visualization(const cv::Mat& frame, const PipelineResult& result) {
    cv::Mat vis = frame.clone();
    if (vis.empty()) return vis;

    const cv::Scalar red(0, 0, 255);
    const cv::Scalar green(0, 200, 0);
    const cv::Scalar yellow(0, 220, 220);

    for (const auto& item : result.objects.forbidden_items) {
        cv::Rect box(cv::Point(cvRound(item.bbox.x), cvRound(item.bbox.y)),
                     cv::Size(cvRound(item.bbox.width), cvRound(item.bbox.height)));
        cv::rectangle(vis, box, red, 2);
        cv::putText(vis, item.label, box.tl() + cv::Point(0, -4),
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, red, 1);
    }

    std::ostringstream pose_line;
    if (result.pose.face_detected) {
        pose_line << std::fixed << std::setprecision(1)
                  << "yaw " << result.pose.yaw << " pitch " << result.pose.pitch
                  << " roll " << result.pose.roll;
    } else {
        pose_line << "no face";
    }
    cv::putText(vis, pose_line.str(), cv::Point(10, 20), cv::FONT_HERSHEY_SIMPLEX, 0.5,
                result.deviation.deviating ? yellow : green, 1);

    std::ostringstream risk_line;
    risk_line << "risk " << result.risk.risk_score << " ("
              << alert_level_to_string(result.risk.alert_level) << ")"
              << " persons " << result.objects.person_count;
    if (result.metadata.frame_skipped) risk_line << " [skipped]";
    if (result.metadata.degraded()) risk_line << " [degraded]";

    bool elevated = result.risk.alert_level == AlertLevel::HIGH ||
                    result.risk.alert_level == AlertLevel::CRITICAL;
    cv::putText(vis, risk_line.str(), cv::Point(10, 40), cv::FONT_HERSHEY_SIMPLEX, 0.5,
                elevated ? red : green, 1);

    return vis;
}

bool save_frame_as_jpeg(const cv::Mat& frame, const std::string& filename, int quality) {
    if (frame.empty()) return false;

    std::vector<int> params;
    params.push_back(cv::IMWRITE_JPEG_QUALITY);
    params.push_back(quality);

    return cv::imwrite(filename, frame, params);
}

} // namespace utils
} // namespace proctor

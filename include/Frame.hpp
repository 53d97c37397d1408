#pragma once

/**
 * @file Frame.hpp
 * @brief Single video frame submitted by the transport layer for one exam session
 *
 * The transport layer decodes the stream and hands over an 8-bit BGR image.
 * Once a frame enters the pipeline it is never modified; every stage writes
 * its output to a new buffer.
 */

#include <opencv2/core.hpp>
#include <stdexcept>
#include <string>

namespace proctor {

/**
 * @brief Why a frame was refused before entering the pipeline
 */
enum class RejectReason {
    EMPTY_FRAME,          // No pixel data
    INVALID_DIMENSIONS,   // Non-positive width or height
    UNSUPPORTED_FORMAT,   // Not 8-bit, 3 channel
    INVALID_TIMESTAMP,    // NaN or infinite capture time
    UNKNOWN_SESSION,      // Session was never started
    SESSION_ENDED         // Session ended while the frame was in flight
};

const char* reject_reason_to_string(RejectReason reason);

/**
 * @brief Thrown synchronously by ProctorPipeline::process for malformed input
 *        or an unknown/ended session. No session state is modified.
 */
class FrameRejected : public std::runtime_error {
public:
    FrameRejected(RejectReason reason, const std::string& detail);

    RejectReason reason() const { return reason_; }

private:
    RejectReason reason_;
};

/**
 * @brief Frame with the session it belongs to and its capture time
 */
struct Frame {
    std::string session_id;

    // Monotonic capture time in seconds
    double capture_timestamp = 0.0;

    // CV_8UC3, BGR order
    cv::Mat pixels;

    Frame() = default;
    Frame(std::string session, cv::Mat image, double timestamp);

    int width() const { return pixels.cols; }
    int height() const { return pixels.rows; }

    /**
     * @brief Check the frame can be processed
     * @param reason Filled with the failure reason when invalid (optional)
     * @return true if the frame is well formed
     */
    bool is_valid(RejectReason* reason = nullptr) const;

    /**
     * @brief Throw FrameRejected if the frame is malformed
     */
    void validate() const;

    /**
     * @brief Frame header (no pixels) as JSON string
     */
    std::string to_json() const;
};

} // namespace proctor

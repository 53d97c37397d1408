#include "Frame.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <utility>

namespace proctor {

const char* reject_reason_to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::EMPTY_FRAME:        return "empty_frame";
        case RejectReason::INVALID_DIMENSIONS: return "invalid_dimensions";
        case RejectReason::UNSUPPORTED_FORMAT: return "unsupported_format";
        case RejectReason::INVALID_TIMESTAMP:  return "invalid_timestamp";
        case RejectReason::UNKNOWN_SESSION:    return "unknown_session";
        case RejectReason::SESSION_ENDED:      return "session_ended";
    }
    return "unknown";
}

FrameRejected::FrameRejected(RejectReason reason, const std::string& detail)
    : std::runtime_error(std::string(reject_reason_to_string(reason)) + ": " + detail),
      reason_(reason) {
}

Frame::Frame(std::string session, cv::Mat image, double timestamp)
    : session_id(std::move(session)),
      capture_timestamp(timestamp),
      pixels(std::move(image)) {
}

bool Frame::is_valid(RejectReason* reason) const {
    auto fail = [reason](RejectReason r) {
        if (reason) *reason = r;
        return false;
    };

    if (pixels.empty()) {
        return fail(RejectReason::EMPTY_FRAME);
    }
    if (pixels.rows <= 0 || pixels.cols <= 0) {
        return fail(RejectReason::INVALID_DIMENSIONS);
    }
    if (pixels.type() != CV_8UC3) {
        return fail(RejectReason::UNSUPPORTED_FORMAT);
    }
    if (!std::isfinite(capture_timestamp)) {
        return fail(RejectReason::INVALID_TIMESTAMP);
    }
    return true;
}

void Frame::validate() const {
    RejectReason reason = RejectReason::EMPTY_FRAME;
    if (!is_valid(&reason)) {
        throw FrameRejected(reason, "session '" + session_id + "', " +
                            std::to_string(pixels.cols) + "x" +
                            std::to_string(pixels.rows) + " type " +
                            std::to_string(pixels.type()));
    }
}

std::string Frame::to_json() const {
    nlohmann::json j = {
        {"session_id", session_id},
        {"capture_timestamp", capture_timestamp},
        {"width", pixels.cols},
        {"height", pixels.rows},
        {"channels", pixels.channels()},
        {"valid", is_valid()}
    };
    return j.dump();
}

} // namespace proctor

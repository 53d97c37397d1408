#include "Providers.hpp"
#include <utility>

namespace proctor {

CancellationToken::CancellationToken()
    : flag_(std::make_shared<std::atomic<bool>>(false)),
      has_deadline_(false) {
}

CancellationToken::CancellationToken(Clock::time_point deadline,
                                     std::shared_ptr<const std::atomic<bool>> session_flag)
    : flag_(std::make_shared<std::atomic<bool>>(false)),
      session_flag_(std::move(session_flag)),
      deadline_(deadline),
      has_deadline_(true) {
}

void CancellationToken::cancel() {
    flag_->store(true);
}

bool CancellationToken::deadline_passed() const {
    return has_deadline_ && Clock::now() >= deadline_;
}

bool CancellationToken::session_ended() const {
    return session_flag_ && session_flag_->load();
}

bool CancellationToken::is_cancelled() const {
    return flag_->load() || session_ended() || deadline_passed();
}

namespace {

struct PointName {
    FacialPoint point;
    const char* name;
};

const PointName kPointNames[] = {
    {FacialPoint::NOSE_TIP,           "nose_tip"},
    {FacialPoint::CHIN,               "chin"},
    {FacialPoint::LEFT_EYE_CORNER,    "left_eye_corner"},
    {FacialPoint::RIGHT_EYE_CORNER,   "right_eye_corner"},
    {FacialPoint::LEFT_MOUTH_CORNER,  "left_mouth_corner"},
    {FacialPoint::RIGHT_MOUTH_CORNER, "right_mouth_corner"},
};

} // namespace

const char* facial_point_to_string(FacialPoint point) {
    for (const auto& entry : kPointNames) {
        if (entry.point == point) return entry.name;
    }
    return "unknown";
}

bool facial_point_from_string(const std::string& name, FacialPoint* point) {
    for (const auto& entry : kPointNames) {
        if (name == entry.name) {
            if (point) *point = entry.point;
            return true;
        }
    }
    return false;
}

} // namespace proctor

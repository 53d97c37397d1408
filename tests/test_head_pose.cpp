#include "HeadPoseEstimator.hpp"
#include "ReplayProvider.hpp"
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

static bool near(double a, double b, double tol) {
    return std::abs(a - b) <= tol;
}

static PoseEstimate face(double yaw, double pitch) {
    PoseEstimate pose;
    pose.yaw = yaw;
    pose.pitch = pitch;
    pose.face_detected = true;
    pose.landmarks_count = 6;
    pose.confidence = 1.0f;
    return pose;
}

static RoiInfo full_frame(const cv::Size& size) {
    RoiInfo roi;
    roi.original_size = size;
    roi.region = cv::Rect(0, 0, size.width, size.height);
    return roi;
}

int main() {
    std::cout << "=== HeadPoseEstimator Test ===" << std::endl;

    const cv::Size frame_size(640, 480);
    HeadPoseEstimator estimator;

    // Test 1: Frontal face recovers zero angles
    {
        auto landmarks = synthesize_landmarks(EulerAngles(), frame_size);
        PoseEstimate pose = estimator.estimate(landmarks, full_frame(frame_size));
        assert_true(pose.face_detected, "frontal face detected");
        assert_true(near(pose.yaw, 0.0, 1.0) && near(pose.pitch, 0.0, 1.0) && near(pose.roll, 0.0, 1.0),
                    "frontal angles near zero");
        assert_true(pose.landmarks_count == 6, "six landmarks counted");
    }

    // Test 2: Known rotations are recovered
    {
        const EulerAngles cases[] = {
            {50.0, 0.0, 0.0},
            {-35.0, 10.0, 0.0},
            {20.0, -15.0, 5.0},
            {0.0, 32.0, 0.0}
        };
        bool all_ok = true;
        for (const auto& expected : cases) {
            auto landmarks = synthesize_landmarks(expected, frame_size);
            PoseEstimate pose = estimator.estimate(landmarks, full_frame(frame_size));
            if (!pose.face_detected ||
                !near(pose.yaw, expected.yaw, 1.0) ||
                !near(pose.pitch, expected.pitch, 1.0) ||
                !near(pose.roll, expected.roll, 1.0)) {
                std::cerr << "  expected yaw " << expected.yaw << " pitch " << expected.pitch
                          << " roll " << expected.roll << ", got " << pose.yaw << " "
                          << pose.pitch << " " << pose.roll << std::endl;
                all_ok = false;
            }
        }
        assert_true(all_ok, "yaw/pitch/roll recovered within 1 degree");
    }

    // Test 3: Positive yaw moves the nose toward image-left of the eyes
    {
        auto landmarks = synthesize_landmarks({30.0, 0.0, 0.0}, frame_size);
        float nose_x = landmarks.points[FacialPoint::NOSE_TIP].x;
        float eyes_mid = (landmarks.points[FacialPoint::LEFT_EYE_CORNER].x +
                          landmarks.points[FacialPoint::RIGHT_EYE_CORNER].x) / 2.0f;
        assert_true(nose_x < eyes_mid, "positive yaw is nose toward image-left");
    }

    // Test 4: Euler round trip through a rotation matrix
    {
        EulerAngles in{25.0, -12.0, 8.0};
        EulerAngles out = HeadPoseEstimator::rotation_to_euler(HeadPoseEstimator::euler_to_rotation(in));
        assert_true(near(in.yaw, out.yaw, 1e-6) && near(in.pitch, out.pitch, 1e-6) && near(in.roll, out.roll, 1e-6),
                    "rotation_to_euler inverts euler_to_rotation");
    }

    // Test 5: Missing face or a partial face gives no pose
    {
        PoseEstimate none = estimator.estimate(std::nullopt, full_frame(frame_size));
        assert_true(!none.face_detected && none.landmarks_count == 0, "no landmarks -> no face");

        auto partial = synthesize_landmarks(EulerAngles(), frame_size);
        partial.points.erase(FacialPoint::CHIN);
        PoseEstimate p = estimator.estimate(partial, full_frame(frame_size));
        assert_true(!p.face_detected, "five landmarks -> no face");
        assert_true(p.landmarks_count == 5, "partial landmarks still counted");
    }

    // Test 6: Degenerate landmarks (all on one point) do not throw
    {
        FaceLandmarks collapsed;
        for (FacialPoint point : HeadPoseEstimator::required_points()) {
            collapsed.points[point] = cv::Point2f(0.5f, 0.5f);
        }
        bool threw = false;
        PoseEstimate p;
        try {
            p = estimator.estimate(collapsed, full_frame(frame_size));
        } catch (const std::exception&) {
            threw = true;
        }
        assert_true(!threw, "collapsed landmarks handled");
        (void)p;
    }

    // Test 7: Landmarks normalized to an ROI map back to the full frame
    {
        RoiInfo roi = full_frame(frame_size);
        roi.enabled = true;
        roi.region = cv::Rect(0, 0, 640, 336);

        auto full = synthesize_landmarks({-20.0, 8.0, 0.0}, frame_size);
        FaceLandmarks in_roi = full;
        for (auto& entry : in_roi.points) {
            entry.second.y = entry.second.y * frame_size.height / roi.region.height;
        }
        PoseEstimate pose = estimator.estimate(in_roi, roi);
        assert_true(pose.face_detected && near(pose.yaw, -20.0, 1.0) && near(pose.pitch, 8.0, 1.0),
                    "ROI landmarks give full-frame pose");
    }

    // Test 8: Thresholds
    {
        PoseConfig config;
        assert_true(HeadPoseEstimator::is_deviating(50.0, 0.0, config), "yaw 50 deviates");
        assert_true(HeadPoseEstimator::is_deviating(0.0, -31.0, config), "pitch -31 deviates");
        assert_true(!HeadPoseEstimator::is_deviating(44.0, 29.0, config), "yaw 44 pitch 29 does not deviate");
        assert_true(HeadPoseEstimator::is_minor_deviation(35.0, 0.0, config), "yaw 35 is a minor deviation");
        assert_true(!HeadPoseEstimator::is_minor_deviation(10.0, 10.0, config), "small angles are not minor");
    }

    // Test 9: Deviation time accrues with capture time
    {
        DeviationState state;
        estimator.advance(face(50, 0), 0.0, state);
        estimator.advance(face(50, 0), 0.5, state);
        DeviationReport r = estimator.advance(face(50, 0), 1.0, state);
        assert_true(r.deviating && r.phase == DeviationPhase::DEVIATING, "deviating phase");
        assert_true(near(r.duration_accumulated, 1.0, 1e-9), "accrued 1.0s over two intervals");

        DeviationReport back = estimator.advance(face(5, 0), 1.5, state);
        assert_true(!back.deviating && back.phase == DeviationPhase::NORMAL, "normal phase after looking back");
        assert_true(near(back.duration_accumulated, 0.9, 1e-9), "decayed by 0.9");
    }

    // Test 10: Accumulated time never exceeds the deviating span
    {
        DeviationState state;
        double t = 0.0;
        for (int i = 0; i < 40; ++i) {
            t = i * 0.1;
            bool away = (i / 5) % 2 == 0;
            estimator.advance(face(away ? 60 : 0, 0), t, state);
        }
        assert_true(state.duration_accumulated >= 0.0, "accumulated time non-negative");
        assert_true(state.duration_accumulated <= t, "accumulated time bounded by elapsed time");
    }

    // Test 11: A no-face gap neither accrues nor decays
    {
        DeviationState state;
        estimator.advance(face(60, 0), 0.0, state);
        estimator.advance(face(60, 0), 1.0, state);

        DeviationReport gap1 = estimator.advance(PoseEstimate::no_face(), 2.0, state);
        DeviationReport gap2 = estimator.advance(PoseEstimate::no_face(), 3.0, state);
        assert_true(!gap1.deviating && !gap1.face_detected, "no face is not deviating");
        assert_true(near(gap2.duration_accumulated, 1.0, 1e-9), "gap keeps the accumulated time");

        DeviationReport resumed = estimator.advance(face(60, 0), 4.0, state);
        assert_true(near(resumed.duration_accumulated, 2.0, 1e-9), "gap time is not billed on resume");
    }

    // Test 12: Out-of-order timestamps do not reduce or inflate the total
    {
        DeviationState state;
        estimator.advance(face(60, 0), 5.0, state);
        DeviationReport r = estimator.advance(face(60, 0), 4.0, state);
        assert_true(near(r.duration_accumulated, 0.0, 1e-9), "negative dt clamps to zero");
    }

    // Test 13: Smoothing averages recent angles
    {
        PoseConfig smooth;
        smooth.smoothing_window = 3;
        DeviationState state;
        estimator.advance(face(60, 0), 0.0, state, smooth);
        estimator.advance(face(0, 0), 0.1, state, smooth);
        DeviationReport r = estimator.advance(face(0, 0), 0.2, state, smooth);
        assert_true(near(r.smoothed_yaw, 20.0, 1e-9), "smoothed yaw is the window mean");
        assert_true(!r.deviating, "one outlier does not deviate when smoothed");
    }

    // Test 14: Decay follows the config passed to each call
    {
        DeviationState state;
        PoseConfig fast;
        fast.decay_factor = 0.5;
        estimator.advance(face(60, 0), 0.0, state, fast);
        estimator.advance(face(60, 0), 2.0, state, fast);
        DeviationReport r = estimator.advance(face(0, 0), 2.5, state, fast);
        assert_true(near(r.duration_accumulated, 1.0, 1e-9), "halved with decay 0.5");

        PoseConfig slow;
        slow.decay_factor = 0.75;
        r = estimator.advance(face(0, 0), 3.0, state, slow);
        assert_true(near(r.duration_accumulated, 0.75, 1e-9), "next call decays by its own factor");
    }

    if (fails == 0) {
        std::cout << "\nALL TESTS PASSED" << std::endl;
        return 0;
    }
    std::cout << "\nTESTS FAILED: " << fails << std::endl;
    return 1;
}

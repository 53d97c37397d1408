#include "DetectionCoordinator.hpp"
#include "ReplayProvider.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <thread>

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

class StubLandmarks : public LandmarkProvider {
public:
    EulerAngles pose;
    int delay_ms = 0;
    bool cooperative = true;
    bool fail = false;

    std::optional<FaceLandmarks> detect(const cv::Mat& image, const FrameContext&,
                                        const CancellationToken& token) override {
        if (delay_ms > 0) {
            if (cooperative) {
                if (!cooperative_sleep(delay_ms, token)) return std::nullopt;
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            }
        }
        if (fail) throw std::runtime_error("landmark model crashed");
        return synthesize_landmarks(pose, image.size());
    }

    std::string name() const override { return "stub-landmarks"; }
};

class StubDetector : public ObjectDetector {
public:
    std::vector<RawDetection> detections;
    int delay_ms = 0;
    bool cooperative = true;
    bool fail = false;

    std::vector<RawDetection> detect(const cv::Mat&, const FrameContext&,
                                     const CancellationToken& token) override {
        if (delay_ms > 0) {
            if (cooperative) {
                if (!cooperative_sleep(delay_ms, token)) return {};
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            }
        }
        if (fail) throw std::runtime_error("detector unavailable");
        return detections;
    }

    std::string name() const override { return "stub-objects"; }
};

static PreprocessedFrame make_frame() {
    PreprocessedFrame frame;
    frame.image = cv::Mat(480, 640, CV_8UC3, cv::Scalar(90, 90, 90));
    frame.roi.original_size = frame.image.size();
    frame.roi.region = cv::Rect(0, 0, 640, 480);
    return frame;
}

static FrameContext make_context(uint64_t index = 1) {
    FrameContext context;
    context.session_id = "s1";
    context.frame_index = index;
    context.capture_timestamp = 0.0;
    return context;
}

static RawDetection phone() {
    RawDetection d;
    d.class_id = 67;
    d.class_name = "cell phone";
    d.confidence = 0.8f;
    d.bbox = cv::Rect2f(100, 100, 40, 80);
    return d;
}

int main() {
    std::cout << "=== DetectionCoordinator Test ===" << std::endl;

    auto pool = std::make_shared<WorkerPool>(4);
    ObjectFilterConfig filter;

    // Test 1: Both branches succeed
    {
        auto landmarks = std::make_shared<StubLandmarks>();
        landmarks->pose.yaw = 50.0;
        auto detector = std::make_shared<StubDetector>();
        detector->detections = {phone()};

        DetectionCoordinator coordinator(landmarks, detector);
        DetectionOutcome out = coordinator.run(*pool, make_frame(), make_context(), 500, filter);

        assert_true(out.pose_branch.status == BranchStatus::OK, "pose branch ok");
        assert_true(out.object_branch.status == BranchStatus::OK, "object branch ok");
        assert_true(out.pose.face_detected && std::abs(out.pose.yaw - 50.0) < 1.0, "pose recovered");
        assert_true(out.objects.forbidden_items.size() == 1, "phone reported");
        assert_true(!out.cancelled, "not cancelled");
    }

    // Test 2: Branches run concurrently
    {
        auto landmarks = std::make_shared<StubLandmarks>();
        landmarks->delay_ms = 100;
        auto detector = std::make_shared<StubDetector>();
        detector->delay_ms = 100;

        DetectionCoordinator coordinator(landmarks, detector);
        DetectionOutcome out = coordinator.run(*pool, make_frame(), make_context(), 1000, filter);
        assert_true(out.pose_branch.status == BranchStatus::OK &&
                    out.object_branch.status == BranchStatus::OK, "both slow branches finish");
        assert_true(out.elapsed_ms < 170.0, "wall time close to the slower branch, not the sum");
    }

    // Test 3: Slow detector times out, pose result is kept
    {
        auto landmarks = std::make_shared<StubLandmarks>();
        landmarks->pose.pitch = 10.0;
        auto detector = std::make_shared<StubDetector>();
        detector->detections = {phone()};
        detector->delay_ms = 400;

        DetectionCoordinator coordinator(landmarks, detector);
        auto start = std::chrono::steady_clock::now();
        DetectionOutcome out = coordinator.run(*pool, make_frame(), make_context(), 100, filter);
        double waited = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

        assert_true(out.pose_branch.status == BranchStatus::OK, "pose branch ok despite object timeout");
        assert_true(out.pose.face_detected, "pose still valid");
        assert_true(out.object_branch.status == BranchStatus::TIMEOUT, "object branch timed out");
        assert_true(out.objects.forbidden_items.empty() && out.objects.person_count == 0,
                    "timed out branch falls back to empty signal");
        assert_true(waited < 300.0, "call returns near the deadline");
    }

    // Test 4: A detector that ignores its token is abandoned at the deadline
    {
        auto landmarks = std::make_shared<StubLandmarks>();
        auto detector = std::make_shared<StubDetector>();
        detector->delay_ms = 300;
        detector->cooperative = false;

        DetectionCoordinator coordinator(landmarks, detector);
        DetectionOutcome out = coordinator.run(*pool, make_frame(), make_context(), 80, filter);
        assert_true(out.object_branch.status == BranchStatus::TIMEOUT, "uncooperative branch reported as timeout");
        assert_true(out.elapsed_ms < 250.0, "join did not wait for the uncooperative branch");
        pool->wait_all();
    }

    // Test 5: A throwing provider only fails its own branch
    {
        auto landmarks = std::make_shared<StubLandmarks>();
        landmarks->fail = true;
        auto detector = std::make_shared<StubDetector>();
        detector->detections = {phone()};

        DetectionCoordinator coordinator(landmarks, detector);
        DetectionOutcome out = coordinator.run(*pool, make_frame(), make_context(), 500, filter);
        assert_true(out.pose_branch.status == BranchStatus::FAILED, "pose branch failed");
        assert_true(out.pose_branch.error == "landmark model crashed", "failure message kept");
        assert_true(!out.pose.face_detected, "failed pose falls back to no face");
        assert_true(out.object_branch.status == BranchStatus::OK && out.objects.forbidden_items.size() == 1,
                    "object branch unaffected");
    }

    // Test 6: Both branches failing still yields an outcome
    {
        auto landmarks = std::make_shared<StubLandmarks>();
        landmarks->fail = true;
        auto detector = std::make_shared<StubDetector>();
        detector->fail = true;

        DetectionCoordinator coordinator(landmarks, detector);
        DetectionOutcome out = coordinator.run(*pool, make_frame(), make_context(), 500, filter);
        assert_true(out.pose_branch.status == BranchStatus::FAILED &&
                    out.object_branch.status == BranchStatus::FAILED, "both branches failed");
    }

    // Test 7: Ending the session aborts the join
    {
        auto landmarks = std::make_shared<StubLandmarks>();
        landmarks->delay_ms = 800;
        auto detector = std::make_shared<StubDetector>();
        detector->delay_ms = 800;

        auto session_flag = std::make_shared<std::atomic<bool>>(false);
        std::thread ender([session_flag] {
            std::this_thread::sleep_for(std::chrono::milliseconds(40));
            session_flag->store(true);
        });

        DetectionCoordinator coordinator(landmarks, detector);
        DetectionOutcome out = coordinator.run(*pool, make_frame(), make_context(), 2000, filter, session_flag);
        ender.join();

        assert_true(out.cancelled, "outcome marked cancelled");
        assert_true(out.pose_branch.status == BranchStatus::CANCELLED &&
                    out.object_branch.status == BranchStatus::CANCELLED, "branches cancelled");
        assert_true(out.elapsed_ms < 400.0, "cancellation is prompt");
    }

    // Test 8: Missing providers are reported as not run
    {
        DetectionCoordinator coordinator(nullptr, nullptr);
        DetectionOutcome out = coordinator.run(*pool, make_frame(), make_context(), 100, filter);
        assert_true(out.pose_branch.status == BranchStatus::NOT_RUN &&
                    out.object_branch.status == BranchStatus::NOT_RUN, "no providers -> not run");
        assert_true(!out.pose.face_detected && out.objects.forbidden_items.empty(), "defaults without providers");
        assert_true(coordinator.landmark_provider_name() == "none", "provider name placeholder");
    }

    // Test 9: Precomputed inputs
    {
        DetectionCoordinator coordinator(nullptr, nullptr);
        auto landmarks = synthesize_landmarks({-40.0, 0.0, 0.0}, cv::Size(640, 480));
        std::vector<RawDetection> detections = {phone()};

        DetectionOutcome out = coordinator.run(*pool, make_frame(), make_context(), landmarks, detections, 500, filter);
        assert_true(out.pose_branch.status == BranchStatus::OK && std::abs(out.pose.yaw + 40.0) < 1.0,
                    "precomputed landmarks give pose");
        assert_true(out.objects.forbidden_items.size() == 1, "precomputed detections filtered");

        DetectionOutcome none = coordinator.run(*pool, make_frame(), make_context(), std::nullopt, std::nullopt, 500, filter);
        assert_true(none.pose_branch.status == BranchStatus::OK && !none.pose.face_detected,
                    "no landmarks is a valid no-face result");
        assert_true(none.object_branch.status == BranchStatus::NOT_RUN, "no detections -> object branch not run");
    }

    // Test 10: A failing object branch leaves the pose untouched
    {
        const EulerAngles head{20.0, -10.0, 5.0};
        PreprocessedFrame frame = make_frame();
        HeadPoseEstimator estimator;
        PoseEstimate expected = estimator.estimate(synthesize_landmarks(head, frame.image.size()), frame.roi);

        auto landmarks = std::make_shared<StubLandmarks>();
        landmarks->pose = head;
        auto detector = std::make_shared<StubDetector>();
        detector->fail = true;

        DetectionCoordinator coordinator(landmarks, detector);
        DetectionOutcome out = coordinator.run(*pool, frame, make_context(), 500, filter);
        assert_true(out.object_branch.status == BranchStatus::FAILED, "object branch failed");
        assert_true(out.pose_branch.status == BranchStatus::OK && out.pose.face_detected, "pose branch ok");
        assert_true(out.pose.yaw == expected.yaw && out.pose.pitch == expected.pitch &&
                    out.pose.roll == expected.roll, "angles identical to a direct estimate");
        assert_true(out.pose.landmarks_count == expected.landmarks_count &&
                    out.pose.confidence == expected.confidence, "landmark count and confidence identical");

        DetectionCoordinator pose_only(landmarks, nullptr);
        DetectionOutcome alone = pose_only.run(*pool, frame, make_context(), 500, filter);
        assert_true(alone.pose.yaw == out.pose.yaw && alone.pose.pitch == out.pose.pitch &&
                    alone.pose.roll == out.pose.roll && alone.pose.confidence == out.pose.confidence,
                    "pose matches a run without an object detector");
    }

    // Test 11: Separate executors do not wait on each other
    {
        WorkerPool busy(2);
        WorkerPool idle(2);

        auto slow = std::make_shared<StubLandmarks>();
        slow->delay_ms = 600;
        slow->cooperative = false;
        auto slow_detector = std::make_shared<StubDetector>();
        slow_detector->delay_ms = 600;
        slow_detector->cooperative = false;
        DetectionCoordinator stuck(slow, slow_detector);
        DetectionOutcome late = stuck.run(busy, make_frame(), make_context(), 50, filter);
        assert_true(late.pose_branch.status == BranchStatus::TIMEOUT, "overrunning provider times out");

        auto landmarks = std::make_shared<StubLandmarks>();
        auto detector = std::make_shared<StubDetector>();
        detector->detections = {phone()};
        DetectionCoordinator healthy(landmarks, detector);
        DetectionOutcome out = healthy.run(idle, make_frame(), make_context(2), 200, filter);
        assert_true(out.pose_branch.status == BranchStatus::OK &&
                    out.object_branch.status == BranchStatus::OK,
                    "branches on another executor complete while the first is saturated");
        assert_true(out.objects.forbidden_items.size() == 1, "detections from the healthy executor kept");

        busy.wait_all();
    }

    pool->wait_all();

    if (fails == 0) {
        std::cout << "\nALL TESTS PASSED" << std::endl;
        return 0;
    }
    std::cout << "\nTESTS FAILED: " << fails << std::endl;
    return 1;
}

// data_types_main.cpp
#include "DataTypes.h"
#include "KinematicErrors.h"
#include "Logger.h"

#include <cmath>
#include <string>
#include <vector>

using namespace RKC;
using namespace RKC::literals;

namespace {

int g_failures = 0;

void expect(bool condition, const std::string& what) {
    if (condition) {
        LOG_DEBUG_F("DataTypesTest", "  ok: %s", what.c_str());
    } else {
        ++g_failures;
        LOG_ERROR_F("DataTypesTest", "FAILURE: %s", what.c_str());
    }
}

void testPoseArrayRoundTrip() {
    LOG_INFO("DataTypesTest", "--- EEPose array round trip ---");

    EEPose pose;
    pose.x = 0.1234567890123_m;
    pose.y = Meters(-0.0000001);
    pose.z = (245.5_mm).toMeters();
    pose.pitch = (33.3_deg).toRadians();
    pose.roll = Radians(-3.0);

    const PoseVector arr = pose.toArray();
    expect(arr(0) == pose.x.value() && arr(1) == pose.y.value() && arr(2) == pose.z.value(),
           "toArray keeps x, y, z order");
    expect(arr(3) == pose.pitch.value() && arr(4) == pose.roll.value(),
           "toArray keeps pitch, roll order");

    const EEPose back = EEPose::fromArray(arr);
    expect(back.toArray() == arr, "fromArray(toArray(p)) is bit-exact");
    expect(back == pose, "round-tripped pose compares equal");

    LOG_INFO_F("DataTypesTest", "Pose: %s", pose.toDescriptiveString().c_str());
}

void testPoseShapeErrors() {
    LOG_INFO("DataTypesTest", "--- EEPose shape errors ---");

    for (Eigen::Index bad_size : {0, 4, 6}) {
        bool thrown = false;
        try {
            (void)EEPose::fromArray(Eigen::VectorXd::Zero(bad_size));
        } catch (const ShapeError& e) {
            thrown = true;
            LOG_DEBUG_F("DataTypesTest", "  expected ShapeError: %s", e.what());
        }
        expect(thrown, "fromArray rejects length " + std::to_string(bad_size));
    }

    Eigen::VectorXd five(5);
    five << 1.0, 2.0, 3.0, 0.1, 0.2;
    const EEPose pose = EEPose::fromArray(five);
    expect(pose.z.value() == 3.0 && pose.roll.value() == 0.2, "fromArray accepts a dynamic 5-vector");
}

void testJointVectorHelpers() {
    LOG_INFO("DataTypesTest", "--- Joint vector helpers ---");

    const std::vector<Degrees> deg = {90.0_deg, -45.0_deg, 0.0_deg, 180.0_deg, 12.5_deg};
    const JointVector rad = jointVectorFromDegrees(deg);
    expect(rad.size() == 5, "degree conversion keeps length");
    expect(std::abs(rad(0) - UnitConstants::PI / 2.0) < 1e-12, "90 deg -> pi/2");
    expect(std::abs(rad(3) - UnitConstants::PI) < 1e-12, "180 deg -> pi");

    const std::vector<Degrees> back = jointVectorToDegrees(rad);
    bool same = back.size() == deg.size();
    for (std::size_t i = 0; same && i < deg.size(); ++i) same = (back[i] == deg[i]);
    expect(same, "radians -> degrees -> radians is consistent");

    const std::string text = jointVectorToString(rad);
    expect(text.find("90.0") != std::string::npos && text.find("-45.0") != std::string::npos,
           "jointVectorToString prints degrees");
    LOG_INFO_F("DataTypesTest", "Joints: %s", text.c_str());
}

void testUnits() {
    LOG_INFO("DataTypesTest", "--- Units ---");

    expect(std::abs(wrapToPi(3.0 * UnitConstants::PI / 2.0) + UnitConstants::PI / 2.0) < 1e-12, "wrapToPi(3pi/2) = -pi/2");
    expect(std::abs(wrapToPi(-0.25) + 0.25) < 1e-12, "wrapToPi keeps small angles");
    expect((370.0_deg).toRadians().normalized().toDegrees() == 10.0_deg, "normalized() wraps 370 deg to 10 deg");
    expect((1.5_m).toMillimeters().value() == 1500.0, "meters to millimeters");
    expect((250.0_mm).toMeters() == 0.25_m, "millimeters to meters");
    expect(to_string(JointAxis::Y) == "Y", "JointAxis names");
}

} // namespace

int main([[maybe_unused]] int argc, [[maybe_unused]] char *argv[]) {
    Logger::setLogLevel(LogLevel::Info);

    try {
        testPoseArrayRoundTrip();
        testPoseShapeErrors();
        testJointVectorHelpers();
        testUnits();
    } catch (const std::exception& e) {
        LOG_CRITICAL_F("DataTypesTest", "Unhandled exception: %s", e.what());
        return 1;
    }

    if (g_failures > 0) {
        LOG_ERROR_F("DataTypesTest", "%d check(s) failed.", g_failures);
        return 1;
    }
    LOG_INFO("DataTypesTest", "All data type tests passed.");
    return 0;
}

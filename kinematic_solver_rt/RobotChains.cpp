// RobotChains.cpp
#include "RobotChains.h"
#include "KinematicErrors.h"
#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace RKC {

using namespace RKC::literals;

namespace {

const std::string MODULE_NAME = "RobotChains";

void logChain(const char* model, const KinematicChain& chain) {
    LOG_INFO_F(MODULE_NAME, "%s chain created with %u DoF.", model, chain.getNrOfJoints());
    if (!Logger::isLevelEnabled(LogLevel::Debug)) return;

    for (const auto& joint : chain.getJoints()) {
        LOG_DEBUG_F(MODULE_NAME, "  %-14s axis %s  offset (%.4f, %.4f, %.4f) m  limits [%s, %s]",
                    joint.getName().c_str(), to_string(joint.getAxis()).c_str(),
                    joint.getOffset().x(), joint.getOffset().y(), joint.getOffset().z(),
                    joint.getLowerLimit().toDegrees().toString(1).c_str(),
                    joint.getUpperLimit().toDegrees().toString(1).c_str());
    }
}

} // namespace

KinematicChain createSO101Chain() {
    LOG_INFO(MODULE_NAME, "Creating kinematic chain for SO-101.");

    std::vector<RevoluteJoint> joints;
    joints.reserve(5);

    // Base to shoulder pan
    joints.emplace_back("shoulder_pan", JointAxis::Y, KDL::Vector(0.0388, 0.0, 0.0624),
                        (-110.0_deg).toRadians(), (110.0_deg).toRadians());
    // Shoulder pan to shoulder lift
    joints.emplace_back("shoulder_lift", JointAxis::X, KDL::Vector(-0.0304, -0.0183, -0.0542),
                        (-100.0_deg).toRadians(), (100.0_deg).toRadians());
    // Upper arm
    joints.emplace_back("elbow_flex", JointAxis::X, KDL::Vector(-0.11257, -0.028, 0.0),
                        Radians(-1.69), Radians(1.69));
    // Forearm
    joints.emplace_back("wrist_flex", JointAxis::X, KDL::Vector(-0.1349, 0.0052, 0.0),
                        (-95.0_deg).toRadians(), (95.0_deg).toRadians());
    // Wrist; the roll range is asymmetric on the real servo
    joints.emplace_back("wrist_roll", JointAxis::Y, KDL::Vector(0.0, -0.0611, 0.0181),
                        Radians(-2.74385), Radians(2.84121));

    // wrist_roll frame to the gripper tip (gripper_frame_joint in the URDF)
    KinematicChain chain(std::move(joints), KDL::Vector(-0.0079, 0.0, -0.0981));
    logChain("SO-101", chain);
    return chain;
}

KinematicChain createKochChain() {
    LOG_INFO(MODULE_NAME, "Creating kinematic chain for Koch v1.1.");
    LOG_WARN(MODULE_NAME, "Koch link parameters are estimates; validate them on the robot before precise work.");

    std::vector<RevoluteJoint> joints;
    joints.reserve(5);

    joints.emplace_back("shoulder_pan", JointAxis::Y, KDL::Vector(0.0, 0.0, 0.05),
                        (-150.0_deg).toRadians(), (150.0_deg).toRadians());
    joints.emplace_back("shoulder_lift", JointAxis::X, KDL::Vector(0.0, 0.0, -0.04),
                        (-100.0_deg).toRadians(), (100.0_deg).toRadians());
    // Upper arm, ~110 mm
    joints.emplace_back("elbow", JointAxis::X, KDL::Vector(-0.110, 0.0, 0.0),
                        (-100.0_deg).toRadians(), (100.0_deg).toRadians());
    // Forearm, ~100 mm
    joints.emplace_back("wrist_flex", JointAxis::X, KDL::Vector(-0.100, 0.0, 0.0),
                        (-100.0_deg).toRadians(), (100.0_deg).toRadians());
    // Half a turn each way; the Koch data sheet rounds this to +-3.14159 rad.
    joints.emplace_back("wrist_roll", JointAxis::Y, KDL::Vector(0.0, -0.04, 0.0),
                        (-180.0_deg).toRadians(), (180.0_deg).toRadians());

    KinematicChain chain(std::move(joints), KDL::Vector(0.0, 0.0, -0.06));
    logChain("Koch v1.1", chain);
    return chain;
}

std::vector<std::string> availableChainNames() {
    return {"so101", "koch"};
}

KinematicChain createChainByName(const std::string& model_name) {
    std::string key = model_name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "so101" || key == "so-101") return createSO101Chain();
    if (key == "koch")                     return createKochChain();

    LOG_ERROR_F(MODULE_NAME, "Unknown robot model '%s'.", model_name.c_str());
    throw ConfigurationError("createChainByName: unknown robot model '" + model_name + "'.");
}

} // namespace RKC

// robot_chains_main.cpp
#include "RobotChains.h"
#include "KinematicChain.h"
#include "KinematicErrors.h"
#include "DataTypes.h"
#include "Logger.h"

#include <cmath>
#include <string>
#include <vector>

using namespace RKC;

namespace {

int g_failures = 0;

void expect(bool condition, const std::string& what) {
    if (condition) {
        LOG_DEBUG_F("RobotChainsTest", "  ok: %s", what.c_str());
    } else {
        ++g_failures;
        LOG_ERROR_F("RobotChainsTest", "FAILURE: %s", what.c_str());
    }
}

void checkCommonProperties(const std::string& model, const KinematicChain& chain,
                           const std::vector<std::string>& expected_names) {
    expect(chain.getNrOfJoints() == 5, model + ": 5 joints");
    expect(chain.getJointNames() == expected_names, model + ": joint names in base-to-tip order");

    bool ordered = true;
    for (Eigen::Index i = 0; i < chain.getLowerLimits().size(); ++i) {
        ordered = ordered && chain.getLowerLimits()(i) < chain.getUpperLimits()(i);
    }
    expect(ordered, model + ": every lower limit is below its upper limit");
    expect(chain.isWithinLimits(JointVector::Zero(5)), model + ": home configuration is within limits");

    const EEPose home = chain.forwardKinematics(JointVector::Zero(5));
    const double reach_xy = std::hypot(home.x.value(), home.y.value());
    const double reach = home.toArray().head<3>().norm();
    LOG_INFO_F("RobotChainsTest", "%s home pose: %s", model.c_str(), home.toDescriptiveString().c_str());
    expect(reach_xy > 0.01 && reach_xy < 0.6, model + ": home reach in the XY plane is plausible");
    expect(reach > 0.01 && reach < 0.5, model + ": home reach is plausible");
}

void testSO101() {
    LOG_INFO("RobotChainsTest", "--- SO-101 ---");

    const KinematicChain chain = createSO101Chain();
    checkCommonProperties("SO-101", chain,
                          {"shoulder_pan", "shoulder_lift", "elbow_flex", "wrist_flex", "wrist_roll"});

    // At q = 0 every rotation is identity, so the tip is the sum of all offsets.
    const EEPose home = chain.forwardKinematics(JointVector::Zero(5));
    expect(std::abs(home.x.value() + 0.24697) < 1e-9, "SO-101: home x");
    expect(std::abs(home.y.value() + 0.1022) < 1e-9, "SO-101: home y");
    expect(std::abs(home.z.value() + 0.0718) < 1e-9, "SO-101: home z");

    expect(chain.getJoints()[0].getAxis() == JointAxis::Y, "SO-101: shoulder_pan rotates about Y");
    expect(chain.getJoints()[2].getAxis() == JointAxis::X, "SO-101: elbow_flex rotates about X");
    expect(std::abs(chain.getLowerLimits()(4) + 2.74385) < 1e-12 && std::abs(chain.getUpperLimits()(4) - 2.84121) < 1e-12,
           "SO-101: asymmetric wrist_roll range");
    expect(std::abs(chain.getEndEffectorOffset().z() + 0.0981) < 1e-12, "SO-101: gripper tip offset");
}

void testKoch() {
    LOG_INFO("RobotChainsTest", "--- Koch v1.1 ---");

    const KinematicChain chain = createKochChain();
    checkCommonProperties("Koch", chain,
                          {"shoulder_pan", "shoulder_lift", "elbow", "wrist_flex", "wrist_roll"});

    const EEPose home = chain.forwardKinematics(JointVector::Zero(5));
    expect(std::abs(home.x.value() + 0.21) < 1e-9, "Koch: home x");
    expect(std::abs(home.y.value() + 0.04) < 1e-9, "Koch: home y");
    expect(std::abs(home.z.value() + 0.05) < 1e-9, "Koch: home z");
    expect(std::abs(chain.getUpperLimits()(4) - UnitConstants::PI) < 1e-12 &&
           std::abs(chain.getLowerLimits()(4) + UnitConstants::PI) < 1e-12,
           "Koch: wrist_roll turns a half revolution each way");
}

void testLookupByName() {
    LOG_INFO("RobotChainsTest", "--- Lookup by name ---");

    const std::vector<std::string> names = availableChainNames();
    expect(names.size() == 2, "two robot models are known");

    for (const std::string& name : names) {
        const KinematicChain chain = createChainByName(name);
        expect(chain.getNrOfJoints() == 5, name + ": created by name");
    }

    const KinematicChain upper = createChainByName("SO-101");
    expect(upper.getJointNames()[2] == "elbow_flex", "lookup is case-insensitive and accepts 'SO-101'");
    const KinematicChain koch = createChainByName("Koch");
    expect(koch.getJointNames()[2] == "elbow", "'Koch' resolves to the Koch arm");

    bool thrown = false;
    try {
        (void)createChainByName("ur5");
    } catch (const ConfigurationError& e) {
        thrown = true;
        LOG_DEBUG_F("RobotChainsTest", "  expected ConfigurationError: %s", e.what());
    }
    expect(thrown, "unknown model names are rejected");
}

} // namespace

int main(int argc, char *argv[]) {
    Logger::setLogLevel(argc > 1 ? logLevelFromString(argv[1]) : LogLevel::Info);

    try {
        testSO101();
        testKoch();
        testLookupByName();
    } catch (const std::exception& e) {
        LOG_CRITICAL_F("RobotChainsTest", "Unhandled exception: %s", e.what());
        return 1;
    }

    if (g_failures > 0) {
        LOG_ERROR_F("RobotChainsTest", "%d check(s) failed.", g_failures);
        return 1;
    }
    LOG_INFO("RobotChainsTest", "All robot chain tests passed.");
    return 0;
}

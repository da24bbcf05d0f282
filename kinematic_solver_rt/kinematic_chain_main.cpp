// kinematic_chain_main.cpp
#include "KinematicChain.h"
#include "RevoluteJoint.h"
#include "KinematicErrors.h"
#include "DataTypes.h"
#include "Logger.h"

#include <Eigen/LU>

#include <cmath>
#include <functional>
#include <initializer_list>
#include <limits>
#include <string>
#include <utility>
#include <vector>

using namespace RKC;
using namespace RKC::literals;

namespace {

int g_failures = 0;

void expect(bool condition, const std::string& what) {
    if (condition) {
        LOG_DEBUG_F("ChainTest", "  ok: %s", what.c_str());
    } else {
        ++g_failures;
        LOG_ERROR_F("ChainTest", "FAILURE: %s", what.c_str());
    }
}

void expectConfigurationError(const std::function<void()>& action, const std::string& what) {
    bool thrown = false;
    try {
        action();
    } catch (const ConfigurationError& e) {
        thrown = true;
        LOG_DEBUG_F("ChainTest", "  expected ConfigurationError: %s", e.what());
    }
    expect(thrown, what);
}

JointVector makeJoints(std::initializer_list<double> values) {
    JointVector q(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double v : values) q(i++) = v;
    return q;
}

/// Two joints about Z, links of 0.3 m and 0.2 m in the XY plane.
KinematicChain makePlanarTwoLink() {
    std::vector<RevoluteJoint> joints;
    joints.emplace_back("j1", JointAxis::Z, KDL::Vector(0.0, 0.0, 0.0), Radians(-3.0), Radians(3.0));
    joints.emplace_back("j2", JointAxis::Z, KDL::Vector(0.3, 0.0, 0.0), Radians(-3.0), Radians(3.0));
    return KinematicChain(std::move(joints), KDL::Vector(0.2, 0.0, 0.0));
}

void testConcreteScenario() {
    LOG_INFO("ChainTest", "--- Vertical base offset at zero pose ---");

    std::vector<RevoluteJoint> joints;
    joints.emplace_back("j1", JointAxis::Y, KDL::Vector(0.0, 0.0, 0.05), (-180.0_deg).toRadians(), (180.0_deg).toRadians());
    for (int i = 2; i <= 5; ++i) {
        joints.emplace_back("j" + std::to_string(i), JointAxis::X, KDL::Vector::Zero(),
                            (-180.0_deg).toRadians(), (180.0_deg).toRadians());
    }
    const KinematicChain chain(std::move(joints));

    const EEPose pose = chain.forwardKinematics(JointVector::Zero(5));
    expect(std::abs(pose.z.value() - 0.05) < 1e-9, "z equals the base offset at q = 0");
    expect(std::abs(pose.x.value()) < 1e-12 && std::abs(pose.y.value()) < 1e-12, "x and y are zero at q = 0");
    expect(std::abs(pose.pitch.value()) < 1e-12 && std::abs(pose.roll.value()) < 1e-12, "orientation is identity at q = 0");
    expect(chain.getNrOfJoints() == 5, "chain reports 5 joints");
    expect(chain.getKdlChain().getNrOfJoints() == 5, "KDL model carries one moving segment per joint");
}

void testPlanarForwardKinematics() {
    LOG_INFO("ChainTest", "--- Planar three-link forward kinematics ---");

    std::vector<RevoluteJoint> joints;
    joints.emplace_back("j1", JointAxis::Z, KDL::Vector(0.1, 0.0, 0.0), Radians(-3.0), Radians(3.0));
    joints.emplace_back("j2", JointAxis::Z, KDL::Vector(0.2, 0.0, 0.0), Radians(-3.0), Radians(3.0));
    joints.emplace_back("j3", JointAxis::Z, KDL::Vector(0.15, 0.0, 0.0), Radians(-3.0), Radians(3.0));
    const KinematicChain chain(std::move(joints));

    const EEPose stretched = chain.forwardKinematics(JointVector::Zero(3));
    expect(std::abs(stretched.x.value() - 0.45) < 1e-12, "stretched arm reaches x = 0.45");
    expect(std::abs(stretched.y.value()) < 1e-12, "stretched arm stays on the x axis");

    const EEPose bent = chain.forwardKinematics(makeJoints({UnitConstants::PI / 2.0, 0.0, 0.0}));
    expect(std::abs(bent.x.value() - 0.1) < 1e-12, "first offset is applied before the first rotation");
    expect(std::abs(bent.y.value() - 0.35) < 1e-12, "remaining links follow the rotated frame");
    expect(std::abs(bent.z.value()) < 1e-12, "planar chain keeps z = 0");

    const Eigen::Matrix4d T = chain.forwardKinematicsMatrix(makeJoints({UnitConstants::PI / 2.0, 0.0, 0.0}));
    expect(std::abs(T(0, 3) - bent.x.value()) < 1e-15 && std::abs(T(1, 3) - bent.y.value()) < 1e-15,
           "matrix translation matches the pose");
    expect(T(3, 0) == 0.0 && T(3, 1) == 0.0 && T(3, 2) == 0.0 && T(3, 3) == 1.0, "matrix is homogeneous");
    expect(std::abs(T.topLeftCorner<3, 3>().determinant() - 1.0) < 1e-12, "rotation block is proper");
}

void testDeterminism() {
    LOG_INFO("ChainTest", "--- Forward kinematics determinism ---");

    const KinematicChain chain = makePlanarTwoLink();
    const JointVector q = makeJoints({0.3, 0.5});

    const PoseVector first = chain.forwardKinematics(q).toArray();
    bool identical = true;
    for (int i = 0; i < 10; ++i) {
        identical = identical && (chain.forwardKinematics(q).toArray() == first);
    }
    expect(identical, "repeated FK calls are bit-identical");
    expect(chain.jacobian(q) == chain.jacobian(q), "repeated Jacobian calls are bit-identical");
}

void testJacobianAccuracy() {
    LOG_INFO("ChainTest", "--- Numerical Jacobian accuracy ---");

    const KinematicChain chain = makePlanarTwoLink();
    const double q1 = 0.3, q2 = 0.5;
    const JointVector q = makeJoints({q1, q2});

    TaskJacobian analytic = TaskJacobian::Zero(5, 2);
    const double x = 0.3 * std::cos(q1) + 0.2 * std::cos(q1 + q2);
    const double y = 0.3 * std::sin(q1) + 0.2 * std::sin(q1 + q2);
    analytic(0, 0) = -y;
    analytic(1, 0) = x;
    analytic(0, 1) = -0.2 * std::sin(q1 + q2);
    analytic(1, 1) = 0.2 * std::cos(q1 + q2);

    const TaskJacobian J_coarse = chain.jacobian(q, 1e-2);
    const TaskJacobian J_fine = chain.jacobian(q, 1e-3);
    const double err_coarse = (J_coarse - analytic).cwiseAbs().maxCoeff();
    const double err_fine = (J_fine - analytic).cwiseAbs().maxCoeff();
    LOG_INFO_F("ChainTest", "max |J - J_analytic|: %.3e (delta 1e-2), %.3e (delta 1e-3)", err_coarse, err_fine);

    expect(J_coarse.rows() == 5 && J_coarse.cols() == 2, "Jacobian is 5 x n");
    expect(err_coarse < 1e-4, "delta 1e-2 is already close to the analytic Jacobian");
    expect(err_fine > 0.0 && err_coarse / err_fine > 50.0, "error shrinks quadratically with delta");
    expect((chain.jacobian(q) - analytic).cwiseAbs().maxCoeff() < 1e-6, "default delta matches the analytic Jacobian");
    expect(J_fine.bottomRows<3>().cwiseAbs().maxCoeff() < 1e-9, "rotation about Z leaves z, pitch and roll unchanged");
}

void testClamping() {
    LOG_INFO("ChainTest", "--- Joint limit clamping ---");

    std::vector<RevoluteJoint> joints;
    joints.emplace_back("a", JointAxis::X, KDL::Vector::Zero(), Radians(-1.0), Radians(1.0));
    joints.emplace_back("b", JointAxis::Y, KDL::Vector(0.0, 0.0, 0.1), Radians(-0.5), Radians(2.0));
    joints.emplace_back("c", JointAxis::Z, KDL::Vector(0.1, 0.0, 0.0), Radians(0.0), Radians(0.1));
    const KinematicChain chain(std::move(joints));

    const JointVector q = makeJoints({5.0, -5.0, 0.05});
    const JointVector clamped = chain.clampToLimits(q);
    expect(clamped(0) == 1.0 && clamped(1) == -0.5 && clamped(2) == 0.05, "values are clipped into the limits");
    expect(chain.clampToLimits(clamped) == clamped, "clamping is idempotent");
    expect(chain.isWithinLimits(clamped), "clamped vector is within limits");
    expect(!chain.isWithinLimits(q), "out-of-range vector is detected");

    const JointVector with_margin = chain.clampToLimits(q, 0.2);
    expect(std::abs(with_margin(0) - 0.8) < 1e-12, "margin pulls the upper bound inwards");
    expect(std::abs(with_margin(1) + 0.3) < 1e-12, "margin pulls the lower bound inwards");
    expect(std::abs(with_margin(2) - 0.05) < 1e-12, "a range narrower than the margin collapses to its midpoint");
    expect(chain.clampToLimits(q, 0.0) == clamped, "zero margin equals the plain clamp");

    expect(chain.getLowerLimits()(1) == -0.5 && chain.getUpperLimits()(1) == 2.0, "limit vectors follow joint order");
    const std::vector<std::string> names = chain.getJointNames();
    expect(names.size() == 3 && names[0] == "a" && names[2] == "c", "joint names follow joint order");
}

void testConfigurationErrors() {
    LOG_INFO("ChainTest", "--- Configuration errors ---");

    expectConfigurationError([] {
        RevoluteJoint bad("bad", JointAxis::X, KDL::Vector::Zero(), Radians(1.0), Radians(-1.0));
        (void)bad;
    }, "lower limit above upper limit is rejected");

    expectConfigurationError([] {
        RevoluteJoint bad("bad", JointAxis::X, KDL::Vector::Zero(), Radians(std::nan("")), Radians(1.0));
        (void)bad;
    }, "non-finite limit is rejected");

    expectConfigurationError([] {
        RevoluteJoint bad("bad", JointAxis::Y, KDL::Vector(std::nan(""), 0.0, 0.0), Radians(-1.0), Radians(1.0));
        (void)bad;
    }, "non-finite joint offset is rejected");

    expectConfigurationError([] {
        std::vector<RevoluteJoint> joints;
        joints.emplace_back("j1", JointAxis::Z, KDL::Vector::Zero(), Radians(-1.0), Radians(1.0));
        KinematicChain bad(std::move(joints), KDL::Vector(0.0, 0.0, std::numeric_limits<double>::infinity()));
        (void)bad;
    }, "non-finite end-effector offset is rejected");

    expectConfigurationError([] {
        KinematicChain empty(std::vector<RevoluteJoint>{});
        (void)empty;
    }, "empty chain is rejected");

    const KinematicChain chain = makePlanarTwoLink();
    expectConfigurationError([&] { (void)chain.forwardKinematics(JointVector::Zero(3)); },
                             "FK rejects a joint vector of the wrong length");
    expectConfigurationError([&] { (void)chain.forwardKinematicsMatrix(JointVector::Zero(1)); },
                             "FK matrix rejects a joint vector of the wrong length");
    expectConfigurationError([&] { (void)chain.jacobian(JointVector::Zero(2), 0.0); },
                             "Jacobian rejects delta = 0");
    expectConfigurationError([&] { (void)chain.jacobian(JointVector::Zero(2), -1e-6); },
                             "Jacobian rejects a negative delta");
    expectConfigurationError([&] { (void)chain.clampToLimits(JointVector::Zero(4)); },
                             "clamp rejects a joint vector of the wrong length");

    RevoluteJoint fixed("fixed", JointAxis::Z, KDL::Vector::Zero(), Radians(0.25), Radians(0.25));
    expect(fixed.getLowerLimit() == fixed.getUpperLimit(), "equal limits are accepted");
}

} // namespace

int main([[maybe_unused]] int argc, [[maybe_unused]] char *argv[]) {
    Logger::setLogLevel(LogLevel::Info);

    try {
        testConcreteScenario();
        testPlanarForwardKinematics();
        testDeterminism();
        testJacobianAccuracy();
        testClamping();
        testConfigurationErrors();
    } catch (const std::exception& e) {
        LOG_CRITICAL_F("ChainTest", "Unhandled exception: %s", e.what());
        return 1;
    }

    if (g_failures > 0) {
        LOG_ERROR_F("ChainTest", "%d check(s) failed.", g_failures);
        return 1;
    }
    LOG_INFO("ChainTest", "All kinematic chain tests passed.");
    return 0;
}

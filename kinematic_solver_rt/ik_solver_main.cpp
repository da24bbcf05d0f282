// ik_solver_main.cpp
#include "IKSolver.h"
#include "KinematicChain.h"
#include "RobotChains.h"
#include "KinematicErrors.h"
#include "DataTypes.h"
#include "Logger.h"

#include <cmath>
#include <functional>
#include <initializer_list>
#include <limits>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

using namespace RKC;
using namespace RKC::literals;

namespace {

// The solver holds a reference to its chain, so a temporary chain must not bind.
static_assert(!std::is_constructible_v<IKSolver, KinematicChain&&>, "IKSolver must not accept a temporary chain");
static_assert(std::is_constructible_v<IKSolver, const KinematicChain&>, "IKSolver takes a chain by reference");

int g_failures = 0;

void expect(bool condition, const std::string& what) {
    if (condition) {
        LOG_DEBUG_F("IKSolverTest", "  ok: %s", what.c_str());
    } else {
        ++g_failures;
        LOG_ERROR_F("IKSolverTest", "FAILURE: %s", what.c_str());
    }
}

void expectConfigurationError(const std::function<void()>& action, const std::string& what) {
    bool thrown = false;
    try {
        action();
    } catch (const ConfigurationError& e) {
        thrown = true;
        LOG_DEBUG_F("IKSolverTest", "  expected ConfigurationError: %s", e.what());
    }
    expect(thrown, what);
}

JointVector makeJoints(std::initializer_list<double> values) {
    JointVector q(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double v : values) q(i++) = v;
    return q;
}

void logResult(const char* label, const IKResult& result) {
    LOG_INFO_F("IKSolverTest", "%s: success=%d iter=%d pos_err=%.3e m ori_err=%.3e rad q=%s",
               label, result.success ? 1 : 0, result.iterations, result.position_error,
               result.orientation_error, jointVectorToString(result.final_joint_angles).c_str());
}

void testRoundTrip(const std::string& model) {
    LOG_INFO_F("IKSolverTest", "--- FK -> IK round trip (%s) ---", model.c_str());

    const KinematicChain chain = createChainByName(model);
    const IKSolver solver(chain);

    const JointVector q = makeJoints({0.2, -0.3, 0.4, 0.2, 0.1});
    const IKResult result = solver.solve(chain.forwardKinematics(q), q);
    logResult("round trip", result);

    expect(result.success && result.converged, model + ": solving at the current pose converges");
    expect(result.iterations == 0, model + ": no iteration is needed at the current pose");
    expect(result.position_error < solver.getConfig().tolerance, model + ": position error is below tolerance");
    expect(result.final_joint_angles == q, model + ": joint angles are returned unchanged");
}

void testNearbyTargets(const std::string& model) {
    LOG_INFO_F("IKSolverTest", "--- Reachable targets (%s) ---", model.c_str());

    const KinematicChain chain = createChainByName(model);
    const IKSolver solver(chain);

    const JointVector q_target = makeJoints({0.2, -0.3, 0.4, 0.2, 0.1});
    const EEPose target = chain.forwardKinematics(q_target);
    LOG_INFO_F("IKSolverTest", "Target: %s", target.toDescriptiveString().c_str());

    const IKResult nearby = solver.solve(target, makeJoints({0.15, -0.25, 0.35, 0.15, 0.05}));
    logResult("nearby seed", nearby);
    expect(nearby.success, model + ": converges from a nearby seed");
    expect(nearby.iterations > 0 && nearby.iterations <= solver.getConfig().max_iterations,
           model + ": iteration count is within the cap");
    expect(nearby.position_error < 1e-4, model + ": position error below 0.1 mm");
    expect(chain.isWithinLimits(nearby.final_joint_angles), model + ": solution respects joint limits");

    const IKResult from_home = solver.solve(target, JointVector::Zero(5));
    logResult("home seed", from_home);
    expect(from_home.success, model + ": converges from the home configuration");

    const EEPose reached = chain.forwardKinematics(from_home.final_joint_angles);
    const double dist = (reached.toArray().head<3>() - target.toArray().head<3>()).norm();
    expect(std::abs(dist - from_home.position_error) < 1e-12, model + ": reported position error matches FK");
}

void testUnreachableTarget() {
    LOG_INFO("IKSolverTest", "--- Unreachable target ---");

    const KinematicChain chain = createSO101Chain();
    IKConfig config;
    const IKSolver solver(chain, config);

    EEPose far_away;
    far_away.x = 1.0_m;
    far_away.y = 1.0_m;
    far_away.z = 1.0_m;

    const IKResult result = solver.solve(far_away, JointVector::Zero(5));
    logResult("unreachable", result);

    expect(!result.success && !result.converged, "an unreachable target does not converge");
    expect(result.iterations == config.max_iterations, "the solver stops exactly at max_iterations");
    expect(result.final_joint_angles.size() == 5, "the best guess has one angle per joint");
    expect(result.final_joint_angles.allFinite(), "the best guess is finite");
    expect(chain.isWithinLimits(result.final_joint_angles), "the best guess respects joint limits");
    expect(result.position_error > 1.0, "the reported error reflects the distance to the target");

    IKConfig margin_config;
    margin_config.joint_limit_margin_rad = 0.05;
    margin_config.max_iterations = 20;
    const IKSolver margin_solver(chain, margin_config);
    const IKResult with_margin = margin_solver.solve(far_away, JointVector::Zero(5));
    expect(with_margin.iterations == 20, "a custom iteration cap is honoured");
    const JointVector inner_lower = (chain.getLowerLimits().array() + 0.05).matrix();
    const JointVector inner_upper = (chain.getUpperLimits().array() - 0.05).matrix();
    const bool inside = (with_margin.final_joint_angles.array() >= inner_lower.array() - 1e-12).all() &&
                        (with_margin.final_joint_angles.array() <= inner_upper.array() + 1e-12).all();
    expect(inside, "iterates stay inside the limit margin");
}

void testDampingMonotonicity(const std::string& model) {
    LOG_INFO_F("IKSolverTest", "--- Damping monotonicity (%s) ---", model.c_str());

    const KinematicChain chain = createChainByName(model);
    const JointVector q = makeJoints({0.1, -0.5, 0.6, 0.3, 0.0});
    const EEPose target = chain.forwardKinematics(makeJoints({0.2, -0.4, 0.5, 0.4, 0.1}));

    double previous = std::numeric_limits<double>::infinity();
    bool decreasing = true;
    for (double lambda : {0.01, 0.05, 0.1, 0.5, 1.0}) {
        IKConfig config;
        config.damping = lambda;
        const IKSolver solver(chain, config);
        const double step_norm = solver.computeStep(target, q).norm();
        LOG_INFO_F("IKSolverTest", "  lambda=%.2f  |dq|=%.6f", lambda, step_norm);
        decreasing = decreasing && (step_norm < previous);
        previous = step_norm;
    }
    expect(decreasing, model + ": larger damping gives a smaller step");
}

void testStepScale() {
    LOG_INFO("IKSolverTest", "--- Step scale ---");

    const KinematicChain chain = createSO101Chain();
    const JointVector q = makeJoints({0.15, -0.25, 0.35, 0.15, 0.05});
    const EEPose target = chain.forwardKinematics(makeJoints({0.2, -0.3, 0.4, 0.2, 0.1}));

    IKConfig config;
    config.max_iterations = 1;
    const IKSolver full(chain, config);
    config.step_scale = 0.5;
    const IKSolver half(chain, config);

    const JointVector dq = full.computeStep(target, q);
    const IKResult full_step = full.solve(target, q);
    const IKResult half_step = half.solve(target, q);

    expect(full_step.iterations == 1 && half_step.iterations == 1, "one iteration with max_iterations = 1");
    expect(((full_step.final_joint_angles - q) - dq).cwiseAbs().maxCoeff() < 1e-12,
           "a full step applies computeStep()");
    expect(((half_step.final_joint_angles - q) - 0.5 * dq).cwiseAbs().maxCoeff() < 1e-12,
           "step_scale scales the applied step");
}

void testDeterminismAcrossThreads() {
    LOG_INFO("IKSolverTest", "--- Determinism and shared use ---");

    const KinematicChain chain = createSO101Chain();
    const IKSolver solver(chain);
    const EEPose target = chain.forwardKinematics(makeJoints({0.2, -0.3, 0.4, 0.2, 0.1}));
    const JointVector seed = JointVector::Zero(5);

    const IKResult reference = solver.solve(target, seed);
    const IKResult again = solver.solve(target, seed);
    expect(again.final_joint_angles == reference.final_joint_angles && again.iterations == reference.iterations,
           "identical inputs give identical results");

    constexpr int kThreads = 4;
    std::vector<IKResult> results(kThreads);
    std::vector<std::thread> workers;
    workers.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&solver, &target, &seed, &results, t]() {
            results[static_cast<std::size_t>(t)] = solver.solve(target, seed);
        });
    }
    for (auto& worker : workers) worker.join();

    bool all_equal = true;
    for (const IKResult& r : results) {
        all_equal = all_equal && r.final_joint_angles == reference.final_joint_angles &&
                    r.iterations == reference.iterations;
    }
    expect(all_equal, "concurrent solves on one solver match the serial result");
}

void testInvalidInputs() {
    LOG_INFO("IKSolverTest", "--- Invalid configuration and inputs ---");

    const KinematicChain chain = createKochChain();

    const auto rejects = [&chain](const std::function<void(IKConfig&)>& mutate, const std::string& what) {
        expectConfigurationError([&] {
            IKConfig config;
            mutate(config);
            const IKSolver solver(chain, config);
            (void)solver;
        }, what);
    };
    rejects([](IKConfig& c) { c.damping = 0.0; }, "damping = 0 is rejected");
    rejects([](IKConfig& c) { c.damping = -0.1; }, "negative damping is rejected");
    rejects([](IKConfig& c) { c.max_iterations = 0; }, "max_iterations = 0 is rejected");
    rejects([](IKConfig& c) { c.position_weight = 0.0; }, "position_weight = 0 is rejected");
    rejects([](IKConfig& c) { c.orientation_weight = -1.0; }, "negative orientation_weight is rejected");
    rejects([](IKConfig& c) { c.tolerance = 0.0; }, "tolerance = 0 is rejected");
    rejects([](IKConfig& c) { c.step_scale = 1.5; }, "step_scale above 1 is rejected");
    rejects([](IKConfig& c) { c.step_scale = 0.0; }, "step_scale = 0 is rejected");
    rejects([](IKConfig& c) { c.joint_limit_margin_rad = -0.01; }, "negative joint margin is rejected");

    IKConfig position_only;
    position_only.orientation_weight = 0.0;
    const IKSolver accepted(chain, position_only);
    expect(accepted.getConfig().orientation_weight == 0.0, "orientation_weight = 0 is accepted");

    const IKSolver solver(chain);
    const EEPose target = chain.forwardKinematics(JointVector::Zero(5));
    expectConfigurationError([&] { (void)solver.solve(target, JointVector::Zero(4)); },
                             "a short initial guess is rejected");
    expectConfigurationError([&] { (void)solver.solve(target, JointVector::Zero(6)); },
                             "a long initial guess is rejected");

    JointVector nan_seed = JointVector::Zero(5);
    nan_seed(2) = std::numeric_limits<double>::quiet_NaN();
    expectConfigurationError([&] { (void)solver.solve(target, nan_seed); }, "a NaN initial guess is rejected");

    EEPose bad_target = target;
    bad_target.roll = Radians(std::numeric_limits<double>::infinity());
    expectConfigurationError([&] { (void)solver.solve(bad_target, JointVector::Zero(5)); },
                             "a non-finite target is rejected");
    expectConfigurationError([&] { (void)solver.computeStep(target, JointVector::Zero(3)); },
                             "computeStep checks the joint count");
}

} // namespace

int main([[maybe_unused]] int argc, [[maybe_unused]] char *argv[]) {
    Logger::setLogLevel(LogLevel::Info);

    try {
        for (const std::string& model : availableChainNames()) {
            testRoundTrip(model);
            testNearbyTargets(model);
            testDampingMonotonicity(model);
        }
        testUnreachableTarget();
        testStepScale();
        testDeterminismAcrossThreads();
        testInvalidInputs();
    } catch (const std::exception& e) {
        LOG_CRITICAL_F("IKSolverTest", "Unhandled exception: %s", e.what());
        return 1;
    }

    if (g_failures > 0) {
        LOG_ERROR_F("IKSolverTest", "%d check(s) failed.", g_failures);
        return 1;
    }
    LOG_INFO("IKSolverTest", "All IK solver tests passed.");
    return 0;
}

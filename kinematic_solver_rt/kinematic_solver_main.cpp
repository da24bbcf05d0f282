// kinematic_solver_main.cpp
// Emulates a 100 Hz teleoperation loop: a leader arm streams Cartesian targets,
// the follower solves IK for each one, warm-started from its previous solution.

#include "IKSolver.h"
#include "KinematicChain.h"
#include "RobotChains.h"
#include "DataTypes.h"
#include "Units.h"
#include "Logger.h"

using namespace RKC;
using namespace RKC::literals;

#include <algorithm>
#include <chrono>
#include <cmath>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

JointVector makeJoints(std::initializer_list<double> values) {
    JointVector q(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double v : values) q(i++) = v;
    return q;
}

} // namespace

int main(int argc, char *argv[]) {
    const std::string model = argc > 1 ? argv[1] : "so101";
    Logger::setLogLevel(argc > 2 ? logLevelFromString(argv[2]) : LogLevel::Info);

    LOG_INFO_F("TeleopDemo", "--- 100 Hz teleoperation emulation (%s) ---", model.c_str());

    try {
        const KinematicChain chain = createChainByName(model);
        const IKSolver solver(chain);

        // ==================================================================================
        // The leader moves between two joint configurations; its FK gives the follower's targets.
        // ==================================================================================
        const JointVector leader_start = makeJoints({0.1, -0.5, 0.6, 0.3, 0.0});
        const JointVector leader_end = makeJoints({0.4, -0.2, 0.9, 0.1, 0.3});
        const int num_steps = 30;
        const auto period = std::chrono::milliseconds(10);

        LOG_INFO_F("TeleopDemo", "Leader start (deg): %s", jointVectorToString(leader_start).c_str());
        LOG_INFO_F("TeleopDemo", "Leader end   (deg): %s", jointVectorToString(leader_end).c_str());
        LOG_INFO_F("TeleopDemo", "Start pose: %s", chain.forwardKinematics(leader_start).toDescriptiveString().c_str());
        LOG_INFO_F("TeleopDemo", "End pose:   %s", chain.forwardKinematics(leader_end).toDescriptiveString().c_str());

        JointVector follower = leader_start;
        EEPose target = chain.forwardKinematics(leader_start);
        int max_iterations_seen = 0;
        double worst_solve_us = 0.0;
        auto next_tick = std::chrono::steady_clock::now();

        for (int i = 0; i <= num_steps; ++i) {
            const double alpha = static_cast<double>(i) / num_steps;
            const JointVector leader = leader_start + alpha * (leader_end - leader_start);
            target = chain.forwardKinematics(leader);

            const auto t0 = std::chrono::steady_clock::now();
            const IKResult ik_result = solver.solve(target, follower);
            const auto t1 = std::chrono::steady_clock::now();
            const double solve_us = std::chrono::duration<double, std::micro>(t1 - t0).count();

            if (!ik_result.success) {
                LOG_ERROR_F("TeleopDemo", "IK failed at step %d after %d iterations (pos err %.3e m).",
                            i, ik_result.iterations, ik_result.position_error);
                LOG_ERROR_F("TeleopDemo", "Failed to reach target pose: %s", target.toDescriptiveString().c_str());
                return 1;
            }

            follower = ik_result.final_joint_angles;
            max_iterations_seen = std::max(max_iterations_seen, ik_result.iterations);
            worst_solve_us = std::max(worst_solve_us, solve_us);

            const EEPose actual = chain.forwardKinematics(follower);
            const std::vector<Degrees> joints_deg = jointVectorToDegrees(follower);

            std::cout << std::fixed << std::setprecision(3)
                      << "Step=" << std::setw(2) << i << " | "
                      << "Iter=" << std::setw(3) << ik_result.iterations << " | "
                      << "t=" << std::setw(8) << solve_us << "us | "
                      << "X(des|act)=" << std::setw(8) << target.x.toMillimeters().value() << "|" << std::setw(8) << actual.x.toMillimeters().value() << " | "
                      << "Y=" << std::setw(8) << target.y.toMillimeters().value() << "|" << std::setw(8) << actual.y.toMillimeters().value() << " | "
                      << "Z=" << std::setw(8) << target.z.toMillimeters().value() << "|" << std::setw(8) << actual.z.toMillimeters().value() << " |";
            for (std::size_t j = 0; j < joints_deg.size(); ++j) {
                std::cout << " J" << (j + 1) << "=" << std::setw(7) << std::setprecision(2) << joints_deg[j].value();
            }
            std::cout << std::endl;

            next_tick += period;
            std::this_thread::sleep_until(next_tick);
        }

        LOG_INFO_F("TeleopDemo", "Tracking finished: max %d iterations, worst solve %.1f us (budget %lld us).",
                   max_iterations_seen, worst_solve_us, static_cast<long long>(std::chrono::microseconds(period).count()));

        const EEPose final_actual = chain.forwardKinematics(follower);
        const Meters dx = (final_actual.x - target.x).abs();
        const Meters dy = (final_actual.y - target.y).abs();
        const Meters dz = (final_actual.z - target.z).abs();
        const Meters final_error = Meters(std::sqrt(dx.value() * dx.value() + dy.value() * dy.value() + dz.value() * dz.value()));

        LOG_INFO_F("TeleopDemo", "Final Target Pose: %s", target.toDescriptiveString().c_str());
        LOG_INFO_F("TeleopDemo", "Final Actual Pose: %s", final_actual.toDescriptiveString().c_str());
        LOG_INFO_F("TeleopDemo", "Total positional error: %s", final_error.toMillimeters().toString(6).c_str());

        if (final_error > 0.001_m) {
            LOG_ERROR("TeleopDemo", "FAILURE: Final position error is above 1 mm.");
            return 1;
        }
        if (worst_solve_us > static_cast<double>(std::chrono::microseconds(period).count())) {
            LOG_WARN("TeleopDemo", "A solve exceeded the control period on this machine.");
        }
    } catch (const std::exception& e) {
        LOG_CRITICAL_F("TeleopDemo", "A critical setup exception occurred: %s", e.what());
        return 1;
    }

    LOG_INFO("TeleopDemo", "Teleoperation emulation completed successfully.");
    return 0;
}

// IKSolver.h
#ifndef RKC_IKSOLVER_H
#define RKC_IKSOLVER_H

#pragma once

#include "KinematicChain.h"
#include "DataTypes.h"
#include "SolverConfig.h"

#include <string>

namespace RKC {

/**
 * @struct IKResult
 * @brief Outcome of one IKSolver::solve() call.
 *
 * A non-converged result is not an error: final_joint_angles then holds the
 * best configuration found, always inside the joint limits.
 */
struct IKResult {
    bool success = false;
    JointVector final_joint_angles;
    int iterations = 0;
    double position_error = 0.0;    ///< ||target - reached|| over x, y, z (meters)
    double orientation_error = 0.0; ///< ||target - reached|| over pitch, roll (radians)
    bool converged = false;
};

/**
 * @brief Damped least-squares (Levenberg-Marquardt style) IK for a KinematicChain.
 *
 * Every iteration solves the 5x5 system
 *     (J_w * J_w^T + lambda^2 * I) * y = e_w,    dq = J_w^T * y
 * with J_w and e_w the Jacobian and task error weighted per component, then
 * steps and re-clamps to the joint limits. The damping keeps the system
 * positive definite at singular configurations.
 *
 * The solver keeps a reference to the chain, which must outlive it. All
 * members are fixed at construction; solve() does no I/O and may be called
 * from several threads at once.
 */
class IKSolver {
public:
    /**
     * @throws ConfigurationError if any IKConfig field is out of range.
     */
    explicit IKSolver(const KinematicChain& chain, const IKConfig& config = IKConfig{});
    IKSolver(KinematicChain&&, const IKConfig& = IKConfig{}) = delete;

    [[nodiscard]] const IKConfig& getConfig() const { return config_; }
    [[nodiscard]] const KinematicChain& getChain() const { return chain_; }

    /**
     * @brief Iterates from @p initial_joint_angles towards @p target.
     *
     * Terminates after at most config.max_iterations steps.
     * @throws ConfigurationError if the initial guess has the wrong length or
     *         either input holds a non-finite value.
     */
    [[nodiscard]] IKResult solve(const EEPose& target, const JointVector& initial_joint_angles) const;

    /// The DLS step dq the solver would take from @p q, before step scaling and clamping.
    [[nodiscard]] JointVector computeStep(const EEPose& target, const JointVector& q) const;

private:
    struct TaskError {
        PoseVector raw;
        PoseVector weighted;
    };

    void checkInputs(const EEPose& target, const JointVector& q, const char* operation) const;
    [[nodiscard]] TaskError computeError(const PoseVector& target, const JointVector& q) const;
    [[nodiscard]] JointVector dampedStep(const TaskError& error, const JointVector& q) const;
    [[nodiscard]] static IKResult makeResult(bool converged, const JointVector& q, int iterations, const PoseVector& raw_error);

    const KinematicChain& chain_;
    IKConfig config_;
    PoseVector weights_;

    static inline const std::string MODULE_NAME = "IKSolver";
};

} // namespace RKC
#endif // RKC_IKSOLVER_H

// SolverConfig.h
#ifndef RKC_SOLVER_CONFIG_H
#define RKC_SOLVER_CONFIG_H

#pragma once

namespace RKC {

/**
 * @struct IKConfig
 * @brief Tuning parameters for the damped least-squares IK solver.
 *        A plain value: build it once and hand it to every IKSolver that needs it.
 */
struct IKConfig {
    /// Damping factor lambda. Larger values are more stable near singularities but converge slower.
    double damping = 0.01;
    /// Hard cap on solver iterations; bounds the worst-case solve time.
    int max_iterations = 100;
    /// Weight applied to the x, y, z error components (and Jacobian rows).
    double position_weight = 1.0;
    /// Weight applied to the pitch, roll error components (and Jacobian rows).
    double orientation_weight = 0.1;
    /// Convergence threshold on the weighted task-space error norm.
    double tolerance = 1e-4;
    /// Fraction of the DLS step applied each iteration, in (0, 1].
    double step_scale = 1.0;
    /// Iterates are kept this far inside the joint limits (radians).
    double joint_limit_margin_rad = 0.0;
};

} // namespace RKC
#endif // RKC_SOLVER_CONFIG_H

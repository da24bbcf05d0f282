// IKSolver.cpp
#include "IKSolver.h"
#include "KinematicErrors.h"
#include "Logger.h"

#include <Eigen/Cholesky>

#include <cmath>
#include <limits>

namespace RKC {

namespace {

[[nodiscard]] bool isFiniteValue(double v) { return std::isfinite(v); }

void requireConfig(bool condition, const char* field, const std::string& module) {
    if (!condition) {
        LOG_ERROR_F(module, "Invalid IKConfig: %s.", field);
        throw ConfigurationError(std::string("IKConfig: ") + field);
    }
}

} // namespace

IKSolver::IKSolver(const KinematicChain& chain, const IKConfig& config)
    : chain_(chain),
      config_(config) {

    requireConfig(isFiniteValue(config_.damping) && config_.damping > 0.0, "damping must be > 0", MODULE_NAME);
    requireConfig(config_.max_iterations > 0, "max_iterations must be > 0", MODULE_NAME);
    requireConfig(isFiniteValue(config_.position_weight) && config_.position_weight > 0.0,
                  "position_weight must be > 0", MODULE_NAME);
    requireConfig(isFiniteValue(config_.orientation_weight) && config_.orientation_weight >= 0.0,
                  "orientation_weight must be >= 0", MODULE_NAME);
    requireConfig(isFiniteValue(config_.tolerance) && config_.tolerance > 0.0, "tolerance must be > 0", MODULE_NAME);
    requireConfig(config_.step_scale > 0.0 && config_.step_scale <= 1.0, "step_scale must be in (0, 1]", MODULE_NAME);
    requireConfig(isFiniteValue(config_.joint_limit_margin_rad) && config_.joint_limit_margin_rad >= 0.0,
                  "joint_limit_margin_rad must be >= 0", MODULE_NAME);

    const double pw = config_.position_weight;
    const double ow = config_.orientation_weight;
    weights_ << pw, pw, pw, ow, ow;

    LOG_INFO_F(MODULE_NAME, "DLS solver ready: %u joints, lambda=%.4g, max_iter=%d, tol=%.3g, w_pos=%.3g, w_ori=%.3g.",
               chain_.getNrOfJoints(), config_.damping, config_.max_iterations, config_.tolerance, pw, ow);
}

void IKSolver::checkInputs(const EEPose& target, const JointVector& q, const char* operation) const {
    if (q.size() != static_cast<Eigen::Index>(chain_.getNrOfJoints())) {
        throw ConfigurationError(std::string("IKSolver::") + operation + ": expected " +
                                 std::to_string(chain_.getNrOfJoints()) + " joint angles, got " +
                                 std::to_string(q.size()));
    }
    if (!q.allFinite()) {
        throw ConfigurationError(std::string("IKSolver::") + operation + ": joint angles must be finite.");
    }
    if (!target.toArray().allFinite()) {
        throw ConfigurationError(std::string("IKSolver::") + operation + ": target pose must be finite.");
    }
}

IKSolver::TaskError IKSolver::computeError(const PoseVector& target, const JointVector& q) const {
    TaskError error;
    error.raw = target - chain_.forwardKinematics(q).toArray();
    error.raw(static_cast<Eigen::Index>(PoseIndex::Pitch)) = wrapToPi(error.raw(static_cast<Eigen::Index>(PoseIndex::Pitch)));
    error.raw(static_cast<Eigen::Index>(PoseIndex::Roll)) = wrapToPi(error.raw(static_cast<Eigen::Index>(PoseIndex::Roll)));
    error.weighted = weights_.cwiseProduct(error.raw);
    return error;
}

JointVector IKSolver::dampedStep(const TaskError& error, const JointVector& q) const {
    const TaskJacobian J_w = weights_.asDiagonal() * chain_.jacobian(q);

    TaskMatrix A = J_w * J_w.transpose();
    A.diagonal().array() += config_.damping * config_.damping;

    const PoseVector y = A.ldlt().solve(error.weighted);
    return J_w.transpose() * y;
}

IKResult IKSolver::makeResult(bool converged, const JointVector& q, int iterations, const PoseVector& raw_error) {
    IKResult result;
    result.success = converged;
    result.converged = converged;
    result.final_joint_angles = q;
    result.iterations = iterations;
    result.position_error = raw_error.head<3>().norm();
    result.orientation_error = raw_error.tail<2>().norm();
    return result;
}

JointVector IKSolver::computeStep(const EEPose& target, const JointVector& q) const {
    checkInputs(target, q, "computeStep");
    return dampedStep(computeError(target.toArray(), q), q);
}

IKResult IKSolver::solve(const EEPose& target, const JointVector& initial_joint_angles) const {
    checkInputs(target, initial_joint_angles, "solve");

    const PoseVector target_array = target.toArray();
    JointVector q = initial_joint_angles;
    int iterations = 0;

    JointVector best_q = q;
    PoseVector best_raw_error = PoseVector::Zero();
    double best_norm = std::numeric_limits<double>::infinity();

    while (true) {
        const TaskError error = computeError(target_array, q);
        const double weighted_norm = error.weighted.norm();

        // The unclamped initial guess only counts as a fallback if it is inside the limits.
        const bool admissible = iterations > 0 || chain_.isWithinLimits(q);
        if (admissible && weighted_norm < best_norm) {
            best_norm = weighted_norm;
            best_q = q;
            best_raw_error = error.raw;
        }

        if (weighted_norm < config_.tolerance) {
            return makeResult(true, q, iterations, error.raw);
        }
        if (iterations >= config_.max_iterations) {
            return makeResult(false, best_q, iterations, best_raw_error);
        }

        const JointVector dq = dampedStep(error, q);
        q = chain_.clampToLimits(q + config_.step_scale * dq, config_.joint_limit_margin_rad);
        ++iterations;
    }
}

} // namespace RKC

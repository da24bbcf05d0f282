// KinematicChain.h
#ifndef RKC_KINEMATICCHAIN_H
#define RKC_KINEMATICCHAIN_H

#pragma once

#include "RevoluteJoint.h"
#include "DataTypes.h"

#include <kdl/chain.hpp>
#include <kdl/frames.hpp>

#include <Eigen/Core>

#include <string>
#include <vector>

namespace RKC {

/**
 * @brief Serial chain of revolute joints followed by a fixed end-effector offset.
 *
 * Forward kinematics composes, base to tip,
 *     T = Trans(offset_1) * Rot(axis_1, q_1) * ... * Trans(offset_n) * Rot(axis_n, q_n) * Trans(ee_offset)
 *
 * The chain is immutable after construction and every method is a pure
 * function of its arguments, so one instance can be shared between threads.
 * No method logs; errors are reported by exceptions only.
 */
class KinematicChain {
public:
    /// Central-difference step used by jacobian() when none is given (radians).
    static constexpr double DEFAULT_JACOBIAN_DELTA = 1e-6;

    /**
     * @param joints     Joints in base-to-tip order. Must not be empty.
     * @param ee_offset  Translation from the last joint frame to the end-effector.
     * @throws ConfigurationError if @p joints is empty or @p ee_offset is not finite.
     */
    explicit KinematicChain(std::vector<RevoluteJoint> joints,
                            const KDL::Vector& ee_offset = KDL::Vector::Zero());

    [[nodiscard]] unsigned int getNrOfJoints() const { return static_cast<unsigned int>(joints_.size()); }
    [[nodiscard]] std::vector<std::string> getJointNames() const;
    [[nodiscard]] const JointVector& getLowerLimits() const { return lower_limits_; }
    [[nodiscard]] const JointVector& getUpperLimits() const { return upper_limits_; }
    [[nodiscard]] const std::vector<RevoluteJoint>& getJoints() const { return joints_; }
    [[nodiscard]] const KDL::Vector& getEndEffectorOffset() const { return ee_offset_; }
    [[nodiscard]] const KDL::Chain& getKdlChain() const { return kdl_chain_; }

    /**
     * @brief 4x4 homogeneous transform from the base frame to the end-effector frame.
     * @throws ConfigurationError if q.size() != getNrOfJoints().
     */
    [[nodiscard]] Eigen::Matrix4d forwardKinematicsMatrix(const JointVector& q) const;

    /**
     * @brief End-effector pose [x, y, z, pitch, roll]; yaw is dropped.
     *
     * Angles follow KDL's roll-pitch-yaw decomposition R = Rz(yaw) * Ry(pitch) * Rx(roll):
     *     pitch = atan2(-R20, sqrt(R00^2 + R10^2)),  roll = atan2(R21, R22)
     * At the pitch = +-pi/2 gimbal lock roll is reported as 0.
     * @throws ConfigurationError if q.size() != getNrOfJoints().
     */
    [[nodiscard]] EEPose forwardKinematics(const JointVector& q) const;

    /**
     * @brief Numerical 5 x n Jacobian of forwardKinematics() by central differences.
     *
     * Column j is (pose(q + delta*e_j) - pose(q - delta*e_j)) / (2*delta); the pitch
     * and roll differences are wrapped to [-pi, pi] first. Costs 2n FK evaluations.
     * @throws ConfigurationError on a size mismatch or a non-positive @p delta.
     */
    [[nodiscard]] TaskJacobian jacobian(const JointVector& q, double delta = DEFAULT_JACOBIAN_DELTA) const;

    /// Element-wise clip into [lower_i, upper_i]. Idempotent.
    [[nodiscard]] JointVector clampToLimits(const JointVector& q) const;

    /// Clip into [lower_i + margin, upper_i - margin]; a range narrower than 2*margin collapses to its midpoint.
    [[nodiscard]] JointVector clampToLimits(const JointVector& q, double margin_rad) const;

    [[nodiscard]] bool isWithinLimits(const JointVector& q) const;

private:
    void checkJointCount(const JointVector& q, const char* operation) const;
    [[nodiscard]] KDL::Frame computeFrame(const JointVector& q) const;
    [[nodiscard]] static EEPose poseFromFrame(const KDL::Frame& frame);

    std::vector<RevoluteJoint> joints_;
    KDL::Vector ee_offset_;
    KDL::Chain kdl_chain_;
    JointVector lower_limits_;
    JointVector upper_limits_;

    static inline const std::string MODULE_NAME = "KinematicChain";
};

} // namespace RKC
#endif // RKC_KINEMATICCHAIN_H

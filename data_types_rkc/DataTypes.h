// DataTypes.h
#ifndef RKC_DATATYPES_H
#define RKC_DATATYPES_H

#pragma once

#include "Units.h"

#include <Eigen/Core>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @file DataTypes.h
 * @brief Core value types shared by the kinematic chain and the IK solver.
 *        Joint vectors and Jacobians are plain Eigen objects in radians / meters;
 *        strong unit types from Units.h are used where values face a human.
 */
namespace RKC {

using namespace RKC::literals;

//--------------------------------------------------------------------------
// SECTION: Vector and matrix aliases
//--------------------------------------------------------------------------
/// Dimension of the task space: x, y, z, pitch, roll.
constexpr std::size_t POSE_DIM = 5;

enum class PoseIndex : std::size_t { X = 0, Y, Z, Pitch, Roll };

/// Joint angles in radians, one entry per joint of a chain.
using JointVector = Eigen::VectorXd;

/// Task-space vector laid out as [x, y, z, pitch, roll].
using PoseVector = Eigen::Matrix<double, 5, 1>;

/// 5 x n_joints task Jacobian.
using TaskJacobian = Eigen::Matrix<double, 5, Eigen::Dynamic>;

/// 5 x 5 task-space square matrix.
using TaskMatrix = Eigen::Matrix<double, 5, 5>;

//--------------------------------------------------------------------------
// SECTION: Joint description helpers
//--------------------------------------------------------------------------
enum class JointAxis : uint8_t { X, Y, Z };

[[nodiscard]] std::string to_string(JointAxis axis);

//--------------------------------------------------------------------------
// SECTION: End-effector pose
//--------------------------------------------------------------------------
/**
 * @struct EEPose
 * @brief 5-DOF end-effector pose. Yaw is not part of the task space.
 *
 * pitch is the rotation about Y and roll the rotation about X in the
 * roll-pitch-yaw convention R = Rz(yaw) * Ry(pitch) * Rx(roll).
 */
struct EEPose {
    Meters x = 0.0_m;   Meters y = 0.0_m;   Meters z = 0.0_m;
    Radians pitch = 0.0_rad; Radians roll = 0.0_rad;

    /// Returns [x, y, z, pitch, roll] as raw SI values.
    [[nodiscard]] PoseVector toArray() const;

    /**
     * @brief Rebuilds a pose from [x, y, z, pitch, roll].
     * @throws ShapeError if @p values does not hold exactly POSE_DIM elements.
     */
    [[nodiscard]] static EEPose fromArray(const Eigen::VectorXd& values);

    [[nodiscard]] std::string toDescriptiveString() const;

    [[nodiscard]] bool operator==(const EEPose& other) const;
    [[nodiscard]] bool operator!=(const EEPose& other) const;
};

//--------------------------------------------------------------------------
// SECTION: Joint vector helpers (boundary with the motor dispatcher)
//--------------------------------------------------------------------------
[[nodiscard]] std::vector<Degrees> jointVectorToDegrees(const JointVector& joints_rad);
[[nodiscard]] JointVector jointVectorFromDegrees(const std::vector<Degrees>& joints_deg);

/// "[  10.0,  -5.3, ... ] deg"
[[nodiscard]] std::string jointVectorToString(const JointVector& joints_rad, int precision_deg = 1);

} // namespace RKC
#endif // RKC_DATATYPES_H

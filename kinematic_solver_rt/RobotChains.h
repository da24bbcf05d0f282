// RobotChains.h
#ifndef RKC_ROBOTCHAINS_H
#define RKC_ROBOTCHAINS_H

#pragma once

#include "KinematicChain.h"

#include <string>
#include <vector>

namespace RKC {

/**
 * @brief Creates the kinematic chain of the SO-101 arm (5 DOF, gripper excluded).
 *
 * Offsets and limits are taken from the SO-101 URDF (so101_new_calib).
 * shoulder_pan and wrist_roll rotate about Y; shoulder_lift, elbow_flex and
 * wrist_flex rotate about X.
 */
[[nodiscard]] KinematicChain createSO101Chain();

/**
 * @brief Creates the kinematic chain of the Koch v1.1 arm (5 DOF, gripper excluded).
 *
 * Koch has no official URDF; link lengths, axes and limits are estimates from
 * CAD drawings and still have to be checked against the physical robot.
 */
[[nodiscard]] KinematicChain createKochChain();

/**
 * @brief Looks a robot model up by name ("so101", "koch"; case-insensitive).
 * @throws ConfigurationError for an unknown model name.
 */
[[nodiscard]] KinematicChain createChainByName(const std::string& model_name);

[[nodiscard]] std::vector<std::string> availableChainNames();

} // namespace RKC
#endif // RKC_ROBOTCHAINS_H

// KinematicChain.cpp
#include "KinematicChain.h"
#include "KinematicErrors.h"
#include "Logger.h"

#include <kdl/joint.hpp>
#include <kdl/segment.hpp>

#include <algorithm>
#include <cmath>
#include <utility>

namespace RKC {

KinematicChain::KinematicChain(std::vector<RevoluteJoint> joints, const KDL::Vector& ee_offset)
    : joints_(std::move(joints)),
      ee_offset_(ee_offset) {

    if (joints_.empty()) {
        LOG_ERROR(MODULE_NAME, "Cannot build a kinematic chain without joints.");
        throw ConfigurationError("KinematicChain: at least one joint is required.");
    }
    if (!std::isfinite(ee_offset_.x()) || !std::isfinite(ee_offset_.y()) || !std::isfinite(ee_offset_.z())) {
        LOG_ERROR(MODULE_NAME, "End-effector offset has a non-finite component.");
        throw ConfigurationError("KinematicChain: end-effector offset must be finite.");
    }

    const auto n = static_cast<Eigen::Index>(joints_.size());
    lower_limits_.resize(n);
    upper_limits_.resize(n);

    // Each joint becomes two KDL segments: a fixed one carrying the parent offset,
    // then a moving one whose tip coincides with the rotated joint frame.
    for (Eigen::Index i = 0; i < n; ++i) {
        const RevoluteJoint& joint = joints_[static_cast<std::size_t>(i)];
        kdl_chain_.addSegment(KDL::Segment(joint.getName() + "_origin",
                                           KDL::Joint(KDL::Joint::None),
                                           KDL::Frame(joint.getOffset())));
        kdl_chain_.addSegment(KDL::Segment(joint.getName(), joint.toKdlJoint(), KDL::Frame::Identity()));

        lower_limits_(i) = joint.getLowerLimit().value();
        upper_limits_(i) = joint.getUpperLimit().value();
    }
    kdl_chain_.addSegment(KDL::Segment("ee_tip", KDL::Joint(KDL::Joint::None), KDL::Frame(ee_offset_)));

    LOG_DEBUG_F(MODULE_NAME, "Chain built: %u joints, %u KDL segments.",
                kdl_chain_.getNrOfJoints(), kdl_chain_.getNrOfSegments());
}

std::vector<std::string> KinematicChain::getJointNames() const {
    std::vector<std::string> names;
    names.reserve(joints_.size());
    for (const auto& joint : joints_) names.push_back(joint.getName());
    return names;
}

void KinematicChain::checkJointCount(const JointVector& q, const char* operation) const {
    if (q.size() != static_cast<Eigen::Index>(joints_.size())) {
        throw ConfigurationError(std::string("KinematicChain::") + operation + ": expected " +
                                 std::to_string(joints_.size()) + " joint angles, got " +
                                 std::to_string(q.size()));
    }
}

KDL::Frame KinematicChain::computeFrame(const JointVector& q) const {
    KDL::Frame frame = KDL::Frame::Identity();
    Eigen::Index q_idx = 0;
    for (unsigned int i = 0; i < kdl_chain_.getNrOfSegments(); ++i) {
        const KDL::Segment& segment = kdl_chain_.getSegment(i);
        const double value = (segment.getJoint().getType() != KDL::Joint::None) ? q(q_idx++) : 0.0;
        frame = frame * segment.pose(value);
    }
    return frame;
}

EEPose KinematicChain::poseFromFrame(const KDL::Frame& frame) {
    double roll = 0.0, pitch = 0.0, yaw = 0.0;
    frame.M.GetRPY(roll, pitch, yaw);

    EEPose pose;
    pose.x = Meters(frame.p.x());
    pose.y = Meters(frame.p.y());
    pose.z = Meters(frame.p.z());
    pose.pitch = Radians(pitch);
    pose.roll = Radians(roll);
    return pose;
}

Eigen::Matrix4d KinematicChain::forwardKinematicsMatrix(const JointVector& q) const {
    checkJointCount(q, "forwardKinematicsMatrix");
    const KDL::Frame frame = computeFrame(q);

    Eigen::Matrix4d T = Eigen::Matrix4d::Identity();
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            T(r, c) = frame.M(r, c);
        }
        T(r, 3) = frame.p(r);
    }
    return T;
}

EEPose KinematicChain::forwardKinematics(const JointVector& q) const {
    checkJointCount(q, "forwardKinematics");
    return poseFromFrame(computeFrame(q));
}

TaskJacobian KinematicChain::jacobian(const JointVector& q, double delta) const {
    checkJointCount(q, "jacobian");
    if (!(delta > 0.0) || !std::isfinite(delta)) {
        throw ConfigurationError("KinematicChain::jacobian: delta must be a positive finite step.");
    }

    const Eigen::Index n = q.size();
    TaskJacobian J(static_cast<Eigen::Index>(POSE_DIM), n);

    JointVector q_plus = q;
    JointVector q_minus = q;
    for (Eigen::Index j = 0; j < n; ++j) {
        q_plus(j) = q(j) + delta;
        q_minus(j) = q(j) - delta;

        PoseVector diff = poseFromFrame(computeFrame(q_plus)).toArray() -
                          poseFromFrame(computeFrame(q_minus)).toArray();
        diff(static_cast<Eigen::Index>(PoseIndex::Pitch)) = wrapToPi(diff(static_cast<Eigen::Index>(PoseIndex::Pitch)));
        diff(static_cast<Eigen::Index>(PoseIndex::Roll)) = wrapToPi(diff(static_cast<Eigen::Index>(PoseIndex::Roll)));
        J.col(j) = diff / (2.0 * delta);

        q_plus(j) = q(j);
        q_minus(j) = q(j);
    }
    return J;
}

JointVector KinematicChain::clampToLimits(const JointVector& q) const {
    checkJointCount(q, "clampToLimits");
    return q.cwiseMax(lower_limits_).cwiseMin(upper_limits_);
}

JointVector KinematicChain::clampToLimits(const JointVector& q, double margin_rad) const {
    checkJointCount(q, "clampToLimits");
    JointVector clamped(q.size());
    for (Eigen::Index i = 0; i < q.size(); ++i) {
        double lower = lower_limits_(i) + margin_rad;
        double upper = upper_limits_(i) - margin_rad;
        if (lower > upper) {
            lower = upper = 0.5 * (lower_limits_(i) + upper_limits_(i));
        }
        clamped(i) = std::clamp(q(i), lower, upper);
    }
    return clamped;
}

bool KinematicChain::isWithinLimits(const JointVector& q) const {
    checkJointCount(q, "isWithinLimits");
    return (q.array() >= lower_limits_.array()).all() && (q.array() <= upper_limits_.array()).all();
}

} // namespace RKC

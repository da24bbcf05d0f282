// RevoluteJoint.cpp
#include "RevoluteJoint.h"
#include "KinematicErrors.h"
#include "Logger.h"

#include <cmath>
#include <utility>

namespace RKC {

RevoluteJoint::RevoluteJoint(std::string name, JointAxis axis, const KDL::Vector& offset,
                             Radians lower_limit, Radians upper_limit)
    : name_(std::move(name)),
      axis_(axis),
      offset_(offset),
      lower_limit_(lower_limit),
      upper_limit_(upper_limit) {

    if (!std::isfinite(lower_limit_.value()) || !std::isfinite(upper_limit_.value())) {
        LOG_ERROR_F(MODULE_NAME, "Joint '%s' has a non-finite limit.", name_.c_str());
        throw ConfigurationError("RevoluteJoint '" + name_ + "': joint limits must be finite.");
    }
    if (!std::isfinite(offset_.x()) || !std::isfinite(offset_.y()) || !std::isfinite(offset_.z())) {
        LOG_ERROR_F(MODULE_NAME, "Joint '%s' has a non-finite offset.", name_.c_str());
        throw ConfigurationError("RevoluteJoint '" + name_ + "': offset must be finite.");
    }
    // Raw comparison: Radians::operator> is epsilon tolerant.
    if (lower_limit_.value() > upper_limit_.value()) {
        LOG_ERROR_F(MODULE_NAME, "Joint '%s': lower limit %s exceeds upper limit %s.",
                    name_.c_str(), lower_limit_.toString().c_str(), upper_limit_.toString().c_str());
        throw ConfigurationError("RevoluteJoint '" + name_ + "': lower limit exceeds upper limit.");
    }
}

KDL::Joint RevoluteJoint::toKdlJoint() const {
    switch (axis_) {
        case JointAxis::X: return KDL::Joint(name_, KDL::Joint::RotX);
        case JointAxis::Y: return KDL::Joint(name_, KDL::Joint::RotY);
        case JointAxis::Z: return KDL::Joint(name_, KDL::Joint::RotZ);
    }
    throw ConfigurationError("RevoluteJoint '" + name_ + "': invalid axis.");
}

} // namespace RKC

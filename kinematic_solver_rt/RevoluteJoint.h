// RevoluteJoint.h
#ifndef RKC_REVOLUTEJOINT_H
#define RKC_REVOLUTEJOINT_H

#pragma once

#include "DataTypes.h"
#include "Units.h"

#include <kdl/frames.hpp>
#include <kdl/joint.hpp>

#include <string>

namespace RKC {

/**
 * @brief One revolute joint of a serial chain.
 *
 * The joint frame is reached from the parent frame by a pure translation
 * (@c offset, meters), then rotated by the joint angle about @c axis.
 * Immutable once constructed.
 */
class RevoluteJoint {
public:
    /**
     * @throws ConfigurationError if @p lower_limit is greater than @p upper_limit,
     *         or a limit or an offset component is not a finite number.
     */
    RevoluteJoint(std::string name, JointAxis axis, const KDL::Vector& offset,
                  Radians lower_limit, Radians upper_limit);

    [[nodiscard]] const std::string& getName() const { return name_; }
    [[nodiscard]] JointAxis getAxis() const { return axis_; }
    [[nodiscard]] const KDL::Vector& getOffset() const { return offset_; }
    [[nodiscard]] Radians getLowerLimit() const { return lower_limit_; }
    [[nodiscard]] Radians getUpperLimit() const { return upper_limit_; }

    /// KDL joint rotating about this joint's axis.
    [[nodiscard]] KDL::Joint toKdlJoint() const;

private:
    std::string name_;
    JointAxis axis_;
    KDL::Vector offset_;
    Radians lower_limit_;
    Radians upper_limit_;

    static inline const std::string MODULE_NAME = "RevoluteJoint";
};

} // namespace RKC
#endif // RKC_REVOLUTEJOINT_H

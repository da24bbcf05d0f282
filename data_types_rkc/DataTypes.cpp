// DataTypes.cpp
#include "DataTypes.h"
#include "KinematicErrors.h"

#include <sstream>
#include <iomanip>

namespace RKC {

//--------------------------------------------------------------------------
// SECTION: JointAxis
//--------------------------------------------------------------------------
std::string to_string(JointAxis axis) {
    switch (axis) {
        case JointAxis::X: return "X";
        case JointAxis::Y: return "Y";
        case JointAxis::Z: return "Z";
    }
    throw std::invalid_argument("Invalid JointAxis value: " + std::to_string(static_cast<int>(axis)));
}

//--------------------------------------------------------------------------
// SECTION: EEPose
//--------------------------------------------------------------------------
PoseVector EEPose::toArray() const {
    PoseVector values;
    values << x.value(), y.value(), z.value(), pitch.value(), roll.value();
    return values;
}

EEPose EEPose::fromArray(const Eigen::VectorXd& values) {
    if (static_cast<std::size_t>(values.size()) != POSE_DIM) {
        throw ShapeError("EEPose::fromArray: expected " + std::to_string(POSE_DIM) +
                         " elements, got " + std::to_string(values.size()));
    }
    EEPose pose;
    pose.x = Meters(values(0));
    pose.y = Meters(values(1));
    pose.z = Meters(values(2));
    pose.pitch = Radians(values(3));
    pose.roll = Radians(values(4));
    return pose;
}

std::string EEPose::toDescriptiveString() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "X: " << x.toMillimeters().value() << " mm, "
        << "Y: " << y.toMillimeters().value() << " mm, "
        << "Z: " << z.toMillimeters().value() << " mm, "
        << "Pitch: " << pitch.toDegrees().value() << " deg, "
        << "Roll: " << roll.toDegrees().value() << " deg";
    return oss.str();
}

bool EEPose::operator==(const EEPose& other) const {
    return x == other.x && y == other.y && z == other.z &&
           pitch == other.pitch && roll == other.roll;
}
bool EEPose::operator!=(const EEPose& other) const { return !(*this == other); }

//--------------------------------------------------------------------------
// SECTION: Joint vector helpers
//--------------------------------------------------------------------------
std::vector<Degrees> jointVectorToDegrees(const JointVector& joints_rad) {
    std::vector<Degrees> result;
    result.reserve(static_cast<std::size_t>(joints_rad.size()));
    for (Eigen::Index i = 0; i < joints_rad.size(); ++i) {
        result.push_back(Radians(joints_rad(i)).toDegrees());
    }
    return result;
}

JointVector jointVectorFromDegrees(const std::vector<Degrees>& joints_deg) {
    JointVector result(static_cast<Eigen::Index>(joints_deg.size()));
    for (std::size_t i = 0; i < joints_deg.size(); ++i) {
        result(static_cast<Eigen::Index>(i)) = joints_deg[i].toRadians().value();
    }
    return result;
}

std::string jointVectorToString(const JointVector& joints_rad, int precision_deg) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision_deg) << "[";
    for (Eigen::Index i = 0; i < joints_rad.size(); ++i) {
        if (i > 0) oss << ",";
        oss << std::setw(7) << Radians(joints_rad(i)).toDegrees().value();
    }
    oss << " ] deg";
    return oss.str();
}

} // namespace RKC

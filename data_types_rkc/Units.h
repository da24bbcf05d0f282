// Units.h
#ifndef RKC_UNITS_H
#define RKC_UNITS_H

#pragma once

#include <cmath>
#include <ostream>
#include <string>
#include <sstream>
#include <iomanip>

namespace RKC {

namespace UnitConstants {
    constexpr double PI = 3.1415926535897932384626433832795;
    constexpr double TWO_PI = 2.0 * PI;
    constexpr double DEFAULT_EPSILON = 1e-9;
} // namespace UnitConstants

class Degrees;
class Millimeters;

template<typename T>
[[nodiscard]] inline std::string value_to_string_with_suffix(T value, int precision, const char* suffix) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value << suffix;
    return oss.str();
}

/// Wraps a raw angle in radians into [-pi, pi).
[[nodiscard]] inline double wrapToPi(double angle_rad) {
    double val = std::fmod(angle_rad + UnitConstants::PI, UnitConstants::TWO_PI);
    if (val < 0) val += UnitConstants::TWO_PI;
    return val - UnitConstants::PI;
}

//======================================================================================
// Angle Units
//======================================================================================
class Radians {
public:
    constexpr explicit Radians(double val = 0.0) : value_(val) {}
    [[nodiscard]] constexpr double value() const { return value_; }

    Radians& operator+=(Radians other) { value_ += other.value_; return *this; }
    Radians& operator-=(Radians other) { value_ -= other.value_; return *this; }
    [[nodiscard]] constexpr Radians operator-() const { return Radians(-value_); }
    [[nodiscard]] Radians abs() const { return Radians(std::abs(value_)); }

    // Comparisons are tolerant to DEFAULT_EPSILON.
    [[nodiscard]] bool operator==(Radians other) const { return std::abs(value_ - other.value_) < UnitConstants::DEFAULT_EPSILON; }
    [[nodiscard]] bool operator!=(Radians other) const { return !(*this == other); }
    [[nodiscard]] bool operator<(Radians other) const { return value_ < other.value_ && !(*this == other); }
    [[nodiscard]] bool operator<=(Radians other) const { return value_ <= other.value_ || (*this == other); }
    [[nodiscard]] bool operator>(Radians other) const { return value_ > other.value_ && !(*this == other); }
    [[nodiscard]] bool operator>=(Radians other) const { return value_ >= other.value_ || (*this == other); }

    [[nodiscard]] Degrees toDegrees() const;
    [[nodiscard]] Radians normalized() const { return Radians(wrapToPi(value_)); }
    [[nodiscard]] std::string toString(int precision = 4) const { return value_to_string_with_suffix(value_, precision, " rad"); }
private:
    double value_;
};
[[nodiscard]] constexpr inline Radians operator+(Radians lhs, Radians rhs) { return Radians(lhs.value() + rhs.value()); }
[[nodiscard]] constexpr inline Radians operator-(Radians lhs, Radians rhs) { return Radians(lhs.value() - rhs.value()); }
[[nodiscard]] constexpr inline Radians operator*(Radians lhs, double scalar) { return Radians(lhs.value() * scalar); }
[[nodiscard]] constexpr inline Radians operator*(double scalar, Radians rhs) { return Radians(scalar * rhs.value()); }
inline std::ostream& operator<<(std::ostream& os, Radians rad) { return os << rad.toString(); }

class Degrees {
public:
    constexpr explicit Degrees(double val = 0.0) : value_(val) {}
    [[nodiscard]] constexpr double value() const { return value_; }

    [[nodiscard]] constexpr Degrees operator-() const { return Degrees(-value_); }
    [[nodiscard]] Degrees abs() const { return Degrees(std::abs(value_)); }
    [[nodiscard]] bool operator==(Degrees other) const { return std::abs(value_ - other.value_) < UnitConstants::DEFAULT_EPSILON; }
    [[nodiscard]] bool operator!=(Degrees other) const { return !(*this == other); }

    [[nodiscard]] Radians toRadians() const;
    [[nodiscard]] std::string toString(int precision = 2) const { return value_to_string_with_suffix(value_, precision, " deg"); }
private:
    double value_;
};
inline std::ostream& operator<<(std::ostream& os, Degrees deg) { return os << deg.toString(); }

inline Degrees Radians::toDegrees() const { return Degrees(value_ * (180.0 / UnitConstants::PI)); }
inline Radians Degrees::toRadians() const { return Radians(value_ * (UnitConstants::PI / 180.0)); }

//======================================================================================
// Linear Distance Units
//======================================================================================
class Meters {
public:
    constexpr explicit Meters(double val = 0.0) : value_(val) {}
    [[nodiscard]] constexpr double value() const { return value_; }

    Meters& operator+=(Meters other) { value_ += other.value_; return *this; }
    Meters& operator-=(Meters other) { value_ -= other.value_; return *this; }
    [[nodiscard]] constexpr Meters operator-() const { return Meters(-value_); }
    [[nodiscard]] Meters abs() const { return Meters(std::abs(value_)); }
    [[nodiscard]] bool operator==(Meters other) const { return std::abs(value_ - other.value_) < UnitConstants::DEFAULT_EPSILON; }
    [[nodiscard]] bool operator!=(Meters other) const { return !(*this == other); }
    [[nodiscard]] bool operator<(Meters other) const { return value_ < other.value_ && !(*this == other); }
    [[nodiscard]] bool operator>(Meters other) const { return value_ > other.value_ && !(*this == other); }

    [[nodiscard]] Millimeters toMillimeters() const;
    [[nodiscard]] std::string toString(int precision = 4) const { return value_to_string_with_suffix(value_, precision, " m"); }
private:
    double value_;
};
[[nodiscard]] constexpr inline Meters operator+(Meters lhs, Meters rhs) { return Meters(lhs.value() + rhs.value()); }
[[nodiscard]] constexpr inline Meters operator-(Meters lhs, Meters rhs) { return Meters(lhs.value() - rhs.value()); }
inline std::ostream& operator<<(std::ostream& os, Meters m) { return os << m.toString(); }

class Millimeters {
public:
    constexpr explicit Millimeters(double val = 0.0) : value_(val) {}
    [[nodiscard]] constexpr double value() const { return value_; }
    [[nodiscard]] constexpr Millimeters operator-() const { return Millimeters(-value_); }
    [[nodiscard]] Meters toMeters() const { return Meters(value_ / 1000.0); }
    [[nodiscard]] std::string toString(int precision = 1) const { return value_to_string_with_suffix(value_, precision, " mm"); }
private:
    double value_;
};
inline std::ostream& operator<<(std::ostream& os, Millimeters mm) { return os << mm.toString(); }
inline Millimeters Meters::toMillimeters() const { return Millimeters(value_ * 1000.0); }

// User-defined literals
namespace literals {
    [[nodiscard]] constexpr Radians operator"" _rad(long double val) { return Radians(static_cast<double>(val)); }
    [[nodiscard]] constexpr Degrees operator"" _deg(long double val) { return Degrees(static_cast<double>(val)); }
    [[nodiscard]] constexpr Meters operator"" _m(long double val) { return Meters(static_cast<double>(val)); }
    [[nodiscard]] constexpr Millimeters operator"" _mm(long double val) { return Millimeters(static_cast<double>(val)); }
} // namespace literals

} // namespace RKC
#endif // RKC_UNITS_H

// KinematicErrors.h
#ifndef RKC_KINEMATIC_ERRORS_H
#define RKC_KINEMATIC_ERRORS_H

#pragma once

#include <stdexcept>
#include <string>

namespace RKC {

/**
 * @brief Structural misuse: malformed chain, invalid solver parameters or a joint
 *        vector whose length does not match the chain.
 *        Thrown at construction or call entry, never from inside an iteration.
 */
class ConfigurationError : public std::logic_error {
public:
    explicit ConfigurationError(const std::string& what) : std::logic_error(what) {}
};

/**
 * @brief A pose array of the wrong length was handed to EEPose::fromArray.
 */
class ShapeError : public std::length_error {
public:
    explicit ShapeError(const std::string& what) : std::length_error(what) {}
};

} // namespace RKC
#endif // RKC_KINEMATIC_ERRORS_H

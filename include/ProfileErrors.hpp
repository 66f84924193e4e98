#ifndef PROFILE_ERRORS_HPP
#define PROFILE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace GeoProfile {

/**
 * @brief Base class for all failures raised by the profile pipeline
 *
 * The delivery layer maps each subclass onto a structured response; the
 * what() text stays internal and is only logged.
 */
class ProfileError : public std::runtime_error {
public:
    explicit ProfileError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Request payload could not be parsed. Raised before any pipeline work.
class InvalidRequestError : public ProfileError {
public:
    explicit InvalidRequestError(const std::string& message)
        : ProfileError(message) {}
};

/// Sample set cannot be triangulated (too few distinct points or collinear)
class DegenerateInputError : public ProfileError {
public:
    explicit DegenerateInputError(const std::string& message)
        : ProfileError(message) {}
};

/// Composing or encoding the chart failed
class RenderingError : public ProfileError {
public:
    explicit RenderingError(const std::string& message)
        : ProfileError(message) {}
};

} // namespace GeoProfile

#endif // PROFILE_ERRORS_HPP

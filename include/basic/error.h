#ifndef UMB_INCLUDE_BASIC_ERROR_H
#define UMB_INCLUDE_BASIC_ERROR_H

#include <stdexcept>
#include <string>

namespace umb {

// Thrown when a singular matrix is inverted.
class NotInvertibleError : public std::domain_error {
public:
	NotInvertibleError(const std::string &what);
};

// Thrown when a zero length tuple is normalized.
class ZeroMagnitudeError : public std::domain_error {
public:
	ZeroMagnitudeError(const std::string &what);
};

}

#endif

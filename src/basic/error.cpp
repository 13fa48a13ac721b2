#include <basic/error.h>

namespace umb {

NotInvertibleError::NotInvertibleError(const std::string &what) : std::domain_error(what) {
}

ZeroMagnitudeError::ZeroMagnitudeError(const std::string &what) : std::domain_error(what) {
}

}

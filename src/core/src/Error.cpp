/**
 * @file Error.cpp
 * @brief Implementation of Error::format().
 * @author MasterLaplace
 */

#include "cbb/core/Error.hpp"

#include <sstream>

namespace cbb::core {

std::string Error::format() const
{
    std::ostringstream os;
    os << '[' << errorCodeName(_code) << "] " << _message
       << " (" << _location.file_name() << ':' << _location.line() << ')';
    return os.str();
}

} // namespace cbb::core

#include "kite_driver.h"

namespace kite {

const char* DriverErrorToString(DriverError error) {
  switch (error) {
    case DriverError::NONE: return "none";
    case DriverError::NO_SUCH_ELEMENT: return "no such element";
    case DriverError::STALE_ELEMENT: return "stale element reference";
    case DriverError::NO_SUCH_FRAME: return "no such frame";
    case DriverError::NO_SUCH_ALERT: return "no such alert";
    case DriverError::NO_SUCH_COOKIE: return "no such cookie";
    case DriverError::INVALID_ARGUMENT: return "invalid argument";
    case DriverError::TIMEOUT: return "timeout";
    case DriverError::INVALID_SESSION: return "invalid session id";
    case DriverError::JAVASCRIPT_ERROR: return "javascript error";
    default: return "unknown error";
  }
}

}  // namespace kite

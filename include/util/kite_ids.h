#pragma once

#include <string>

namespace kite {

// Random (v4) UUID in lowercase text form, used for session and element IDs
std::string GenerateId();

}  // namespace kite

#include "kite_ids.h"
#include <uuid/uuid.h>

namespace kite {

std::string GenerateId() {
  uuid_t uuid;
  uuid_generate_random(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return std::string(uuid_str);
}

}  // namespace kite

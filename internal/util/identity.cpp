#include "identity.hpp"

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>

namespace taskvault::util {

std::string CurrentActor() {
  for (const char* var : {"TASKVAULT_ACTOR", "USER", "LOGNAME"}) {
    const char* value = std::getenv(var);
    if (value && *value) {
      return value;
    }
  }

  if (const passwd* entry = ::getpwuid(::geteuid()); entry && entry->pw_name && *entry->pw_name) {
    return entry->pw_name;
  }

  return kSystemActor;
}

} // namespace taskvault::util

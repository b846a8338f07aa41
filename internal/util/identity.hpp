#pragma once

#include <string>

namespace taskvault::util {

/*
  Process-wide actor attribution.

  Resolution order: TASKVAULT_ACTOR, USER, LOGNAME, the passwd entry of the
  effective uid, then "system".
*/
std::string CurrentActor();

inline constexpr const char* kSystemActor = "system";

} // namespace taskvault::util

#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

namespace taskvault::util {

/*
  UUID helpers

  Nonces and audit entry ids are raw 16 byte RFC4122 v4 UUIDs rendered in
  the canonical lowercase 8-4-4-4-12 form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// True only for the canonical lowercase 8-4-4-4-12 hex form.
bool IsCanonical(std::string_view text);

} // namespace taskvault::util

#pragma once

#include <string>
#include <string_view>

namespace taskvault::crypto {

/*
  Content digest used for approval integrity hashes.

  Returns the SHA-256 of data as 64 lowercase hex characters. Throws
  std::runtime_error if the OpenSSL digest context cannot be driven.
*/
std::string Sha256Hex(std::string_view data);

// Case-insensitive comparison of two hex digests.
bool DigestEquals(std::string_view a, std::string_view b);

} // namespace taskvault::crypto

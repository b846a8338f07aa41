#include "digest.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <memory>
#include <stdexcept>

namespace taskvault::crypto {
namespace {

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

} // namespace

std::string Sha256Hex(std::string_view data) {
  EvpMdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int  out_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           hex;
  hex.reserve(out_len * 2);
  for (unsigned int i = 0; i < out_len; ++i) {
    hex.push_back(kHex[(out[i] >> 4) & 0x0F]);
    hex.push_back(kHex[out[i] & 0x0F]);
  }
  return hex;
}

bool DigestEquals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

} // namespace taskvault::crypto

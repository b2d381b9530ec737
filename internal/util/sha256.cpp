#include "sha256.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace jobguard::util {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

} // namespace

std::string Sha256Hex(std::string_view data) {
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("sha256: EVP_MD_CTX_new failed");
  }

  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("sha256: digest init failed");
  }
  if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("sha256: digest update failed");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int  hash_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
    throw std::runtime_error("sha256: digest final failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(hash_len * 2);
  for (unsigned int i = 0; i < hash_len; ++i) {
    out.push_back(kHex[(hash[i] >> 4) & 0x0F]);
    out.push_back(kHex[hash[i] & 0x0F]);
  }
  return out;
}

} // namespace jobguard::util

#include <imgpipe/core/digest.hpp>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <memory>
#include <stdexcept>
#include <vector>

namespace imgpipe::core {

namespace {

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

constexpr char kHexDigits[] = "0123456789abcdef";

}  // namespace

std::string to_hex(std::span<const std::byte> data) {
  std::string out;
  out.reserve(data.size() * 2);
  for (const std::byte b : data) {
    const auto v = static_cast<unsigned char>(b);
    out.push_back(kHexDigits[v >> 4]);
    out.push_back(kHexDigits[v & 0x0F]);
  }
  return out;
}

std::string sha256_hex(std::span<const std::byte> data) {
  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  return to_hex(std::as_bytes(std::span<const unsigned char>(md, md_len)));
}

std::string random_id(std::size_t num_bytes) {
  std::vector<unsigned char> buf(num_bytes);
  if (num_bytes > 0 && RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return to_hex(std::as_bytes(std::span<const unsigned char>(buf)));
}

}  // namespace imgpipe::core

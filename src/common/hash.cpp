#include "hostgate/common/hash.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <sstream>

namespace hostgate::common {

namespace {

std::string to_hex(const unsigned char *digest, const std::size_t length) {
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < length; ++i) {
    out << std::setw(2) << static_cast<int>(digest[i]);
  }
  return out.str();
}

} // namespace

std::string sha256_hex(const std::string &data) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest);
  return to_hex(digest, SHA256_DIGEST_LENGTH);
}

Result<std::string> sha256_file_hex(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return Result<std::string>::failure("Unable to open file for hashing: " + path.string(),
                                        ErrorKind::NotFound);
  }

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                              &EVP_MD_CTX_free);
  if (!ctx) {
    return Result<std::string>::failure("Failed to create digest context");
  }

  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    return Result<std::string>::failure("Digest init failed");
  }

  std::array<char, 64 * 1024> chunk{};
  while (file) {
    file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    const auto got = file.gcount();
    if (got <= 0) {
      break;
    }
    if (EVP_DigestUpdate(ctx.get(), chunk.data(), static_cast<std::size_t>(got)) != 1) {
      return Result<std::string>::failure("Digest update failed: " + path.string());
    }
  }
  if (file.bad()) {
    return Result<std::string>::failure("Read error while hashing: " + path.string());
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    return Result<std::string>::failure("Digest final failed");
  }

  return Result<std::string>::success(to_hex(digest, digest_len));
}

} // namespace hostgate::common

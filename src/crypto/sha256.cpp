#include "pw/crypto/sha256.h"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>

#include <cerrno>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

#include "pw/common.h"
#include "pw/error.h"

namespace pw::crypto {

namespace {

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

struct EVPContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using DigestCtxPtr = std::unique_ptr<EVP_MD_CTX, EVPContextDeleter>;

[[noreturn]] void ThrowDigestError(const char* context) {
  throw Error{ErrorDomain::Internal, 0, BuildOpenSSLErrorMessage(context)};
}

constexpr size_t kFileChunkSize = 64 * 1024;

} // namespace

Sha256Digest SHA256_Hash(std::span<const uint8_t> data) {
  Sha256Digest out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    ThrowDigestError("EVP_Digest(EVP_sha256)");
  }
  if (len != out.size()) {
    throw Error{ErrorDomain::Internal, 0, "Unexpected SHA-256 length", static_cast<int>(len)};
  }
  return out;
}

Sha256Digest SHA256_Hash(std::string_view text) {
  const auto* data = reinterpret_cast<const uint8_t*>(text.data());
  return SHA256_Hash(std::span<const uint8_t>(data, text.size()));
}

Sha256Digest SHA256_File(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw Error{ErrorDomain::IO, errno, "Unable to open " + PathToUtf8String(path) + " for hashing",
                errno};
  }

  DigestCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    ThrowDigestError("EVP_MD_CTX_new");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    ThrowDigestError("EVP_DigestInit_ex");
  }

  std::vector<char> buffer(kFileChunkSize);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto got = in.gcount();
    if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
      ThrowDigestError("EVP_DigestUpdate");
    }
  }
  if (in.bad()) {
    throw Error{ErrorDomain::IO, 0, "Read failure while hashing " + PathToUtf8String(path)};
  }

  Sha256Digest out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) {
    ThrowDigestError("EVP_DigestFinal_ex");
  }
  if (len != out.size()) {
    throw Error{ErrorDomain::Internal, 0, "Unexpected SHA-256 length", static_cast<int>(len)};
  }
  return out;
}

std::string HexEncode(std::span<const uint8_t> bytes) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (uint8_t byte : bytes) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

std::optional<Sha256Digest> ParseSha256Hex(std::string_view text) {
  Sha256Digest out{};
  if (text.size() != out.size() * 2) {
    return std::nullopt;
  }
  auto nibble = [](char ch) -> int {
    if (ch >= '0' && ch <= '9') {
      return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
      return 10 + (ch - 'a');
    }
    if (ch >= 'A' && ch <= 'F') {
      return 10 + (ch - 'A');
    }
    return -1;
  };
  for (size_t i = 0; i < out.size(); ++i) {
    const int high = nibble(text[i * 2]);
    const int low = nibble(text[i * 2 + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    out[i] = static_cast<uint8_t>((high << 4) | low);
  }
  return out;
}

bool DigestEquals(const Sha256Digest& a, const Sha256Digest& b) noexcept {
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace pw::crypto

#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pw::crypto {
using Sha256Digest = std::array<uint8_t, 32>;

Sha256Digest SHA256_Hash(std::span<const uint8_t> data);
Sha256Digest SHA256_Hash(std::string_view text);
// Streams the file through the digest; throws Error{IO} when unreadable.
Sha256Digest SHA256_File(const std::filesystem::path& path);

std::string HexEncode(std::span<const uint8_t> bytes);
std::optional<Sha256Digest> ParseSha256Hex(std::string_view text);

// Constant-time comparison (CRYPTO_memcmp).
bool DigestEquals(const Sha256Digest& a, const Sha256Digest& b) noexcept;
} // namespace pw::crypto

#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace imgpipe::core {

/// Lowercase hex SHA-256 of the exact bytes (64 characters). This is the dedup key.
/// Throws std::runtime_error if the digest backend fails.
[[nodiscard]] std::string sha256_hex(std::span<const std::byte> data);

/// Random opaque identifier: num_bytes of CSPRNG output as lowercase hex.
/// Used for upload attempt ids and stored file names; unrelated to content.
[[nodiscard]] std::string random_id(std::size_t num_bytes = 16);

/// Lowercase hex encoding of arbitrary bytes.
[[nodiscard]] std::string to_hex(std::span<const std::byte> data);

}  // namespace imgpipe::core

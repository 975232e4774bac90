/**
 * nascore - Randomness and digest helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <string_view>

namespace nascore::crypto
{

    void ensure_sodium_init();

    /// Hex encoding of `byte_count` bytes from the libsodium CSPRNG.
    std::string random_hex(std::size_t byte_count);

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    bool digests_equal(std::string_view lhs, std::string_view rhs) noexcept;

} // namespace nascore::crypto

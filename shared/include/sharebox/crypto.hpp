/**
 * ShareBox - Checksums and random identifiers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <span>
#include <string>

#include <sodium.h>

namespace sharebox::crypto
{

    void ensure_sodium_init();

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    // Lowercase hex string of `bytes` random bytes.
    std::string random_hex(std::size_t bytes);

    // Incremental BLAKE2b digest; yields the same value as hash_bytes over the
    // concatenation of every update.
    class StreamingHash
    {
    public:
        StreamingHash();

        void update(std::span<const std::byte> data);

        std::string finish();

    private:
        crypto_generichash_state state_{};
        bool finished_{false};
    };

} // namespace sharebox::crypto

/**
 * @file password_hasher.hpp
 * @brief Salted password hashing for the users table
 *
 * Hashes use PBKDF2-HMAC-SHA256 with a random 16-byte salt and are encoded
 * in the modular crypt format understood by the web application:
 *
 *   $pbkdf2-sha256$<rounds>$<salt>$<checksum>
 *
 * where salt and checksum use the "adapted" base64 alphabet ('.' in place
 * of '+', no padding).
 */

#pragma once

#include <ampsetup/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ampsetup::security {

/**
 * @brief Produces and verifies salted password hashes
 *
 * Thread Safety: stateless apart from configuration; safe to share.
 */
class password_hasher {
public:
    /// Iteration count used when none is given
    static constexpr std::uint32_t default_rounds = 29000;

    /// Salt length in bytes
    static constexpr std::size_t salt_length = 16;

    /// Derived key length in bytes
    static constexpr std::size_t checksum_length = 32;

    explicit password_hasher(std::uint32_t rounds = default_rounds);

    /**
     * @brief Hash a password with a freshly generated salt
     * @return Encoded hash, or hashing_failed if the RNG or KDF fails
     */
    [[nodiscard]] auto hash(std::string_view password) const -> Result<std::string>;

    /**
     * @brief Check a password against an encoded hash
     * @return false for a wrong password or a malformed hash
     */
    [[nodiscard]] auto verify(std::string_view password,
                              std::string_view encoded) const -> bool;

    [[nodiscard]] auto rounds() const noexcept -> std::uint32_t { return rounds_; }

private:
    [[nodiscard]] static auto derive(std::string_view password,
                                     const std::vector<std::uint8_t>& salt,
                                     std::uint32_t rounds)
        -> Result<std::vector<std::uint8_t>>;

    std::uint32_t rounds_;
};

/**
 * @brief Encode bytes in passlib's adapted base64 ('.' for '+', no padding)
 */
[[nodiscard]] auto ab64_encode(const std::vector<std::uint8_t>& bytes) -> std::string;

/**
 * @brief Decode adapted base64; returns an empty vector on malformed input
 */
[[nodiscard]] auto ab64_decode(std::string_view text) -> std::vector<std::uint8_t>;

} // namespace ampsetup::security

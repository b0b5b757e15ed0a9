/**
 * @file password_hasher.cpp
 * @brief Implementation of PBKDF2-SHA256 password hashing
 */

#include <ampsetup/security/password_hasher.hpp>

#include <ampsetup/compat/format.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <charconv>

namespace ampsetup::security {

namespace {

constexpr std::string_view kScheme = "$pbkdf2-sha256$";

auto split_fields(std::string_view encoded) -> std::vector<std::string_view> {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (start <= encoded.size()) {
        auto end = encoded.find('$', start);
        if (end == std::string_view::npos) {
            fields.push_back(encoded.substr(start));
            break;
        }
        fields.push_back(encoded.substr(start, end - start));
        start = end + 1;
    }
    return fields;
}

}  // namespace

// =============================================================================
// Adapted base64
// =============================================================================

auto ab64_encode(const std::vector<std::uint8_t>& bytes) -> std::string {
    if (bytes.empty()) {
        return {};
    }

    std::string encoded(4 * ((bytes.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                  bytes.data(), static_cast<int>(bytes.size()));
    encoded.resize(static_cast<std::size_t>(written));

    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    for (auto& c : encoded) {
        if (c == '+') c = '.';
    }
    return encoded;
}

auto ab64_decode(std::string_view text) -> std::vector<std::uint8_t> {
    if (text.empty() || text.size() % 4 == 1) {
        return {};
    }

    std::string standard(text);
    for (auto& c : standard) {
        if (c == '.') c = '+';
    }
    std::size_t padding = (4 - standard.size() % 4) % 4;
    standard.append(padding, '=');

    std::vector<std::uint8_t> decoded(3 * standard.size() / 4);
    int n = EVP_DecodeBlock(decoded.data(),
                            reinterpret_cast<const unsigned char*>(standard.data()),
                            static_cast<int>(standard.size()));
    if (n < 0 || static_cast<std::size_t>(n) < padding) {
        return {};
    }
    decoded.resize(static_cast<std::size_t>(n) - padding);
    return decoded;
}

// =============================================================================
// Hashing
// =============================================================================

password_hasher::password_hasher(std::uint32_t rounds)
    : rounds_(rounds == 0 ? default_rounds : rounds) {}

auto password_hasher::hash(std::string_view password) const -> Result<std::string> {
    std::vector<std::uint8_t> salt(salt_length);
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
        return make_error<std::string>(error_codes::hashing_failed,
                                       "Random salt generation failed", "security");
    }

    auto derived = derive(password, salt, rounds_);
    if (derived.is_err()) {
        return make_error<std::string>(derived.error().code,
                                       derived.error().message, "security");
    }

    return compat::format("{}{}${}${}", kScheme, rounds_, ab64_encode(salt),
                          ab64_encode(derived.value()));
}

auto password_hasher::verify(std::string_view password,
                             std::string_view encoded) const -> bool {
    if (encoded.substr(0, kScheme.size()) != kScheme) {
        return false;
    }

    // "", "pbkdf2-sha256", rounds, salt, checksum
    auto fields = split_fields(encoded);
    if (fields.size() != 5) {
        return false;
    }

    std::uint32_t rounds = 0;
    auto rounds_text = fields[2];
    auto [ptr, ec] = std::from_chars(rounds_text.data(),
                                     rounds_text.data() + rounds_text.size(), rounds);
    if (ec != std::errc{} || ptr != rounds_text.data() + rounds_text.size() ||
        rounds == 0) {
        return false;
    }

    auto salt = ab64_decode(fields[3]);
    auto expected = ab64_decode(fields[4]);
    if (salt.empty() || expected.size() != checksum_length) {
        return false;
    }

    auto derived = derive(password, salt, rounds);
    if (derived.is_err()) {
        return false;
    }

    return CRYPTO_memcmp(derived.value().data(), expected.data(),
                         checksum_length) == 0;
}

auto password_hasher::derive(std::string_view password,
                             const std::vector<std::uint8_t>& salt,
                             std::uint32_t rounds)
    -> Result<std::vector<std::uint8_t>> {
    std::vector<std::uint8_t> key(checksum_length);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          static_cast<int>(rounds), EVP_sha256(),
                          static_cast<int>(key.size()), key.data()) != 1) {
        return make_error<std::vector<std::uint8_t>>(
            error_codes::hashing_failed, "PBKDF2 key derivation failed",
            "security");
    }
    return key;
}

} // namespace ampsetup::security

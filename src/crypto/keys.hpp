#pragma once

#include "core/result.hpp"
#include <sodium.h>
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace daybook::crypto {

constexpr size_t SYMMETRIC_KEY_SIZE = crypto_secretbox_KEYBYTES;
constexpr size_t SALT_SIZE = crypto_pwhash_SALTBYTES;

using SymmetricKey = std::array<uint8_t, SYMMETRIC_KEY_SIZE>;
using Salt = std::array<uint8_t, SALT_SIZE>;

/**
 * Initialize libsodium. Safe to call more than once.
 */
[[nodiscard]] inline Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{"Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

[[nodiscard]] inline SymmetricKey generate_symmetric_key() {
    SymmetricKey key;
    crypto_secretbox_keygen(key.data());
    return key;
}

[[nodiscard]] inline std::vector<uint8_t> random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    randombytes_buf(bytes.data(), count);
    return bytes;
}

[[nodiscard]] inline Salt generate_salt() {
    Salt salt;
    randombytes_buf(salt.data(), salt.size());
    return salt;
}

/**
 * Derive a symmetric key from a passphrase using Argon2id.
 */
[[nodiscard]] inline Result<SymmetricKey, Error> derive_key_from_password(
    const std::string& password,
    const Salt& salt
) {
    SymmetricKey key;
    int result = crypto_pwhash(
        key.data(), key.size(),
        password.c_str(), password.size(),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT
    );
    if (result != 0) {
        return Result<SymmetricKey, Error>::err(Error{"Key derivation failed"});
    }
    return Result<SymmetricKey, Error>::ok(key);
}

/**
 * Derive a purpose-bound subkey. `context` must be exactly 8 characters.
 */
[[nodiscard]] inline Result<SymmetricKey, Error> derive_subkey(
    const SymmetricKey& master,
    uint64_t subkey_id,
    const char (&context)[crypto_kdf_CONTEXTBYTES + 1]
) {
    static_assert(crypto_kdf_KEYBYTES == SYMMETRIC_KEY_SIZE);
    SymmetricKey subkey;
    if (crypto_kdf_derive_from_key(subkey.data(), subkey.size(), subkey_id,
                                   context, master.data()) != 0) {
        return Result<SymmetricKey, Error>::err(Error{"Subkey derivation failed"});
    }
    return Result<SymmetricKey, Error>::ok(subkey);
}

/**
 * SHA-256 digest as lowercase hex.
 */
[[nodiscard]] inline std::string sha256_hex(std::span<const uint8_t> data) {
    std::array<uint8_t, crypto_hash_sha256_BYTES> digest;
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    std::string hex(digest.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    hex.pop_back();
    return hex;
}

[[nodiscard]] inline std::string to_base64(std::span<const uint8_t> data) {
    const size_t len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string out(len, '\0');
    sodium_bin2base64(out.data(), out.size(), data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    out.resize(len - 1);  // drop the terminator
    return out;
}

[[nodiscard]] inline Result<std::vector<uint8_t>, Error> from_base64(const std::string& b64) {
    std::vector<uint8_t> out(b64.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    if (sodium_base642bin(out.data(), out.size(), b64.data(), b64.size(),
                          nullptr, &bin_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        return Result<std::vector<uint8_t>, Error>::err(Error{"Invalid Base64"});
    }
    out.resize(bin_len);
    return Result<std::vector<uint8_t>, Error>::ok(std::move(out));
}

inline void secure_zero(void* ptr, size_t len) {
    sodium_memzero(ptr, len);
}

[[nodiscard]] inline bool secure_compare(std::span<const uint8_t> a, std::span<const uint8_t> b) {
    if (a.size() != b.size()) return false;
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace daybook::crypto

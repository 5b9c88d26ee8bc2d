#pragma once

#include "crypto/keys.hpp"
#include "core/result.hpp"
#include <sodium.h>
#include <span>
#include <vector>

namespace daybook::crypto {

constexpr size_t SECRETBOX_NONCE_SIZE = crypto_secretbox_NONCEBYTES;
constexpr size_t SECRETBOX_MAC_SIZE = crypto_secretbox_MACBYTES;

/**
 * Ciphertext (with MAC) and the nonce it was sealed under.
 */
struct SealedBox {
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> nonce;
};

/**
 * Encrypt with XSalsa20-Poly1305. The nonce is always drawn here; callers
 * cannot supply one.
 */
[[nodiscard]] inline Result<SealedBox, Error> seal(
    std::span<const uint8_t> plaintext,
    const SymmetricKey& key
) {
    SealedBox box;
    box.nonce.resize(SECRETBOX_NONCE_SIZE);
    randombytes_buf(box.nonce.data(), box.nonce.size());
    box.ciphertext.resize(plaintext.size() + SECRETBOX_MAC_SIZE);

    int result = crypto_secretbox_easy(
        box.ciphertext.data(),
        plaintext.data(), plaintext.size(),
        box.nonce.data(),
        key.data()
    );
    if (result != 0) {
        return Result<SealedBox, Error>::err(Error{"Encryption failed"});
    }
    return Result<SealedBox, Error>::ok(std::move(box));
}

/**
 * Decrypt and authenticate. Fails on a wrong key or tampered input.
 */
[[nodiscard]] inline Result<std::vector<uint8_t>, Error> open(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> nonce,
    const SymmetricKey& key
) {
    if (nonce.size() != SECRETBOX_NONCE_SIZE) {
        return Result<std::vector<uint8_t>, Error>::err(Error{"Invalid nonce size"});
    }
    if (ciphertext.size() < SECRETBOX_MAC_SIZE) {
        return Result<std::vector<uint8_t>, Error>::err(Error{"Ciphertext too short"});
    }

    std::vector<uint8_t> plaintext(ciphertext.size() - SECRETBOX_MAC_SIZE);
    int result = crypto_secretbox_open_easy(
        plaintext.data(),
        ciphertext.data(), ciphertext.size(),
        nonce.data(),
        key.data()
    );
    if (result != 0) {
        return Result<std::vector<uint8_t>, Error>::err(
            Error{"Decryption failed (authentication error)"});
    }
    return Result<std::vector<uint8_t>, Error>::ok(std::move(plaintext));
}

} // namespace daybook::crypto

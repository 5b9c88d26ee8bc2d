#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/sanitize.hpp"
#include "crypto/e2ee_service.hpp"
#include "crypto/encryption.hpp"
#include "crypto/keyring.hpp"

using namespace daybook;
using namespace daybook::crypto;

namespace {

std::shared_ptr<Keyring> single_key_ring() {
    auto ring = std::make_shared<Keyring>();
    if (ring->add_key("k1", generate_symmetric_key()).is_err() ||
        ring->set_active("k1").is_err()) {
        return nullptr;
    }
    return ring;
}

} // namespace

TEST_CASE("Property: sealed bytes open to the same bytes", "[property][crypto]") {
    REQUIRE(init().is_ok());
    const auto key = generate_symmetric_key();

    rc::check("open(seal(p)) == p",
        [&key](const std::vector<uint8_t>& plaintext) {
            auto box = seal(plaintext, key);
            RC_ASSERT(box.is_ok());
            auto opened = open(box.unwrap().ciphertext, box.unwrap().nonce, key);
            RC_ASSERT(opened.is_ok());
            RC_ASSERT(opened.unwrap() == plaintext);
        }
    );
}

TEST_CASE("Property: sealing twice never reuses a nonce", "[property][crypto]") {
    REQUIRE(init().is_ok());
    const auto key = generate_symmetric_key();

    rc::check("two seals of p differ in nonce",
        [&key](const std::vector<uint8_t>& plaintext) {
            auto first = seal(plaintext, key).unwrap();
            auto second = seal(plaintext, key).unwrap();
            RC_ASSERT(first.nonce != second.nonce);
        }
    );
}

TEST_CASE("Property: any flipped bit fails authentication", "[property][crypto]") {
    REQUIRE(init().is_ok());
    const auto key = generate_symmetric_key();

    rc::check("tampered ciphertext does not open",
        [&key](const std::vector<uint8_t>& plaintext) {
            auto box = seal(plaintext, key).unwrap();
            const auto index = *rc::gen::inRange<size_t>(0, box.ciphertext.size());
            const auto bit = *rc::gen::inRange(0, 8);
            box.ciphertext[index] ^= static_cast<uint8_t>(1u << bit);
            RC_ASSERT(open(box.ciphertext, box.nonce, key).is_err());
        }
    );
}

TEST_CASE("Property: note envelopes round-trip to sanitized content", "[property][crypto]") {
    REQUIRE(init().is_ok());
    auto ring = single_key_ring();
    REQUIRE(ring);
    const E2eeService e2ee(ring);

    rc::check("decrypt(encrypt(note)).content == sanitize(note.content)",
        [&e2ee](const std::string& content) {
            NotePayload payload{content, std::nullopt};
            auto sealed = e2ee.encrypt_note(payload);
            RC_ASSERT(sealed.is_ok());
            RC_ASSERT(sealed.unwrap().has_value());

            const auto& envelope = *sealed.unwrap();
            RC_ASSERT(envelope.key_id == "k1");
            auto opened = e2ee.decrypt_note(envelope.ciphertext, envelope.nonce, envelope.key_id);
            RC_ASSERT(opened.is_ok());
            RC_ASSERT(opened.unwrap().has_value());
            RC_ASSERT(opened.unwrap()->content == sanitize_html(content));
        }
    );
}

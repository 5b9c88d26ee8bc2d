#pragma once

#include "crypto/keys.hpp"
#include "core/result.hpp"
#include <map>
#include <optional>
#include <string>

namespace daybook::crypto {

/**
 * Keyring - symmetric keys by id plus the id used for new encryptions.
 *
 * Retired keys stay in the ring so older notes remain readable. A key id
 * is bound to one key for the ring's lifetime.
 */
class Keyring {
public:
    Keyring() = default;
    ~Keyring();

    Keyring(const Keyring&) = delete;
    Keyring& operator=(const Keyring&) = delete;

    /**
     * Add a key. Fails if the id is empty or already bound to another key.
     */
    [[nodiscard]] Result<void, Error> add_key(const std::string& id, const SymmetricKey& key);

    /**
     * Make `id` the key for new encryptions.
     */
    [[nodiscard]] Result<void, Error> set_active(const std::string& id);

    void remove_key(const std::string& id);

    [[nodiscard]] const std::optional<std::string>& active_key_id() const noexcept {
        return active_id_;
    }

    /**
     * The key for `id`, or nullptr if the ring does not hold it.
     */
    [[nodiscard]] const SymmetricKey* key(const std::string& id) const;

    [[nodiscard]] bool has_key(const std::string& id) const {
        return keys_.contains(id);
    }

    [[nodiscard]] size_t size() const noexcept { return keys_.size(); }

private:
    std::map<std::string, SymmetricKey> keys_;
    std::optional<std::string> active_id_;
};

} // namespace daybook::crypto

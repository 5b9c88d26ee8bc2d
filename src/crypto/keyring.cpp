#include "crypto/keyring.hpp"

namespace daybook::crypto {

Keyring::~Keyring() {
    for (auto& [id, key] : keys_) {
        secure_zero(key.data(), key.size());
    }
}

Result<void, Error> Keyring::add_key(const std::string& id, const SymmetricKey& key) {
    if (id.empty()) {
        return Result<void, Error>::err(Error{"Key id must not be empty"});
    }
    auto it = keys_.find(id);
    if (it != keys_.end()) {
        if (secure_compare(it->second, key)) {
            return Result<void, Error>::ok();
        }
        return Result<void, Error>::err(Error{"Key id already in use: " + id});
    }
    keys_.emplace(id, key);
    return Result<void, Error>::ok();
}

Result<void, Error> Keyring::set_active(const std::string& id) {
    if (!keys_.contains(id)) {
        return Result<void, Error>::err(Error{"Unknown key id: " + id});
    }
    active_id_ = id;
    return Result<void, Error>::ok();
}

void Keyring::remove_key(const std::string& id) {
    auto it = keys_.find(id);
    if (it == keys_.end()) return;
    secure_zero(it->second.data(), it->second.size());
    keys_.erase(it);
    if (active_id_ == id) {
        active_id_.reset();
    }
}

const SymmetricKey* Keyring::key(const std::string& id) const {
    auto it = keys_.find(id);
    return it == keys_.end() ? nullptr : &it->second;
}

} // namespace daybook::crypto

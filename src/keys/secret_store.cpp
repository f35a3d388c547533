/// @file secret_store.cpp
/// @brief InMemorySecretStore implementation.

#include "keyring/keys/secret_store.hpp"

#include "crypto/crypto_utils.hpp"

namespace keyring::keys {

InMemorySecretStore::~InMemorySecretStore() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, value] : entries_) {
        crypto::secureErase(value);
    }
}

std::optional<std::string> InMemorySecretStore::get(std::string_view name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(std::string(name));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemorySecretStore::put(std::string_view name, std::string value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(std::string(name));
    if (!inserted) {
        crypto::secureErase(it->second);
    }
    it->second = std::move(value);
    return true;
}

bool InMemorySecretStore::remove(std::string_view name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(std::string(name));
    if (it == entries_.end()) {
        return false;
    }
    crypto::secureErase(it->second);
    entries_.erase(it);
    return true;
}

std::size_t InMemorySecretStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace keyring::keys

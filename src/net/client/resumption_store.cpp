/// @file resumption_store.cpp
/// @brief InMemoryResumptionStore implementation.

#include "cgc/net/resumption_store.hpp"

namespace cgc::net {

void InMemoryResumptionStore::save(std::string_view endpoint, std::vector<uint8_t> token) {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_[std::string(endpoint)] = std::move(token);
}

std::optional<std::vector<uint8_t>> InMemoryResumptionStore::load(
    std::string_view endpoint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(std::string(endpoint));
    if (it == tokens_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryResumptionStore::erase(std::string_view endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.erase(std::string(endpoint)) > 0;
}

std::size_t InMemoryResumptionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

} // namespace cgc::net

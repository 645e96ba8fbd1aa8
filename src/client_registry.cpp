#include "relaychat/client_registry.hpp"

namespace relaychat {

RegisterResult ClientRegistry::register_client(ClientId id, std::shared_ptr<Connection> conn) {
    if (id == kNoClient || !conn) return RegisterResult::DuplicateId;

    std::lock_guard<std::mutex> lg(mtx_);
    auto inserted = clients_.emplace(id, std::move(conn));
    return inserted.second ? RegisterResult::Ok : RegisterResult::DuplicateId;
}

std::shared_ptr<Connection> ClientRegistry::deregister_client(ClientId id) {
    std::lock_guard<std::mutex> lg(mtx_);
    auto it = clients_.find(id);
    if (it == clients_.end()) return nullptr;

    std::shared_ptr<Connection> removed = std::move(it->second);
    clients_.erase(it);
    return removed;
}

std::vector<RegistryEntry> ClientRegistry::snapshot() const {
    std::lock_guard<std::mutex> lg(mtx_);
    return std::vector<RegistryEntry>(clients_.begin(), clients_.end());
}

std::vector<std::string> ClientRegistry::display_names() const {
    std::lock_guard<std::mutex> lg(mtx_);
    std::vector<std::string> names;
    names.reserve(clients_.size());
    for (const auto& entry : clients_) {
        names.push_back(entry.second->display_name());
    }
    return names;
}

bool ClientRegistry::contains(ClientId id) const {
    std::lock_guard<std::mutex> lg(mtx_);
    return clients_.count(id) != 0;
}

std::size_t ClientRegistry::size() const {
    std::lock_guard<std::mutex> lg(mtx_);
    return clients_.size();
}

bool ClientRegistry::empty() const {
    std::lock_guard<std::mutex> lg(mtx_);
    return clients_.empty();
}

}

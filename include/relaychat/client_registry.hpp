#ifndef RELAYCHAT_CLIENT_REGISTRY_HPP
#define RELAYCHAT_CLIENT_REGISTRY_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "relaychat/connection.hpp"

namespace relaychat {

enum class RegisterResult { Ok, DuplicateId };

using RegistryEntry = std::pair<ClientId, std::shared_ptr<Connection>>;

// The set of clients that can currently be reached. Every operation runs
// under one mutex, so a snapshot is a consistent point-in-time copy.
class ClientRegistry {
public:
    // Id 0 and null connections are rejected as DuplicateId as well; neither
    // can come from a correct handshake.
    RegisterResult register_client(ClientId id, std::shared_ptr<Connection> conn);

    // Returns the removed connection, or nullptr if id was not registered.
    std::shared_ptr<Connection> deregister_client(ClientId id);

    // Ordered by ascending id.
    std::vector<RegistryEntry> snapshot() const;

    std::vector<std::string> display_names() const;

    bool contains(ClientId id) const;
    std::size_t size() const;
    bool empty() const;

private:
    mutable std::mutex mtx_;
    std::map<ClientId, std::shared_ptr<Connection>> clients_;
};

}

#endif

#ifndef RELAYCHAT_BROADCASTER_HPP
#define RELAYCHAT_BROADCASTER_HPP

#include <cstddef>
#include <vector>

#include "relaychat/client_registry.hpp"
#include "relaychat/message.hpp"

namespace relaychat {

struct DeliveryReport {
    std::size_t delivered{0};
    std::vector<ClientId> failed;
};

// Fan-out over a registry snapshot. A recipient whose write fails is closed,
// which ends its own session loop; that loop deregisters it and announces the
// departure. Delivery to the other recipients carries on.
class Broadcaster {
public:
    explicit Broadcaster(ClientRegistry& registry);

    // Pass kNoClient to deliver to everyone.
    DeliveryReport broadcast(const Message& msg, ClientId exclude_id);

private:
    ClientRegistry& registry_;
};

}

#endif

#include "relaychat/broadcaster.hpp"

#include "relaychat/tslog.hpp"

using namespace tslog;

namespace relaychat {

Broadcaster::Broadcaster(ClientRegistry& registry) : registry_(registry) {}

DeliveryReport Broadcaster::broadcast(const Message& msg, ClientId exclude_id) {
    DeliveryReport report;

    for (const auto& entry : registry_.snapshot()) {
        if (entry.first == exclude_id) continue;

        const auto& conn = entry.second;
        if (conn->write_message(msg)) {
            ++report.delivered;
            continue;
        }

        Logger::instance().warn("Delivery of " + std::string(kind_to_string(msg.kind)) +
                                " to " + conn->display_name() + " (id " +
                                std::to_string(entry.first) + ") failed, closing");
        conn->close();
        report.failed.push_back(entry.first);
    }

    Logger::instance().debug("Broadcast " + std::string(kind_to_string(msg.kind)) + " from '" +
                             msg.sender_name + "': " + std::to_string(report.delivered) +
                             " delivered, " + std::to_string(report.failed.size()) + " failed");
    return report;
}

}

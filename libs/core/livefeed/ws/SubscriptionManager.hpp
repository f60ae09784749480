#pragma once
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "../dispatch/Channels.hpp"

// Builds the control frame sent once per opened connection.
class SubscriptionManager {
public:
    SubscriptionManager(std::string platform, int version)
        : m_platform(std::move(platform)), m_version(version) {}

    // Wallet filter; defaults to every user ("*")
    void setUsers(std::vector<std::string> users) {
        m_users = std::move(users);
    }
    const std::vector<std::string>& users() const { return m_users; }

    std::string buildSubscribeMsg() const {
        nlohmann::json msg;
        msg["action"] = ch::kSubscribe;
        msg["platform"] = m_platform;
        msg["version"] = m_version;
        msg["type"] = ch::kOrders;
        msg["filters"] = {{"users", m_users}};
        return msg.dump();
    }

private:
    std::string m_platform;
    int m_version;
    std::vector<std::string> m_users{ch::kAllUsers};
};

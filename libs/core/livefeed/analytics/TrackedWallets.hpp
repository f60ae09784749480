#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include "Cpp20Utils.hpp"

// Wallets the user follows, keyed lower-case, each with an optional nickname.
class TrackedWallets {
public:
    void track(std::string_view wallet, std::string nickname = {}) {
        if (wallet.empty()) return;
        m_wallets[Cpp20Utils::toLower(wallet)] = std::move(nickname);
    }

    bool untrack(std::string_view wallet) {
        return m_wallets.erase(Cpp20Utils::toLower(wallet)) > 0;
    }

    [[nodiscard]] bool contains(std::string_view wallet) const {
        return m_wallets.count(Cpp20Utils::toLower(wallet)) > 0;
    }

    [[nodiscard]] std::optional<std::string> nickname(std::string_view wallet) const {
        auto it = m_wallets.find(Cpp20Utils::toLower(wallet));
        if (it == m_wallets.end() || it->second.empty()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] bool empty() const noexcept { return m_wallets.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return m_wallets.size(); }
    [[nodiscard]] const std::map<std::string, std::string>& all() const noexcept { return m_wallets; }

private:
    std::map<std::string, std::string> m_wallets;
};

#pragma once
#include "ws/WsTransport.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/// Scripted WsTransport: the test decides when the socket opens, fails, closes or receives.
/// Every instance created by the factory is kept so tests can drive a specific attempt.
class FakeTransport : public WsTransport {
public:
    void connect(std::string host, std::string port, std::string target) override {
        host_ = std::move(host);
        port_ = std::move(port);
        target_ = std::move(target);
        ++connectCalls_;
    }

    void close(int code, std::string reason) override {
        closeCodes_.push_back(code);
        closeReasons_.push_back(std::move(reason));
    }

    void send(std::string msg) override { sent_.push_back(std::move(msg)); }

    void onMessage(MessageCb cb) override { onMessage_ = std::move(cb); }
    void onOpen(OpenCb cb) override { onOpen_ = std::move(cb); }
    void onClosed(CloseCb cb) override { onClosed_ = std::move(cb); }
    void onError(ErrorCb cb) override { onError_ = std::move(cb); }

    // Test drivers
    void open() { if (onOpen_) onOpen_(); }
    void fail(const std::string& msg) { if (onError_) onError_(msg); }
    void receive(const std::string& frame) { if (onMessage_) onMessage_(frame); }
    void remoteClose(int code, const std::string& reason = {}) { if (onClosed_) onClosed_(code, reason); }

    const std::string& host() const { return host_; }
    const std::string& port() const { return port_; }
    const std::string& target() const { return target_; }
    int connectCalls() const { return connectCalls_.load(); }
    const std::vector<std::string>& sent() const { return sent_; }
    const std::vector<int>& closeCodes() const { return closeCodes_; }

private:
    std::string host_, port_, target_;
    std::atomic<int> connectCalls_{0};   // connect() runs after every callback is wired
    std::vector<std::string> sent_;
    std::vector<int> closeCodes_;
    std::vector<std::string> closeReasons_;

    MessageCb onMessage_;
    OpenCb onOpen_;
    CloseCb onClosed_;
    ErrorCb onError_;
};

/// Factory that records every transport it hands out. Safe to query from the test
/// thread while the pipeline's I/O thread creates transports.
struct FakeTransportFactory {
    struct Registry {
        std::mutex mx;
        std::vector<std::shared_ptr<FakeTransport>> list;
    };
    std::shared_ptr<Registry> created = std::make_shared<Registry>();

    WsTransportFactory factory() const {
        auto registry = created;
        return [registry]() -> std::shared_ptr<WsTransport> {
            auto t = std::make_shared<FakeTransport>();
            std::lock_guard lock(registry->mx);
            registry->list.push_back(t);
            return t;
        };
    }

    std::size_t count() const {
        std::lock_guard lock(created->mx);
        return created->list.size();
    }
    FakeTransport& last() const {
        std::lock_guard lock(created->mx);
        return *created->list.back();
    }
    FakeTransport& at(std::size_t i) const {
        std::lock_guard lock(created->mx);
        return *created->list.at(i);
    }
};

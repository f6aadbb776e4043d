#pragma once
#include <deque>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

struct InboundMessage {
    std::string connector;
    std::string sender;
    std::string text;
    nlohmann::json reply_to = nlohmann::json::object();  // e.g. {connector, to, token}
    nlohmann::json metadata = nlohmann::json::object();
    std::string message_id;
};

// A messaging channel. listen() hands over the messages available right now
// and returns; it must not block waiting for new ones.
class Connector {
public:
    using Sink = std::function<void(const InboundMessage&)>;

    virtual ~Connector() = default;
    virtual std::string name() const = 0;
    virtual void listen(const Sink& sink) = 0;
    // Throws on delivery failure.
    virtual void send(const nlohmann::json& reply_to, const std::string& content,
                      const nlohmann::json& attachments) = 0;
    // {ok, channel, enabled}
    virtual nlohmann::json health() = 0;
};

// Local connector: messages are pushed in by the host program (or a test)
// and replies go to a callback.
class CliConnector : public Connector {
public:
    using SendFn = std::function<void(const nlohmann::json& reply_to, const std::string& content,
                                      const nlohmann::json& attachments)>;

    explicit CliConnector(std::string name = "cli", SendFn on_send = nullptr);

    // Queues a message; returns its generated message id.
    std::string push_inbound(const std::string& text, const std::string& sender = "local-user",
                             const nlohmann::json& metadata = nlohmann::json::object());

    std::string name() const override { return name_; }
    void listen(const Sink& sink) override;
    void send(const nlohmann::json& reply_to, const std::string& content,
              const nlohmann::json& attachments) override;
    nlohmann::json health() override;

    std::size_t pending() const;

private:
    std::string name_;
    SendFn on_send_;
    mutable std::mutex mu_;
    std::deque<InboundMessage> inbox_;
};

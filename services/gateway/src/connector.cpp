#include "connector.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

CliConnector::CliConnector(std::string name, SendFn on_send)
    : name_(to_lower(trim(name))), on_send_(std::move(on_send)) {
    if (name_.empty()) name_ = "cli";
}

std::string CliConnector::push_inbound(const std::string& text, const std::string& sender, const json& metadata) {
    InboundMessage msg;
    msg.connector = name_;
    msg.sender = sender;
    msg.text = text;
    msg.reply_to = {{"connector", name_}, {"to", sender}};
    msg.metadata = metadata.is_object() ? metadata : json::object();
    msg.message_id = gen_uuid();
    std::lock_guard<std::mutex> lk(mu_);
    inbox_.push_back(msg);
    return msg.message_id;
}

void CliConnector::listen(const Sink& sink) {
    std::deque<InboundMessage> batch;
    {
        std::lock_guard<std::mutex> lk(mu_);
        batch.swap(inbox_);
    }
    for (const auto& m : batch) sink(m);
}

void CliConnector::send(const json& reply_to, const std::string& content, const json& attachments) {
    if (on_send_) {
        on_send_(reply_to, content, attachments);
        return;
    }
    std::string to = "local-user";
    if (reply_to.is_object() && reply_to.contains("to") && reply_to["to"].is_string()) {
        to = reply_to["to"].get<std::string>();
    }
    spdlog::info("[{}] -> {}: {}", name_, to, content);
}

json CliConnector::health() {
    return {{"ok", true}, {"channel", name_}, {"enabled", true}};
}

std::size_t CliConnector::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return inbox_.size();
}

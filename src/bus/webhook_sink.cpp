#include "bus/webhook_sink.hpp"

#include <utility>

#include "httplib.h"
#include "utils/logging.hpp"

namespace filecron::bus {

WebhookSink::WebhookSink(std::string base_url, std::string path)
    : base_url_(std::move(base_url)), path_(path.empty() ? "/" : std::move(path)) {}

void WebhookSink::operator()(const ExecutionEvent& event) const {
    httplib::Client client(base_url_);
    client.set_connection_timeout(5, 0);
    client.set_read_timeout(10, 0);
    const auto body = event.ToJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto res = client.Post(path_.c_str(), body, "application/json");
    if (!res) {
        utils::LogWarn("notify", "webhook " + base_url_ + path_ + " unreachable: " +
                                     httplib::to_string(res.error()));
        return;
    }
    if (res->status >= 300) {
        utils::LogWarn("notify", "webhook " + base_url_ + path_ + " returned " + std::to_string(res->status));
    }
}

}  // namespace filecron::bus

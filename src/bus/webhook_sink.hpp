#pragma once

#include <string>

#include "bus/events.hpp"

namespace filecron::bus {

// POSTs each event as JSON to base_url + path. Failures are logged and dropped.
class WebhookSink {
public:
    WebhookSink(std::string base_url, std::string path);

    void operator()(const ExecutionEvent& event) const;

private:
    std::string base_url_;
    std::string path_;
};

}  // namespace filecron::bus

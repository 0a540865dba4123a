#include "ctxpack/llm/transport.hpp"

namespace ctxpack::llm {

Json LLMRequest::to_json() const {
    Json j = {
        {"model", model},
        {"stream", stream}
    };

    if (system) {
        j["system"] = *system;
    }

    Json msgs = Json::array();
    for (const auto& msg : messages) {
        msgs.push_back(msg.to_json());
    }
    j["messages"] = std::move(msgs);

    if (!tools.empty()) {
        Json tool_list = Json::array();
        for (const auto& tool : tools) {
            tool_list.push_back(tool.to_json());
        }
        j["tools"] = std::move(tool_list);
    }

    if (max_tokens) {
        j["max_tokens"] = *max_tokens;
    }
    if (temperature) {
        j["temperature"] = *temperature;
    }
    if (!extra.empty()) {
        j["extra"] = extra;
    }
    return j;
}

}  // namespace ctxpack::llm

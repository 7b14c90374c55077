#pragma once
#include <deque>
#include <mutex>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

namespace receipt_assistant {

struct ToolTrace {
    long long timestamp_ms;
    std::string session_id;
    std::string tool_name;
    std::string outcome;     // "ok" or an ErrorCode name
    double duration_ms;
};

// Bounded ring of recent tool invocations for the admin endpoint.
class LogManager {
public:
    explicit LogManager(size_t capacity = 200) : capacity_(capacity) {}

    void add_trace(const ToolTrace& trace) {
        std::lock_guard<std::mutex> lock(mtx_);
        traces_.push_back(trace);
        while (traces_.size() > capacity_) {
            traces_.pop_front();
        }
    }

    std::vector<ToolTrace> recent() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return std::vector<ToolTrace>(traces_.rbegin(), traces_.rend());
    }

    // Newest first.
    nlohmann::json get_traces_json() const {
        nlohmann::json j_list = nlohmann::json::array();
        for (const auto& t : recent()) {
            j_list.push_back({
                {"timestamp_ms", t.timestamp_ms},
                {"session_id", t.session_id},
                {"tool", t.tool_name},
                {"outcome", t.outcome},
                {"duration_ms", t.duration_ms}
            });
        }
        return j_list;
    }

private:
    size_t capacity_;
    std::deque<ToolTrace> traces_;
    mutable std::mutex mtx_;
};

} // namespace receipt_assistant

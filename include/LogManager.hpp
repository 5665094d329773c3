#pragma once
#include <deque>
#include <mutex>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

namespace graph_rag {

struct InteractionLog {
    long long timestamp;
    std::string question;
    std::vector<std::string> entities;
    size_t fact_count;
    std::string full_prompt;  // empty when generation was skipped
    std::string answer;
    bool generated;           // true only when the LLM produced the answer
    double duration_ms;
};

class LogManager {
public:
    static constexpr size_t kMaxLogs = 50;

    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_log(const InteractionLog& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(log);
        if (logs_.size() > kMaxLogs) {
            logs_.pop_front();
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return logs_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.clear();
    }

    // Newest first.
    nlohmann::json get_logs_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j_list = nlohmann::json::array();
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"question", it->question},
                {"entities", it->entities},
                {"fact_count", it->fact_count},
                {"full_prompt", it->full_prompt},
                {"answer", it->answer},
                {"generated", it->generated},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

private:
    LogManager() {}
    std::deque<InteractionLog> logs_;
    mutable std::mutex mtx_;
};

} // namespace graph_rag

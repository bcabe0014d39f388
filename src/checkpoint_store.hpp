#pragma once
#include "utils.hpp"
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolguard {

struct CheckpointRecord {
    std::string id;
    std::string task_id;
    std::string trigger;   // auto_iteration, auto_work_product, auto_stop, manual
    std::string phase;     // iteration, iteration_failed, status_change, ...
    nlohmann::json context = nlohmann::json::object();
    std::string created_at;

    nlohmann::json to_json() const {
        return {{"id", id}, {"task_id", task_id}, {"trigger", trigger}, {"phase", phase},
                {"context", context}, {"created_at", created_at}};
    }

    static CheckpointRecord from_json(const nlohmann::json& j) {
        CheckpointRecord r;
        r.id = j.value("id", "");
        r.task_id = j.value("task_id", "");
        r.trigger = j.value("trigger", "");
        r.phase = j.value("phase", "");
        if (j.contains("context")) r.context = j["context"];
        r.created_at = j.value("created_at", "");
        return r;
    }
};

// Persistence seam for automatic checkpoints. Implementations may throw;
// callers treat every failure as non-fatal.
class CheckpointStore {
public:
    virtual ~CheckpointStore() = default;

    // Returns the new checkpoint id
    virtual std::string create_checkpoint(const std::string& task_id, const std::string& trigger,
                                          const std::string& phase, const nlohmann::json& context) = 0;
};

// Appends one JSON line per checkpoint
class JsonlCheckpointStore : public CheckpointStore {
public:
    explicit JsonlCheckpointStore(const std::string& path) : path_(expand_path(path)) {
        auto parent = fs::path(path_).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
    }

    std::string create_checkpoint(const std::string& task_id, const std::string& trigger,
                                  const std::string& phase, const nlohmann::json& context) override {
        CheckpointRecord r;
        r.id = "cp-" + to_base36(static_cast<uint64_t>(epoch_ms())) + "-" + random_base36(6);
        r.task_id = task_id;
        r.trigger = trigger;
        r.phase = phase;
        r.context = context;
        r.created_at = now_iso8601();

        std::lock_guard<std::mutex> lock(mutex_);
        std::ofstream f(path_, std::ios::app);
        if (!f) throw std::runtime_error("Cannot open checkpoint file: " + path_);
        f << r.to_json().dump() << "\n";
        return r.id;
    }

    std::vector<CheckpointRecord> load(const std::string& task_id = "") const {
        std::vector<CheckpointRecord> result;
        std::lock_guard<std::mutex> lock(mutex_);
        std::ifstream f(path_);
        if (!f) return result;

        std::string line;
        while (std::getline(f, line)) {
            if (line.empty()) continue;
            try {
                auto r = CheckpointRecord::from_json(nlohmann::json::parse(line));
                if (task_id.empty() || r.task_id == task_id) result.push_back(std::move(r));
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[checkpoint] Skipping malformed line: " << e.what() << "\n";
            }
        }
        return result;
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace toolguard

// backend_cpp/include/memory/FeedbackVault.hpp
#pragma once
#include <chrono>
#include <fstream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "collaborators.hpp"

namespace merlt {

struct ArchivedFeedback {
    FeedbackRecord record;
    double authority = 0.0;
    long long archived_at = 0;
};

// Append-only archive of consumed feedback. Each record is appended to a JSONL file
// the training-set exporter picks up; the in-memory copy serves recent lookups.
class FeedbackVault : public FeedbackArchive {
public:
    explicit FeedbackVault(std::string storage_path = "") : path_(std::move(storage_path)) {}

    void archive(const FeedbackRecord& record, double authority) override {
        std::lock_guard<std::mutex> lock(mtx_);

        ArchivedFeedback entry{record, authority,
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count()};
        entries_.push_back(entry);

        if (!path_.empty()) {
            std::ofstream out(path_, std::ios::app);
            if (!out.is_open()) {
                spdlog::error("Feedback archive {} is not writable, record {} kept in memory only",
                              path_, record.feedback_id);
                return;
            }
            auto j = record.to_json();
            j["authority"] = authority;
            j["archived_at"] = entry.archived_at;
            out << j.dump() << "\n";
        }
        spdlog::debug("🧠 Feedback Vault: archived {} (authority {:.2f})", record.feedback_id, authority);
    }

    std::vector<ArchivedFeedback> entries() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return entries_;
    }

private:
    std::string path_;
    std::vector<ArchivedFeedback> entries_;
    mutable std::mutex mtx_;
};

} // namespace merlt

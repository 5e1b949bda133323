#pragma once

#include "store/inventory_store.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace devicelink {
namespace test {

// Inventory store mock: records every call; flushes resolve according to
// flush_mode so tests can drive success, failure or a hung store.
class MockInventoryStore : public store::InventoryStore {
public:
    enum class FlushMode { Immediate, Fail, Manual };

    std::atomic<bool> fail_initial{false};
    std::atomic<bool> fail_submit_node{false};
    std::atomic<FlushMode> flush_mode{FlushMode::Immediate};

    bool SubmitInitial(const store::InventoryRoot &root) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++initial_calls_;
        initial_node_count_ = root.nodes.size();
        return !fail_initial.load();
    }

    bool SubmitNode(const store::NodeRecord &record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_submit_node.load()) {
            return false;
        }
        nodes_[record.node_id] = record;
        return true;
    }

    util::PendingOperationPtr FlushAndClose(const std::string &node_id) override {
        auto op = std::make_shared<util::PendingOperation>();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            flushes_[node_id].push_back(op);
            nodes_.erase(node_id);
        }
        switch (flush_mode.load()) {
        case FlushMode::Immediate:
            op->Complete(util::PendingOperation::Outcome::Success);
            break;
        case FlushMode::Fail:
            op->Complete(util::PendingOperation::Outcome::Failure, "simulated store failure");
            break;
        case FlushMode::Manual:
            break;
        }
        return op;
    }

    // Resolve the latest flush for node_id (Manual mode)
    bool CompleteFlush(const std::string &node_id,
                       util::PendingOperation::Outcome outcome = util::PendingOperation::Outcome::Success) {
        util::PendingOperationPtr op = LatestFlush(node_id);
        return op && op->Complete(outcome);
    }

    util::PendingOperationPtr LatestFlush(const std::string &node_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = flushes_.find(node_id);
        if (it == flushes_.end() || it->second.empty()) {
            return nullptr;
        }
        return it->second.back();
    }

    size_t flush_count(const std::string &node_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = flushes_.find(node_id);
        return it == flushes_.end() ? 0 : it->second.size();
    }

    bool has_node(const std::string &node_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return nodes_.count(node_id) > 0;
    }

    int initial_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return initial_calls_;
    }

private:
    mutable std::mutex mutex_;
    int initial_calls_{0};
    size_t initial_node_count_{0};
    std::map<std::string, store::NodeRecord> nodes_;
    std::map<std::string, std::vector<util::PendingOperationPtr>> flushes_;
};

} // namespace test
} // namespace devicelink

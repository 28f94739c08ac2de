#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <future>
#include <chrono>
#include <condition_variable>
#include <gtest/gtest.h>
#include <configuration/engine.hpp>
#include <configuration/ansible_host.hpp>
#include <inventory/inventory_store.hpp>
#include <inventory/node_registry.hpp>

// Scripted configuration engine. Each run replays `lines` and finishes with
// `result`, or stays running until release() or its cancel trigger when
// `block` is set.
class FakeEngine : public ConfigurationEngine {
public:
    struct Script {
        std::vector<std::string> lines;
        Result<void> result = Result<void>::Ok();
        bool block = false;
    };

    struct Call {
        std::string kind;                                   // "configure" or "cleanup"
        std::vector<std::string> tags;
        std::map<std::string, std::string> groups;          // tag -> group
        std::map<std::string, std::map<std::string, std::string>> vars;
        std::string extra_vars;
    };

    Script configure_script;
    Script cleanup_script;

    EngineRun configure(const HostList& hosts, const std::string& extra_vars) override {
        return start("configure", configure_script, hosts, extra_vars);
    }

    EngineRun cleanup(const HostList& hosts, const std::string& extra_vars) override {
        return start("cleanup", cleanup_script, hosts, extra_vars);
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t count(const std::string& kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& c : calls_) {
            if (c.kind == kind) n++;
        }
        return n;
    }

    int cancel_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancels_;
    }

    // Wait until a blocking run is in progress
    bool wait_blocked(int timeout_ms = 5000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [this] { return pending_ && !pending_->finished; });
    }

    // Finish the blocking run
    void release(Result<void> result = Result<void>::Ok()) {
        std::shared_ptr<Pending> p;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            p = pending_;
        }
        if (p) finish(p, result);
    }

private:
    struct Pending {
        std::shared_ptr<LineBufferStream> output;
        std::promise<Result<void>> promise;
        bool finished = false;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Call> calls_;
    std::shared_ptr<Pending> pending_;
    int cancels_ = 0;

    EngineRun start(const std::string& kind, const Script& script,
                    const HostList& hosts, const std::string& extra_vars) {
        Call call;
        call.kind = kind;
        call.extra_vars = extra_vars;
        for (const auto& h : hosts) {
            call.tags.push_back(h->tag());
            call.groups[h->tag()] = h->group();
            call.vars[h->tag()] = h->vars();
        }

        auto p = std::make_shared<Pending>();
        p->output = std::make_shared<LineBufferStream>(script.lines, !script.block);

        EngineRun run;
        run.output = p->output;
        run.done = p->promise.get_future().share();
        run.cancel = [this, p] {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                cancels_++;
            }
            finish(p, Result<void>::Err(ErrorCode::Configuration, "terminated"));
        };

        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(call);
            if (script.block) pending_ = p;
        }
        if (script.block) {
            cv_.notify_all();
        } else {
            finish(p, script.result);
        }
        return run;
    }

    void finish(const std::shared_ptr<Pending>& p, const Result<void>& result) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (p->finished) return;
            p->finished = true;
        }
        p->output->close();
        p->promise.set_value(result);
        cv_.notify_all();
    }
};

// In-memory inventory with injectable failures
class FakeTracker : public AssetTracker {
public:
    InventoryStore store;
    std::set<std::string> fail_status;
    std::set<std::string> fail_set;

    Result<AssetStatus> status(const std::string& name) override {
        if (fail_status.count(name)) {
            return Result<AssetStatus>::Err("injected status failure");
        }
        return store.status(name);
    }

    Result<void> set_unallocated(const std::string& name) override {
        if (fail_set.count(name)) return Result<void>::Err("injected update failure");
        return store.set_unallocated(name);
    }

    Result<void> set_provisioning(const std::string& name) override {
        if (fail_set.count(name)) return Result<void>::Err("injected update failure");
        return store.set_provisioning(name);
    }

    Result<void> set_commissioned(const std::string& name) override {
        if (fail_set.count(name)) return Result<void>::Err("injected update failure");
        return store.set_commissioned(name);
    }

    AssetStatus status_of(const std::string& name) {
        return store.status(name).value;
    }
};

// Register a node with its Ansible host record and inventory asset
inline void add_test_node(NodeRegistry& nodes, InventoryStore& store,
                          const std::string& name, const std::string& addr,
                          AssetStatus status = AssetStatus::Unallocated,
                          const std::string& group = "",
                          MonitorState state = MonitorState::Discovered,
                          const std::string& tag = "") {
    Node node;
    node.name = name;
    node.mgmt_address = addr;
    node.mon_state = state;
    node.cfg = std::make_shared<AnsibleHost>(tag.empty() ? name : tag, addr, group);
    EXPECT_TRUE(nodes.upsert(node).is_ok());
    EXPECT_TRUE(store.add_asset(name, status).is_ok());
}

#pragma once

#include <atomic>
#include <memory>

// Cooperative cancellation flag shared between a job's owner and its runner.
class CancelToken {
public:
    void cancel() { canceled_.store(true); }
    bool canceled() const { return canceled_.load(); }

private:
    std::atomic<bool> canceled_{false};
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

#pragma once

#include "document_executor.hpp"
#include "host_capability.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

/// HostCapability double that records every call.
class FakeHost final : public modelbridge::HostCapability {
public:
    using ExecuteFn = std::function<modelbridge::CommandResult(const std::string&, const modelbridge::json&)>;

    bool has_active_document() const override { return document_open.load(); }
    modelbridge::CommandResult execute(const std::string& operation, const modelbridge::json& params) override;
    void run_on_document_context(Work work) override { executor.post(std::move(work)); }

    std::vector<std::string> executed_operations();

    std::atomic<bool> document_open{true};
    std::atomic<int> execute_calls{0};
    std::atomic<int> max_concurrent{0};
    std::chrono::milliseconds execute_delay{0};
    ExecuteFn on_execute;

private:
    std::atomic<int> active_{0};
    std::mutex executed_mutex_;
    std::vector<std::string> executed_;

public:
    // last member: the worker stops before the state above is destroyed
    modelbridge::DocumentExecutor executor;
};

/// Returns a loopback port that nothing is listening on right now.
int unused_local_port();

/// Polls @p condition until it holds or @p timeout elapses.
bool wait_until(const std::function<bool()>& condition,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

// tests/test_support.h
#ifndef AGENTFLOW_TESTS_TEST_SUPPORT_H
#define AGENTFLOW_TESTS_TEST_SUPPORT_H

#include "common/config/engine_config.h"
#include "modules/executor/sandbox.h"
#include "modules/store/workflow_record_store.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace agentflow::testing {

// Scripted sandbox: handlers keyed by the exact code string; unknown code echoes {"code": ...}
class FakeSandbox : public SandboxExecutor {
public:
    using Handler = std::function<SandboxResult(const Context&, const SandboxOptions&)>;

    void on(const std::string& code, Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[code] = std::move(handler);
    }

    void returns(const std::string& code, Value value) {
        on(code, [value](const Context&, const SandboxOptions&) {
            SandboxResult r;
            r.success = true;
            r.result = value;
            r.elapsed_ms = 1.0;
            return r;
        });
    }

    void fails(const std::string& code, std::string type, std::string message) {
        on(code, [type, message](const Context&, const SandboxOptions&) {
            SandboxResult r;
            r.error = SandboxError{type, message};
            return r;
        });
    }

    SandboxResult execute(const std::string& code, const Context& context, const SandboxOptions& options) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_[code]++;
            last_context_ = context;
            last_options_ = options;
            auto it = handlers_.find(code);
            if (it != handlers_.end()) handler = it->second;
        }
        if (handler) return handler(context, options);
        SandboxResult r;
        r.success = true;
        r.result = Value{{"code", code}};
        return r;
    }

    int calls(const std::string& code) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(code);
        return it == calls_.end() ? 0 : it->second;
    }

    Context last_context() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_context_;
    }

    SandboxOptions last_options() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_options_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Handler> handlers_;
    std::map<std::string, int> calls_;
    Context last_context_;
    SandboxOptions last_options_;
};

class FakeCapabilityStore : public CapabilityStore {
public:
    void add(CapabilityRecord record) { records_[record.id] = std::move(record); }

    std::optional<CapabilityRecord> find_by_id(const std::string& id) override {
        lookups++;
        auto it = records_.find(id);
        if (it == records_.end()) return std::nullopt;
        return it->second;
    }

    std::atomic<int> lookups{0};

private:
    std::map<std::string, CapabilityRecord> records_;
};

// Controllable clock for TTL tests
struct ManualClock {
    TimePoint current = from_epoch_ms(1700000000000);

    Clock clock() {
        return [this] { return current; };
    }
    void advance(std::chrono::seconds by) { current += by; }
};

// Short retry backoff so failing safe tasks do not slow the suite down
inline EngineConfig fast_config() {
    EngineConfig config;
    config.scheduler.retry_backoff_ms = 1;
    config.scheduler.checkpoint_retention = 20;
    config.log_level = "warning";
    return config;
}

} // namespace agentflow::testing

#endif // AGENTFLOW_TESTS_TEST_SUPPORT_H

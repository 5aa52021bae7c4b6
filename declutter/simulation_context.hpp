#ifndef NETDECLUTTER_DECLUTTER_SIMULATION_CONTEXT_HPP
#define NETDECLUTTER_DECLUTTER_SIMULATION_CONTEXT_HPP

#include <algorithm>
#include <atomic>
#include <functional>
#include <string>
#include <utility>

namespace netdeclutter {

// Progress report for the driving engine
struct ProgressInfo {
    bool indeterminate = true;
    double fraction = 0.0;        // In [0, 1]; meaningless when indeterminate
    std::string label;

    static ProgressInfo indeterminate_progress(std::string label) {
        return ProgressInfo{true, 0.0, std::move(label)};
    }

    static ProgressInfo determinate(double fraction, std::string label) {
        return ProgressInfo{false, std::clamp(fraction, 0.0, 1.0), std::move(label)};
    }
};

using MessageCallback = std::function<void(const std::string&)>;
using ProgressCallback = std::function<void(const ProgressInfo&)>;
using RefreshCallback = std::function<void()>;

// Services provided by the engine. Any of them may be left unset.
struct EngineCallbacks {
    MessageCallback post_message = nullptr;
    ProgressCallback post_progress = nullptr;
    RefreshCallback request_refresh = nullptr;
};

// Per-run context handed to init/step/cancel by the driver.
// Notifications are fire-and-forget; unset callbacks are no-ops.
class SimulationContext {
public:
    SimulationContext() = default;
    explicit SimulationContext(EngineCallbacks callbacks)
        : callbacks_(std::move(callbacks)) {}

    // Cooperative cancellation, safe from any thread
    void request_cancel() { cancel_requested_.store(true); }
    bool is_cancel_requested() const { return cancel_requested_.load(); }

    // Steps taken by the driver in this context
    long step_count() const { return step_count_.load(); }
    void increment_step() { step_count_.fetch_add(1); }

    void post_message(const std::string& text) const {
        if (callbacks_.post_message) {
            callbacks_.post_message(text);
        }
    }

    void post_progress(const ProgressInfo& progress) const {
        if (callbacks_.post_progress) {
            callbacks_.post_progress(progress);
        }
    }

    void request_refresh() const {
        if (callbacks_.request_refresh) {
            callbacks_.request_refresh();
        }
    }

private:
    EngineCallbacks callbacks_;
    std::atomic<bool> cancel_requested_{false};
    std::atomic<long> step_count_{0};
};

}  // namespace netdeclutter

#endif // NETDECLUTTER_DECLUTTER_SIMULATION_CONTEXT_HPP

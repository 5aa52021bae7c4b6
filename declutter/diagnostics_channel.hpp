#ifndef NETDECLUTTER_DECLUTTER_DIAGNOSTICS_CHANNEL_HPP
#define NETDECLUTTER_DECLUTTER_DIAGNOSTICS_CHANNEL_HPP

#include "diagnostics.hpp"
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace netdeclutter {

// Unbounded FIFO carrying samples from the stepping thread to an observer.
// Push never waits on the consumer; draining promptly is the caller's job.
class DiagnosticsChannel {
public:
    void push(const DiagnosticsSample& sample) {
        std::lock_guard<std::mutex> lock(mutex_);
        samples_.push_back(sample);
    }

    std::optional<DiagnosticsSample> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (samples_.empty()) {
            return std::nullopt;
        }
        DiagnosticsSample sample = samples_.front();
        samples_.pop_front();
        return sample;
    }

    // Pop until empty, oldest first
    std::vector<DiagnosticsSample> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<DiagnosticsSample> result(samples_.begin(), samples_.end());
        samples_.clear();
        return result;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return samples_.size();
    }

    bool empty() const {
        return size() == 0;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        samples_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::deque<DiagnosticsSample> samples_;
};

}  // namespace netdeclutter

#endif // NETDECLUTTER_DECLUTTER_DIAGNOSTICS_CHANNEL_HPP

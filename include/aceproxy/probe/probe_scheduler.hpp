// AceProxy - AceStream Multiplexing Proxy
// Probe Scheduler - Periodic background probe cycles

#ifndef ACEPROXY_PROBE_PROBE_SCHEDULER_HPP
#define ACEPROXY_PROBE_PROBE_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

#include "aceproxy/core/context.hpp"
#include "aceproxy/core/structured_logger.hpp"
#include "aceproxy/probe/probe_service.hpp"

namespace aceproxy {
namespace probe {

/**
 * @brief Runs ProbeService::probeAllStreams on a fixed interval.
 *
 * The first cycle runs immediately on start(). stop() cancels an
 * in-flight cycle and returns once the worker thread has exited.
 */
class ProbeScheduler {
public:
    ProbeScheduler(
        std::shared_ptr<ProbeService> service,
        std::chrono::milliseconds interval,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );
    ~ProbeScheduler();

    ProbeScheduler(const ProbeScheduler&) = delete;
    ProbeScheduler& operator=(const ProbeScheduler&) = delete;

    /**
     * @return false if already running
     */
    bool start();
    void stop();

    bool isRunning() const { return running_.load(); }
    uint64_t completedCycles() const { return completedCycles_.load(); }

private:
    void run();

    std::shared_ptr<ProbeService> service_;
    const std::chrono::milliseconds interval_;
    std::shared_ptr<core::StructuredLogger> logger_;

    std::mutex lifecycleMutex_;
    std::thread worker_;
    std::unique_ptr<core::Context> context_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> completedCycles_{0};
};

} // namespace probe
} // namespace aceproxy

#endif // ACEPROXY_PROBE_PROBE_SCHEDULER_HPP

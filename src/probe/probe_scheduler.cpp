// AceProxy - AceStream Multiplexing Proxy
// Probe Scheduler Implementation

#include "aceproxy/probe/probe_scheduler.hpp"

namespace aceproxy {
namespace probe {

namespace {
const char* const kCategory = "ProbeScheduler";
}

ProbeScheduler::ProbeScheduler(
    std::shared_ptr<ProbeService> service,
    std::chrono::milliseconds interval,
    std::shared_ptr<core::StructuredLogger> logger)
    : service_(std::move(service))
    , interval_(interval)
    , logger_(std::move(logger))
{
}

ProbeScheduler::~ProbeScheduler() {
    stop();
}

bool ProbeScheduler::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (running_.load()) {
        return false;
    }

    context_ = std::make_unique<core::Context>();
    running_.store(true);
    worker_ = std::thread(&ProbeScheduler::run, this);

    if (logger_) {
        logger_->info("Probe scheduler started, interval " +
                      std::to_string(interval_.count()) + "ms", kCategory);
    }
    return true;
}

void ProbeScheduler::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!running_.load()) {
        return;
    }

    context_->cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
    context_.reset();
    running_.store(false);

    if (logger_) {
        logger_->info("Probe scheduler stopped", kCategory);
    }
}

void ProbeScheduler::run() {
    core::Context& ctx = *context_;

    while (!ctx.isDone()) {
        auto cycle = service_->probeAllStreams(ctx);
        if (cycle.isError()) {
            if (cycle.error().code == core::ErrorCode::Cancelled) {
                break;
            }
            if (logger_) {
                logger_->error("Probe cycle failed: " + cycle.error().toString(), kCategory);
            }
        }
        completedCycles_.fetch_add(1);

        if (!ctx.sleepFor(interval_)) {
            break;
        }
    }
}

} // namespace probe
} // namespace aceproxy

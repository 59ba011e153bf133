// AceProxy - AceStream Multiplexing Proxy
// Client ID Generator Implementation

#include "aceproxy/streaming/client_id_generator.hpp"

#include <chrono>

namespace aceproxy {
namespace streaming {

ClientIdGenerator::ClientIdGenerator()
    : ClientIdGenerator(static_cast<uint64_t>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(
              core::SystemClock::now().time_since_epoch()).count())) {
}

ClientIdGenerator::ClientIdGenerator(uint64_t seed)
    : counter_(seed) {
}

ClientIdGenerator& ClientIdGenerator::shared() {
    static ClientIdGenerator instance;
    return instance;
}

core::ClientId ClientIdGenerator::next() {
    return "pid-" + std::to_string(counter_.fetch_add(1, std::memory_order_relaxed) + 1);
}

} // namespace streaming
} // namespace aceproxy

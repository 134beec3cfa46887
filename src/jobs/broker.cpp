#include "jobs/broker.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include <thread>

namespace strata {
namespace jobs {

BrokerConnection::BrokerConnection(Factory factory, int attempts,
                                   std::chrono::milliseconds wait, Sleeper sleeper)
    : factory_(std::move(factory)),
      attempts_(attempts > 0 ? attempts : 1),
      wait_(wait),
      sleeper_(std::move(sleeper)) {
    if (!factory_) {
        throw ValidationError("BrokerConnection requires a broker factory");
    }
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

BrokerConnection::~BrokerConnection() {
    shutdown();
}

std::shared_ptr<Broker> BrokerConnection::get() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (broker_) return broker_;

    for (int attempt = 1; ; ++attempt) {
        try {
            auto broker = factory_();
            if (!broker) {
                throw BrokerUnavailableError("Broker factory returned no broker");
            }
            broker->ping();
            broker_ = std::move(broker);
            if (attempt > 1) {
                STRATA_INFO("Broker connected after {} attempts", attempt);
            }
            return broker_;
        } catch (const BrokerUnavailableError& e) {
            if (attempt >= attempts_) {
                STRATA_ERROR("Broker unavailable after {} attempts: {}", attempt, e.what());
                throw;
            }
            STRATA_WARN("Broker unavailable (attempt {}/{}): {}", attempt, attempts_, e.what());
        }
        sleeper_(wait_);
    }
}

bool BrokerConnection::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return broker_ != nullptr;
}

void BrokerConnection::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (broker_) {
        STRATA_DEBUG("Releasing broker connection");
        broker_.reset();
    }
}

} // namespace jobs
} // namespace strata

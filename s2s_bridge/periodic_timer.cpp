#include "periodic_timer.h"
#include "log.h"

namespace s2s_bridge {

AsioPeriodicTimer::AsioPeriodicTimer(boost::asio::io_context& ioc)
    : timer_(ioc)
    , generation_(std::make_shared<unsigned>(0))
{
}

AsioPeriodicTimer::~AsioPeriodicTimer() {
    cancel();
}

void AsioPeriodicTimer::start(int interval_ms, TickCallback cb) {
    cancel();
    if (interval_ms <= 0 || !cb) {
        S2S_LOG_ERROR("AsioPeriodicTimer: refusing to start with interval %d ms\n", interval_ms);
        return;
    }

    interval_ = std::chrono::milliseconds(interval_ms);
    cb_       = std::move(cb);
    running_  = true;

    timer_.expires_after(interval_);
    schedule();
}

void AsioPeriodicTimer::cancel() {
    if (!running_) return;
    running_ = false;
    ++(*generation_);
    timer_.cancel();
    cb_ = nullptr;
}

void AsioPeriodicTimer::schedule() {
    std::weak_ptr<unsigned> weak_gen = generation_;
    const unsigned gen = *generation_;

    timer_.async_wait([this, weak_gen, gen](const boost::system::error_code& ec) {
        auto live = weak_gen.lock();
        if (!live || *live != gen) return;
        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                S2S_LOG_ERROR("AsioPeriodicTimer: wait failed: %s\n", ec.message().c_str());
            }
            return;
        }

        timer_.expires_at(timer_.expiry() + interval_);
        schedule();

        /* the callback may cancel (or destroy) this timer */
        TickCallback cb = cb_;
        if (cb) cb();
    });
}

std::unique_ptr<IPeriodicTimer> AsioTimerFactory::create_timer() {
    return std::make_unique<AsioPeriodicTimer>(ioc_);
}

}

#ifndef S2S_BRIDGE_PERIODIC_TIMER_H
#define S2S_BRIDGE_PERIODIC_TIMER_H

#include <functional>
#include <memory>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace s2s_bridge {

using TickCallback = std::function<void()>;

class IPeriodicTimer {
public:
    virtual ~IPeriodicTimer() = default;
    virtual void start(int interval_ms, TickCallback cb) = 0;
    /* Idempotent. No tick is delivered after cancel() returns. */
    virtual void cancel() = 0;
    virtual bool is_running() const = 0;
};

class ITimerFactory {
public:
    virtual ~ITimerFactory() = default;
    virtual std::unique_ptr<IPeriodicTimer> create_timer() = 0;
};

/*
 * Fixed-rate timer on an io_context. Each expiry is scheduled relative to the
 * previous one (not to when the handler ran) so the cadence does not drift.
 */
class AsioPeriodicTimer : public IPeriodicTimer {
public:
    explicit AsioPeriodicTimer(boost::asio::io_context& ioc);
    ~AsioPeriodicTimer() override;

    AsioPeriodicTimer(const AsioPeriodicTimer&) = delete;
    AsioPeriodicTimer& operator=(const AsioPeriodicTimer&) = delete;

    void start(int interval_ms, TickCallback cb) override;
    void cancel() override;
    bool is_running() const override { return running_; }

private:
    boost::asio::steady_timer               timer_;
    std::chrono::milliseconds               interval_{0};
    TickCallback                            cb_;
    bool                                    running_ = false;
    /* bumped on cancel so handlers already queued by asio become no-ops */
    std::shared_ptr<unsigned>               generation_;

    void schedule();
};

class AsioTimerFactory : public ITimerFactory {
public:
    explicit AsioTimerFactory(boost::asio::io_context& ioc) : ioc_(ioc) {}
    std::unique_ptr<IPeriodicTimer> create_timer() override;

private:
    boost::asio::io_context& ioc_;
};

}

#endif

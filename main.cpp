#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include "s2s_bridge.h"
#include "http_stream_glue.h"
#include "s2s_bridge/bridge_config.h"
#include "s2s_bridge/log.h"

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;

    if (s2s_bridge::load_env_file(S2S_ENV_FILE)) {
        S2S_LOG_DEBUG("loaded environment from %s\n", S2S_ENV_FILE);
    }

    s2s_bridge::BridgeConfig cfg = s2s_bridge::load_bridge_config_from_env();
    s2s_bridge::set_log_level(cfg.log_level);

    if (cfg.ws_url_override.empty()) {
        S2S_LOG_INFO("using Live model %s\n", cfg.model.c_str());
    } else {
        S2S_LOG_INFO("using explicit endpoint %s\n", cfg.ws_url_override.c_str());
    }

    boost::asio::io_context ioc;

    auto server = std::make_shared<HttpStreamServer>(ioc, cfg);
    std::string error;
    if (!server->start(error)) {
        S2S_LOG_ERROR("%s\n", error.c_str());
        return EXIT_FAILURE;
    }

    boost::asio::steady_timer grace(ioc);
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        S2S_LOG_INFO("signal %d received, shutting down\n", signo);
        server->stop();
        grace.expires_after(std::chrono::milliseconds(S2S_SHUTDOWN_GRACE_MS));
        grace.async_wait([&ioc](const boost::system::error_code& wait_ec) {
            if (!wait_ec) ioc.stop();
        });
    });

    ioc.run();
    S2S_LOG_INFO("%s stopped\n", S2S_BRIDGE_NAME);
    return EXIT_SUCCESS;
}

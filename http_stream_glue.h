#ifndef HTTP_STREAM_GLUE_H
#define HTTP_STREAM_GLUE_H

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/uuid/random_generator.hpp>
#include "s2s_bridge.h"
#include "s2s_bridge/bridge_config.h"
#include "s2s_bridge/periodic_timer.h"
#include "s2s_bridge/remote_transport.h"

class StreamConnection;

using TransportFactory =
    std::function<std::shared_ptr<s2s_bridge::IRemoteTransport>(boost::asio::io_context&)>;

/*
 * Accepts POST S2S_STREAM_PATH and runs one StreamController per request.
 * Everything, including the controllers, lives on the one io_context.
 */
class HttpStreamServer : public std::enable_shared_from_this<HttpStreamServer> {
public:
    HttpStreamServer(boost::asio::io_context& ioc, const s2s_bridge::BridgeConfig& cfg);

    HttpStreamServer(const HttpStreamServer&) = delete;
    HttpStreamServer& operator=(const HttpStreamServer&) = delete;

    /* Defaults to create_remote_transport(cfg, ioc). */
    void set_transport_factory(TransportFactory factory) { transport_factory_ = std::move(factory); }

    bool start(std::string& error);
    /* Stops accepting and closes open connections; their sessions tear down. */
    void stop();

    unsigned short port() const;

private:
    boost::asio::io_context&                     ioc_;
    s2s_bridge::BridgeConfig                     cfg_;
    boost::asio::ip::tcp::acceptor               acceptor_;
    std::shared_ptr<s2s_bridge::ITimerFactory>   timers_;
    TransportFactory                             transport_factory_;
    boost::uuids::random_generator               uuid_gen_;
    std::vector<std::weak_ptr<StreamConnection>> connections_;
    bool                                         stopped_ = false;

    void do_accept();
    void on_accept(const boost::system::error_code& ec, boost::asio::ip::tcp::socket socket);
};

#endif // HTTP_STREAM_GLUE_H

#include "http_stream_glue.h"
#include "s2s_bridge/log.h"
#include "s2s_bridge/stream_controller.h"
#include <algorithm>
#include <array>
#include <chrono>
#include <deque>
#include <limits>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/optional.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using s2s_bridge::AudioBytes;
using s2s_bridge::StreamController;

class StreamConnection : public std::enable_shared_from_this<StreamConnection> {
public:
    StreamConnection(net::io_context& ioc, tcp::socket socket,
                     const s2s_bridge::BridgeConfig& cfg,
                     std::shared_ptr<s2s_bridge::ITimerFactory> timers,
                     const TransportFactory& transport_factory, std::string session_id)
        : ioc_(ioc)
        , stream_(std::move(socket))
        , cfg_(cfg)
        , timers_(std::move(timers))
        , transport_factory_(transport_factory)
        , session_id_(std::move(session_id))
    {
    }

    void run() {
        parser_.emplace();
        parser_->body_limit((std::numeric_limits<std::uint64_t>::max)());
        stream_.expires_after(std::chrono::seconds(S2S_HEADER_TIMEOUT_SECS));

        auto self = shared_from_this();
        http::async_read_header(stream_, buffer_, *parser_,
            [self](const beast::error_code& ec, std::size_t) { self->on_header(ec); });
    }

    void close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        stream_.socket().close(ec);
    }

    /* IClientResponse side, see ConnectionResponse below */
    void queue_header() { queue(PendingWrite::HEADER); }
    void queue_chunk(AudioBytes&& data) { queue(PendingWrite::CHUNK, std::move(data)); }
    void queue_last() { queue(PendingWrite::LAST); }
    void queue_full(int status) { queue(PendingWrite::FULL, AudioBytes(), status); }

private:
    struct PendingWrite {
        enum Kind { CONTINUE, HEADER, CHUNK, LAST, FULL } kind;
        AudioBytes data;
        int        status = 200;
    };

    net::io_context&                                     ioc_;
    beast::tcp_stream                                    stream_;
    beast::flat_buffer                                   buffer_;
    boost::optional<http::request_parser<http::buffer_body>> parser_;
    std::array<char, S2S_BODY_CHUNK_BYTES>               body_buf_;
    s2s_bridge::BridgeConfig                             cfg_;
    std::shared_ptr<s2s_bridge::ITimerFactory>           timers_;
    TransportFactory                                     transport_factory_;
    std::string                                          session_id_;
    std::shared_ptr<StreamController>                    controller_;

    std::deque<PendingWrite>                             writes_;
    std::unique_ptr<http::response<http::empty_body>>    res_;
    std::unique_ptr<http::response_serializer<http::empty_body>> sr_;
    bool                                                 writing_  = false;
    bool                                                 finished_ = false;   /* final write queued */
    bool                                                 failed_   = false;
    unsigned                                             version_  = 11;

    void on_header(const beast::error_code& ec) {
        if (ec) {
            if (ec != http::error::end_of_stream) {
                S2S_LOG_DEBUG("(%s) failed to read request header: %s\n",
                              session_id_.c_str(), ec.message().c_str());
            }
            close();
            return;
        }

        const auto& req = parser_->get();
        version_ = req.version();
        std::string target(req.target().data(), req.target().size());
        const size_t query = target.find('?');
        if (query != std::string::npos) target.resize(query);

        if (target != S2S_STREAM_PATH) {
            S2S_LOG_INFO("(%s) %s %s -> 404\n", session_id_.c_str(),
                         std::string(req.method_string()).c_str(), target.c_str());
            queue_full(404);
            return;
        }
        if (req.method() != http::verb::post) {
            S2S_LOG_INFO("(%s) %s %s -> 405\n", session_id_.c_str(),
                         std::string(req.method_string()).c_str(), target.c_str());
            queue_full(405);
            return;
        }

        S2S_LOG_INFO("(%s) new audio stream from %s\n", session_id_.c_str(),
                     remote_address().c_str());
        stream_.expires_never();

        if (beast::iequals(req[http::field::expect], "100-continue")) {
            queue(PendingWrite::CONTINUE);
        }

        start_controller();
        if (controller_) read_body();
    }

    void start_controller();

    std::string remote_address() {
        beast::error_code ec;
        auto ep = stream_.socket().remote_endpoint(ec);
        if (ec) return "unknown";
        return ep.address().to_string() + ":" + std::to_string(ep.port());
    }

    void read_body() {
        if (parser_->is_done()) {
            if (controller_) controller_->on_client_end();
            return;
        }
        parser_->get().body().data = body_buf_.data();
        parser_->get().body().size = body_buf_.size();

        auto self = shared_from_this();
        http::async_read_some(stream_, buffer_, *parser_,
            [self](beast::error_code ec, std::size_t) { self->on_body(ec); });
    }

    void on_body(beast::error_code ec) {
        if (ec == http::error::need_buffer) ec = {};
        if (!controller_) return;

        const size_t n = body_buf_.size() - parser_->get().body().size;
        if (n > 0) {
            controller_->on_client_data(reinterpret_cast<const uint8_t*>(body_buf_.data()), n);
        }

        if (ec) {
            if (controller_) controller_->on_client_error(ec.message());
            return;
        }
        if (controller_) read_body();
    }

    void queue(PendingWrite::Kind kind, AudioBytes&& data = AudioBytes(), int status = 200) {
        if (finished_ || failed_) return;
        if (kind == PendingWrite::LAST || kind == PendingWrite::FULL) finished_ = true;

        PendingWrite item;
        item.kind = kind;
        item.data = std::move(data);
        item.status = status;
        writes_.push_back(std::move(item));
        if (!writing_) do_write();
    }

    void do_write() {
        if (writes_.empty()) {
            writing_ = false;
            return;
        }
        writing_ = true;

        auto self = shared_from_this();
        auto handler = [self](const beast::error_code& ec, std::size_t) { self->on_write(ec); };
        PendingWrite& item = writes_.front();

        switch (item.kind) {
            case PendingWrite::CONTINUE:
                res_ = std::make_unique<http::response<http::empty_body>>(
                    http::status::continue_, version_);
                http::async_write(stream_, *res_, handler);
                break;
            case PendingWrite::HEADER:
                res_ = std::make_unique<http::response<http::empty_body>>(http::status::ok, version_);
                res_->set(http::field::server, S2S_BRIDGE_NAME);
                res_->set(http::field::content_type, "application/octet-stream");
                res_->chunked(true);
                sr_ = std::make_unique<http::response_serializer<http::empty_body>>(*res_);
                http::async_write_header(stream_, *sr_, handler);
                break;
            case PendingWrite::CHUNK:
                net::async_write(stream_, http::make_chunk(net::buffer(item.data)), handler);
                break;
            case PendingWrite::LAST:
                net::async_write(stream_, http::make_chunk_last(), handler);
                break;
            case PendingWrite::FULL:
                res_ = std::make_unique<http::response<http::empty_body>>(
                    static_cast<http::status>(item.status), version_);
                res_->set(http::field::server, S2S_BRIDGE_NAME);
                res_->keep_alive(false);
                res_->prepare_payload();
                http::async_write(stream_, *res_, handler);
                break;
        }
    }

    void on_write(const beast::error_code& ec) {
        const PendingWrite::Kind kind = writes_.front().kind;
        writes_.pop_front();

        if (ec) {
            S2S_LOG_DEBUG("(%s) write failed: %s\n", session_id_.c_str(), ec.message().c_str());
            failed_ = true;
            writes_.clear();
            writing_ = false;
            std::shared_ptr<StreamController> controller = std::move(controller_);
            if (controller) controller->on_response_error(ec.message());
            close();
            return;
        }

        if (kind == PendingWrite::LAST || kind == PendingWrite::FULL) {
            writing_ = false;
            controller_.reset();
            close();
            return;
        }
        do_write();
    }
};

namespace {

class ConnectionResponse : public s2s_bridge::IClientResponse {
public:
    explicit ConnectionResponse(std::shared_ptr<StreamConnection> conn) : conn_(std::move(conn)) {}

    void begin_stream() override { conn_->queue_header(); }
    void write(AudioBytes&& chunk) override { conn_->queue_chunk(std::move(chunk)); }
    void end() override { conn_->queue_last(); }
    void fail(int status) override { conn_->queue_full(status); }

private:
    std::shared_ptr<StreamConnection> conn_;
};

}

void StreamConnection::start_controller() {
    std::shared_ptr<s2s_bridge::IRemoteTransport> transport = transport_factory_(ioc_);
    if (!transport) {
        S2S_LOG_ERROR("(%s) no remote transport available\n", session_id_.c_str());
        queue_full(502);
        return;
    }

    s2s_bridge::StreamControllerConfig controller_cfg =
        s2s_bridge::make_stream_controller_config(cfg_, session_id_);
    controller_ = StreamController::create(controller_cfg, std::move(transport), timers_,
                                           std::make_shared<ConnectionResponse>(shared_from_this()));
    controller_->start();
}

HttpStreamServer::HttpStreamServer(net::io_context& ioc, const s2s_bridge::BridgeConfig& cfg)
    : ioc_(ioc)
    , cfg_(cfg)
    , acceptor_(ioc)
    , timers_(std::make_shared<s2s_bridge::AsioTimerFactory>(ioc))
{
    const s2s_bridge::BridgeConfig bridge_cfg = cfg;
    transport_factory_ = [bridge_cfg](net::io_context& io) {
        return s2s_bridge::create_remote_transport(bridge_cfg, io);
    };
}

bool HttpStreamServer::start(std::string& error) {
    beast::error_code ec;
    const auto address = net::ip::make_address(cfg_.listen_address, ec);
    if (ec) {
        error = "invalid listen address " + cfg_.listen_address + ": " + ec.message();
        return false;
    }
    const tcp::endpoint endpoint(address, static_cast<unsigned short>(cfg_.port));

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        error = "cannot listen on " + cfg_.listen_address + ":" + std::to_string(cfg_.port) +
                ": " + ec.message();
        beast::error_code ignored;
        acceptor_.close(ignored);
        return false;
    }

    S2S_LOG_INFO("%s listening on %s:%u, endpoint %s\n", S2S_BRIDGE_NAME,
                 cfg_.listen_address.c_str(), static_cast<unsigned>(port()), S2S_STREAM_PATH);
    do_accept();
    return true;
}

void HttpStreamServer::stop() {
    if (stopped_) return;
    stopped_ = true;

    beast::error_code ec;
    acceptor_.close(ec);

    for (auto& weak : connections_) {
        if (auto conn = weak.lock()) conn->close();
    }
    connections_.clear();
}

unsigned short HttpStreamServer::port() const {
    beast::error_code ec;
    const auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void HttpStreamServer::do_accept() {
    auto self = shared_from_this();
    acceptor_.async_accept(
        [self](const beast::error_code& ec, tcp::socket socket) {
            self->on_accept(ec, std::move(socket));
        });
}

void HttpStreamServer::on_accept(const beast::error_code& ec, tcp::socket socket) {
    if (stopped_) return;
    if (ec) {
        S2S_LOG_WARNING("accept failed: %s\n", ec.message().c_str());
    } else {
        connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                          [](const std::weak_ptr<StreamConnection>& w) {
                                              return w.expired();
                                          }),
                           connections_.end());

        auto conn = std::make_shared<StreamConnection>(ioc_, std::move(socket), cfg_, timers_,
                                                       transport_factory_,
                                                       boost::uuids::to_string(uuid_gen_()));
        connections_.push_back(conn);
        conn->run();
    }
    do_accept();
}

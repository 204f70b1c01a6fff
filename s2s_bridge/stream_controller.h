#ifndef S2S_BRIDGE_STREAM_CONTROLLER_H
#define S2S_BRIDGE_STREAM_CONTROLLER_H

#include <cstdint>
#include <memory>
#include <string>
#include "audio_format.h"
#include "frame_accumulator.h"
#include "periodic_timer.h"
#include "remote_transport.h"

namespace s2s_bridge {

struct BridgeConfig;

enum class StreamState {
    INIT,
    CONNECTING,
    STREAMING,
    CLOSING,
    CLOSED
};

const char* stream_state_name(StreamState state);

/*
 * The client-facing half of one request. Implementations queue the data and
 * report write failures back through StreamController::on_response_error,
 * never from inside one of these calls.
 */
class IClientResponse {
public:
    virtual ~IClientResponse() = default;
    /* 200, application/octet-stream, chunked */
    virtual void begin_stream() = 0;
    virtual void write(AudioBytes&& chunk) = 0;
    virtual void end() = 0;
    /* Complete response with `status` and no body. Only valid before begin_stream(). */
    virtual void fail(int status) = 0;
};

struct StreamControllerConfig {
    std::string   session_id;
    SessionConfig session;
    size_t uplink_frame_bytes     = 3200;   /* 100 ms at 16 kHz */
    int    uplink_interval_ms     = 100;
    size_t downlink_frame_bytes   = 320;    /* 20 ms at 8 kHz */
    int    downlink_interval_ms   = 20;
    bool   send_keepalive_silence = false;
    size_t keepalive_bytes        = 3200;
};

StreamControllerConfig make_stream_controller_config(const BridgeConfig& cfg,
                                                     const std::string& session_id);

/*
 * Bridges one client request to one remote session.
 *
 *   client bytes -> upsample -> uplink FIFO -(tick)-> transport
 *   transport audio -> downsample -> downlink FIFO -(tick)-> client response
 *
 * Single-threaded: every method must be called on the event loop that runs
 * the timers and the transport callbacks.
 */
class StreamController : public std::enable_shared_from_this<StreamController> {
public:
    struct Stats {
        uint64_t client_bytes_in  = 0;
        uint64_t frames_sent      = 0;
        uint64_t send_failures    = 0;
        uint64_t remote_bytes_in  = 0;
        uint64_t frames_written   = 0;
        uint64_t bad_rate_chunks  = 0;
    };

    static std::shared_ptr<StreamController> create(const StreamControllerConfig& cfg,
                                                    std::shared_ptr<IRemoteTransport> transport,
                                                    std::shared_ptr<ITimerFactory> timers,
                                                    std::shared_ptr<IClientResponse> response);
    ~StreamController();

    StreamController(const StreamController&) = delete;
    StreamController& operator=(const StreamController&) = delete;

    void start();

    void on_client_data(const uint8_t* data, size_t len);
    void on_client_end();
    void on_client_error(const std::string& error);
    void on_response_error(const std::string& error);

    StreamState state() const { return state_; }
    Stats get_stats() const { return stats_; }
    size_t uplink_pending() const { return uplink_.size(); }
    size_t downlink_pending() const { return downlink_.size(); }
    const std::string& session_id() const { return cfg_.session_id; }

private:
    StreamController(const StreamControllerConfig& cfg,
                     std::shared_ptr<IRemoteTransport> transport,
                     std::shared_ptr<ITimerFactory> timers,
                     std::shared_ptr<IClientResponse> response);

    StreamControllerConfig            cfg_;
    std::shared_ptr<IRemoteTransport> transport_;
    std::shared_ptr<IClientResponse>  response_;
    std::unique_ptr<IPeriodicTimer>   uplink_timer_;
    std::unique_ptr<IPeriodicTimer>   downlink_timer_;
    FrameAccumulator                  uplink_;
    FrameAccumulator                  downlink_;
    AudioBytes                        uplink_carry_;
    AudioBytes                        downlink_carry_;
    StreamState                       state_ = StreamState::INIT;
    bool                              client_done_ = false;
    bool                              cleaned_up_  = false;
    bool                              warned_rate_ = false;
    Stats                             stats_;

    void set_state(StreamState next);
    void handle_connect_result(bool ok, const ConnectionError& error);
    void begin_streaming();

    void on_remote_audio(AudioBytes&& pcm, int sample_rate);
    void on_remote_close(int code, const std::string& reason);
    void on_remote_error(const std::string& error);

    void on_uplink_tick();
    void on_downlink_tick();
    void send_frame(AudioBytes&& data);

    /* STREAMING -> CLOSING -> CLOSED; during CONNECTING only marks the client
     * as gone so the connect result tears the session down. */
    void shutdown(const char* reason);
    void cleanup(bool connect_failed);
};

}

#endif

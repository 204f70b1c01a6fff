#include "stream_controller.h"
#include "bridge_config.h"
#include "log.h"
#include "resampler.h"

namespace s2s_bridge {

const char* stream_state_name(StreamState state) {
    switch (state) {
        case StreamState::INIT:       return "INIT";
        case StreamState::CONNECTING: return "CONNECTING";
        case StreamState::STREAMING:  return "STREAMING";
        case StreamState::CLOSING:    return "CLOSING";
        case StreamState::CLOSED:     return "CLOSED";
    }
    return "UNKNOWN";
}

StreamControllerConfig make_stream_controller_config(const BridgeConfig& cfg,
                                                     const std::string& session_id) {
    StreamControllerConfig out;
    out.session_id = session_id;
    out.session = make_session_config(cfg);
    out.uplink_interval_ms = cfg.uplink_interval_ms;
    out.uplink_frame_bytes = bytes_for_ms(SampleRate::HZ_16000, cfg.uplink_interval_ms);
    out.downlink_interval_ms = cfg.output_interval_ms;
    out.downlink_frame_bytes = 320;
    /* the managed session is kept open with a short burst of silence */
    out.send_keepalive_silence = cfg.ws_url_override.empty();
    return out;
}

std::shared_ptr<StreamController> StreamController::create(const StreamControllerConfig& cfg,
                                                           std::shared_ptr<IRemoteTransport> transport,
                                                           std::shared_ptr<ITimerFactory> timers,
                                                           std::shared_ptr<IClientResponse> response) {
    return std::shared_ptr<StreamController>(
        new StreamController(cfg, std::move(transport), std::move(timers), std::move(response)));
}

StreamController::StreamController(const StreamControllerConfig& cfg,
                                   std::shared_ptr<IRemoteTransport> transport,
                                   std::shared_ptr<ITimerFactory> timers,
                                   std::shared_ptr<IClientResponse> response)
    : cfg_(cfg)
    , transport_(std::move(transport))
    , response_(std::move(response))
    , uplink_timer_(timers->create_timer())
    , downlink_timer_(timers->create_timer())
    , uplink_(cfg.uplink_frame_bytes)
    , downlink_(cfg.downlink_frame_bytes)
{
}

StreamController::~StreamController() {
    if (!cleaned_up_) {
        uplink_timer_->cancel();
        downlink_timer_->cancel();
        if (transport_) transport_->close();
    }
}

void StreamController::set_state(StreamState next) {
    S2S_LOG_DEBUG("(%s) %s -> %s\n", cfg_.session_id.c_str(),
                  stream_state_name(state_), stream_state_name(next));
    state_ = next;
}

void StreamController::start() {
    if (state_ != StreamState::INIT) return;
    set_state(StreamState::CONNECTING);

    S2S_LOG_INFO("(%s) connecting remote session via %s\n",
                 cfg_.session_id.c_str(), transport_->name());

    std::weak_ptr<StreamController> wp = shared_from_this();
    transport_->connect(cfg_.session, [wp](bool ok, const ConnectionError& error) {
        if (auto self = wp.lock()) self->handle_connect_result(ok, error);
    });
}

void StreamController::handle_connect_result(bool ok, const ConnectionError& error) {
    if (state_ != StreamState::CONNECTING) return;

    if (!ok) {
        S2S_LOG_ERROR("(%s) failed to establish remote session (%s): %s\n",
                      cfg_.session_id.c_str(), connection_error_kind_name(error.kind),
                      error.message.c_str());
        set_state(StreamState::CLOSED);
        cleanup(true);
        return;
    }

    if (client_done_) {
        S2S_LOG_INFO("(%s) client left while connecting, closing session\n",
                     cfg_.session_id.c_str());
        response_->begin_stream();
        set_state(StreamState::CLOSING);
        cleanup(false);
        set_state(StreamState::CLOSED);
        return;
    }

    begin_streaming();
}

void StreamController::begin_streaming() {
    set_state(StreamState::STREAMING);
    S2S_LOG_INFO("(%s) remote session established\n", cfg_.session_id.c_str());

    std::weak_ptr<StreamController> wp = shared_from_this();
    transport_->on_audio([wp](AudioBytes&& pcm, int sample_rate) {
        if (auto self = wp.lock()) self->on_remote_audio(std::move(pcm), sample_rate);
    });
    transport_->on_close([wp](int code, const std::string& reason) {
        if (auto self = wp.lock()) self->on_remote_close(code, reason);
    });
    transport_->on_error([wp](const std::string& error) {
        if (auto self = wp.lock()) self->on_remote_error(error);
    });

    response_->begin_stream();

    if (cfg_.send_keepalive_silence && cfg_.keepalive_bytes > 0) {
        send_frame(AudioBytes(cfg_.keepalive_bytes, 0));
    }

    uplink_timer_->start(cfg_.uplink_interval_ms, [wp]() {
        if (auto self = wp.lock()) self->on_uplink_tick();
    });
    downlink_timer_->start(cfg_.downlink_interval_ms, [wp]() {
        if (auto self = wp.lock()) self->on_downlink_tick();
    });
}

void StreamController::on_client_data(const uint8_t* data, size_t len) {
    if (state_ != StreamState::INIT && state_ != StreamState::CONNECTING &&
        state_ != StreamState::STREAMING) {
        return;
    }
    if (!data || len == 0) return;
    stats_.client_bytes_in += len;

    AudioBytes samples;
    samples.reserve(uplink_carry_.size() + len);
    samples.insert(samples.end(), uplink_carry_.begin(), uplink_carry_.end());
    samples.insert(samples.end(), data, data + len);
    uplink_carry_.clear();

    if (samples.size() % kBytesPerSample) {
        uplink_carry_.push_back(samples.back());
        samples.pop_back();
    }
    if (samples.empty()) return;

    uplink_.append(upsample_8k_to_16k(samples));
}

void StreamController::on_client_end() {
    S2S_LOG_INFO("(%s) client stream ended\n", cfg_.session_id.c_str());
    shutdown("client ended");
}

void StreamController::on_client_error(const std::string& error) {
    S2S_LOG_WARNING("(%s) client stream error: %s\n", cfg_.session_id.c_str(), error.c_str());
    shutdown("client error");
}

void StreamController::on_response_error(const std::string& error) {
    S2S_LOG_WARNING("(%s) response write failed: %s\n", cfg_.session_id.c_str(), error.c_str());
    shutdown("response write failed");
}

void StreamController::on_remote_audio(AudioBytes&& pcm, int sample_rate) {
    if (state_ != StreamState::STREAMING) return;
    stats_.remote_bytes_in += pcm.size();

    AudioBytes samples;
    if (downlink_carry_.empty()) {
        samples = std::move(pcm);
    } else {
        samples.reserve(downlink_carry_.size() + pcm.size());
        samples.insert(samples.end(), downlink_carry_.begin(), downlink_carry_.end());
        samples.insert(samples.end(), pcm.begin(), pcm.end());
        downlink_carry_.clear();
    }

    if (samples.size() % kBytesPerSample) {
        downlink_carry_.push_back(samples.back());
        samples.pop_back();
    }
    if (samples.empty()) return;

    if (sample_rate == sample_rate_hz(SampleRate::HZ_8000)) {
        downlink_.append(samples);
        return;
    }

    if (sample_rate != sample_rate_hz(SampleRate::HZ_24000)) {
        ++stats_.bad_rate_chunks;
        if (!warned_rate_) {
            warned_rate_ = true;
            S2S_LOG_WARNING("(%s) remote audio at %d Hz, treating it as 24000 Hz\n",
                            cfg_.session_id.c_str(), sample_rate);
        }
    }
    downlink_.append(downsample_24k_to_8k(samples));
}

void StreamController::on_remote_close(int code, const std::string& reason) {
    S2S_LOG_INFO("(%s) remote session closed (code=%d reason=%s)\n",
                 cfg_.session_id.c_str(), code, reason.c_str());
    shutdown("remote closed");
}

void StreamController::on_remote_error(const std::string& error) {
    S2S_LOG_ERROR("(%s) remote session error: %s\n", cfg_.session_id.c_str(), error.c_str());
    shutdown("remote error");
}

void StreamController::on_uplink_tick() {
    if (state_ != StreamState::STREAMING) return;
    AudioBytes frame;
    if (uplink_.pop_frame(frame)) {
        send_frame(std::move(frame));
    }
}

void StreamController::on_downlink_tick() {
    if (state_ != StreamState::STREAMING) return;
    AudioBytes frame;
    if (downlink_.pop_frame(frame)) {
        ++stats_.frames_written;
        response_->write(std::move(frame));
    }
}

void StreamController::send_frame(AudioBytes&& data) {
    AudioFrame frame;
    frame.data = std::move(data);
    frame.rate = SampleRate::HZ_16000;

    std::weak_ptr<StreamController> wp = shared_from_this();
    transport_->send_audio(frame, [wp](bool ok, const std::string& error) {
        auto self = wp.lock();
        if (!self) return;
        if (ok) {
            ++self->stats_.frames_sent;
            return;
        }
        ++self->stats_.send_failures;
        S2S_LOG_WARNING("(%s) error sending audio to remote: %s\n",
                        self->cfg_.session_id.c_str(), error.c_str());
    });
}

void StreamController::shutdown(const char* reason) {
    switch (state_) {
        case StreamState::INIT:
        case StreamState::CONNECTING:
            client_done_ = true;
            break;
        case StreamState::STREAMING:
            S2S_LOG_DEBUG("(%s) closing: %s\n", cfg_.session_id.c_str(), reason);
            set_state(StreamState::CLOSING);
            cleanup(false);
            set_state(StreamState::CLOSED);
            break;
        case StreamState::CLOSING:
        case StreamState::CLOSED:
            break;
    }
}

void StreamController::cleanup(bool connect_failed) {
    if (cleaned_up_) return;
    cleaned_up_ = true;

    uplink_timer_->cancel();
    downlink_timer_->cancel();
    transport_->close();
    uplink_.close();
    downlink_.close();
    uplink_carry_.clear();
    downlink_carry_.clear();

    std::shared_ptr<IClientResponse> response = std::move(response_);
    if (response) {
        if (connect_failed) {
            response->fail(502);
        } else {
            response->end();
        }
    }

    S2S_LOG_INFO("(%s) session closed: client_in=%llu sent=%llu send_failures=%llu "
                 "remote_in=%llu written=%llu\n",
                 cfg_.session_id.c_str(),
                 static_cast<unsigned long long>(stats_.client_bytes_in),
                 static_cast<unsigned long long>(stats_.frames_sent),
                 static_cast<unsigned long long>(stats_.send_failures),
                 static_cast<unsigned long long>(stats_.remote_bytes_in),
                 static_cast<unsigned long long>(stats_.frames_written));
}

}

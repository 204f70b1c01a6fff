#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "stream_controller.h"
#include "test_helpers.h"

using namespace s2s_bridge;

namespace {

class FakeTransport : public IRemoteTransport {
public:
    void connect(const SessionConfig& cfg, OnConnectResult cb) override {
        ++connect_calls;
        session = cfg;
        cb_connect = std::move(cb);
    }

    void send_audio(const AudioFrame& frame, OnSendComplete cb) override {
        sent.push_back(frame);
        if (cb) cb(!fail_sends, fail_sends ? "socket send failed" : "");
    }

    void close() override {
        ++close_calls;
        clear_callbacks();
    }

    const char* name() const override { return "fake"; }

    void complete(bool ok, ConnectionError::Kind kind = ConnectionError::UNREACHABLE) {
        ConnectionError error;
        error.kind = kind;
        error.message = ok ? "" : "connection refused";
        OnConnectResult cb = std::move(cb_connect);
        cb_connect = nullptr;
        ASSERT_TRUE(cb);
        cb(ok, error);
    }

    void emit_audio(AudioBytes pcm, int rate) {
        if (cb_audio_) cb_audio_(std::move(pcm), rate);
    }
    void emit_close(int code, const std::string& reason) {
        if (cb_close_) cb_close_(code, reason);
    }
    void emit_error(const std::string& error) {
        if (cb_error_) cb_error_(error);
    }

    int                     connect_calls = 0;
    int                     close_calls   = 0;
    bool                    fail_sends    = false;
    SessionConfig           session;
    OnConnectResult         cb_connect;
    std::vector<AudioFrame> sent;
};

struct TimerState {
    int          interval_ms = 0;
    TickCallback cb;
    bool         running  = false;
    int          starts   = 0;
    int          cancels  = 0;
};

class FakeTimer : public IPeriodicTimer {
public:
    explicit FakeTimer(std::shared_ptr<TimerState> state) : state_(std::move(state)) {}

    void start(int interval_ms, TickCallback cb) override {
        state_->interval_ms = interval_ms;
        state_->cb = std::move(cb);
        state_->running = true;
        ++state_->starts;
    }
    void cancel() override {
        if (state_->running) ++state_->cancels;
        state_->running = false;
        state_->cb = nullptr;
    }
    bool is_running() const override { return state_->running; }

private:
    std::shared_ptr<TimerState> state_;
};

class FakeTimerFactory : public ITimerFactory {
public:
    std::unique_ptr<IPeriodicTimer> create_timer() override {
        timers.push_back(std::make_shared<TimerState>());
        return std::unique_ptr<IPeriodicTimer>(new FakeTimer(timers.back()));
    }

    std::vector<std::shared_ptr<TimerState>> timers;
};

class FakeResponse : public IClientResponse {
public:
    void begin_stream() override { ++begins; }
    void write(AudioBytes&& chunk) override { chunks.push_back(std::move(chunk)); }
    void end() override { ++ends; }
    void fail(int status) override { failed_status = status; ++fails; }

    int                     begins = 0;
    int                     ends   = 0;
    int                     fails  = 0;
    int                     failed_status = 0;
    std::vector<AudioBytes> chunks;
};

class StreamControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.session_id = "test-session";
        cfg.session.model = "models/test";
        cfg.send_keepalive_silence = true;
        transport = std::make_shared<FakeTransport>();
        timers = std::make_shared<FakeTimerFactory>();
        response = std::make_shared<FakeResponse>();
    }

    std::shared_ptr<StreamController> make() {
        controller = StreamController::create(cfg, transport, timers, response);
        return controller;
    }

    void start_streaming() {
        make()->start();
        transport->complete(true);
        ASSERT_EQ(controller->state(), StreamState::STREAMING);
        transport->sent.clear();
    }

    TimerState& uplink_timer() { return *timers->timers.at(0); }
    TimerState& downlink_timer() { return *timers->timers.at(1); }

    static void tick(TimerState& timer) {
        ASSERT_TRUE(timer.running);
        TickCallback cb = timer.cb;
        cb();
    }

    int timer_starts() const {
        int n = 0;
        for (const auto& t : timers->timers) n += t->starts;
        return n;
    }

    StreamControllerConfig            cfg;
    std::shared_ptr<FakeTransport>    transport;
    std::shared_ptr<FakeTimerFactory> timers;
    std::shared_ptr<FakeResponse>     response;
    std::shared_ptr<StreamController> controller;
};

}

TEST_F(StreamControllerTest, StartConnectsWithSessionConfig) {
    make()->start();
    EXPECT_EQ(controller->state(), StreamState::CONNECTING);
    EXPECT_EQ(transport->connect_calls, 1);
    EXPECT_EQ(transport->session.model, "models/test");

    controller->start();
    EXPECT_EQ(transport->connect_calls, 1);
}

TEST_F(StreamControllerTest, ConnectFailureAnswers502WithoutStartingTimers) {
    make()->start();
    transport->complete(false);

    EXPECT_EQ(controller->state(), StreamState::CLOSED);
    EXPECT_EQ(response->fails, 1);
    EXPECT_EQ(response->failed_status, 502);
    EXPECT_EQ(response->begins, 0);
    EXPECT_EQ(response->ends, 0);
    EXPECT_TRUE(response->chunks.empty());
    EXPECT_EQ(timer_starts(), 0);
    EXPECT_TRUE(transport->sent.empty());
}

TEST_F(StreamControllerTest, InvalidConfigIsAlsoAServerError) {
    make()->start();
    transport->complete(false, ConnectionError::INVALID_CONFIG);
    EXPECT_EQ(controller->state(), StreamState::CLOSED);
    EXPECT_EQ(response->failed_status, 502);
}

TEST_F(StreamControllerTest, EndToEndSilence) {
    make()->start();

    controller->on_client_data(AudioBytes(200, 0).data(), 200);
    EXPECT_EQ(controller->uplink_pending(), 400u);

    transport->complete(true);
    ASSERT_EQ(controller->state(), StreamState::STREAMING);
    EXPECT_EQ(response->begins, 1);
    EXPECT_EQ(uplink_timer().interval_ms, 100);
    EXPECT_EQ(downlink_timer().interval_ms, 20);

    /* keepalive silence goes out on connect */
    ASSERT_EQ(transport->sent.size(), 1u);
    EXPECT_EQ(transport->sent[0].data, AudioBytes(3200, 0));
    EXPECT_EQ(transport->sent[0].rate, SampleRate::HZ_16000);

    /* 400 bytes are not a full uplink frame yet */
    tick(uplink_timer());
    EXPECT_EQ(transport->sent.size(), 1u);
    EXPECT_EQ(controller->uplink_pending(), 400u);

    transport->emit_audio(AudioBytes(960, 0), 24000);
    EXPECT_EQ(controller->downlink_pending(), 320u);

    tick(downlink_timer());
    ASSERT_EQ(response->chunks.size(), 1u);
    EXPECT_EQ(response->chunks[0], AudioBytes(320, 0));
    EXPECT_EQ(controller->downlink_pending(), 0u);

    tick(downlink_timer());
    EXPECT_EQ(response->chunks.size(), 1u);
}

TEST_F(StreamControllerTest, UplinkSendsOneFullFramePerTick) {
    start_streaming();
    const uint64_t sent_before = controller->get_stats().frames_sent;

    const AudioBytes pcm = test::pcm_from_samples(std::vector<int16_t>(4000, 1000));
    controller->on_client_data(pcm.data(), pcm.size());
    EXPECT_EQ(controller->uplink_pending(), 16000u);

    tick(uplink_timer());
    ASSERT_EQ(transport->sent.size(), 1u);
    EXPECT_EQ(transport->sent[0].data.size(), 3200u);
    EXPECT_EQ(test::samples_from_pcm(transport->sent[0].data),
              std::vector<int16_t>(1600, 1000));
    EXPECT_EQ(controller->uplink_pending(), 12800u);

    tick(uplink_timer());
    EXPECT_EQ(transport->sent.size(), 2u);
    EXPECT_EQ(controller->get_stats().frames_sent, sent_before + 2);
}

TEST_F(StreamControllerTest, DownlinkWritesFixedChunksInOrder) {
    start_streaming();

    std::vector<int16_t> samples;
    for (int i = 0; i < 600; ++i) samples.push_back(static_cast<int16_t>(i));
    transport->emit_audio(test::pcm_from_samples(samples), 24000);
    EXPECT_EQ(controller->downlink_pending(), 400u);

    tick(downlink_timer());
    tick(downlink_timer());
    ASSERT_EQ(response->chunks.size(), 1u);

    const std::vector<int16_t> written = test::samples_from_pcm(response->chunks[0]);
    ASSERT_EQ(written.size(), 160u);
    for (size_t i = 0; i < written.size(); ++i) EXPECT_EQ(written[i], static_cast<int16_t>(i * 3));
}

TEST_F(StreamControllerTest, EightKilohertzAudioPassesThrough) {
    start_streaming();
    transport->emit_audio(AudioBytes(320, 7), 8000);
    EXPECT_EQ(controller->downlink_pending(), 320u);
}

TEST_F(StreamControllerTest, UnexpectedRateIsCountedAndDecimated) {
    start_streaming();
    transport->emit_audio(AudioBytes(960, 0), 16000);
    EXPECT_EQ(controller->downlink_pending(), 320u);
    EXPECT_EQ(controller->get_stats().bad_rate_chunks, 1u);
}

TEST_F(StreamControllerTest, OddByteIsCarriedToTheNextChunk) {
    start_streaming();

    const AudioBytes pcm = test::pcm_from_samples({100, 200, 300});
    controller->on_client_data(pcm.data(), 5);
    EXPECT_EQ(controller->uplink_pending(), 8u);

    controller->on_client_data(pcm.data() + 5, 1);
    EXPECT_EQ(controller->uplink_pending(), 10u);

    transport->emit_audio(AudioBytes(7, 0), 24000);
    EXPECT_EQ(controller->downlink_pending(), 2u);
    transport->emit_audio(AudioBytes(5, 0), 24000);
    EXPECT_EQ(controller->downlink_pending(), 4u);
}

TEST_F(StreamControllerTest, SendFailuresAreCountedAndStreamingContinues) {
    start_streaming();
    const uint64_t sent_before = controller->get_stats().frames_sent;
    transport->fail_sends = true;

    const AudioBytes pcm(1600, 0);
    controller->on_client_data(pcm.data(), pcm.size());
    tick(uplink_timer());

    EXPECT_EQ(controller->state(), StreamState::STREAMING);
    EXPECT_EQ(controller->get_stats().send_failures, 1u);
    EXPECT_EQ(controller->get_stats().frames_sent, sent_before);
}

TEST_F(StreamControllerTest, ClientEndTearsDownOnce) {
    start_streaming();
    controller->on_client_end();

    EXPECT_EQ(controller->state(), StreamState::CLOSED);
    EXPECT_FALSE(uplink_timer().running);
    EXPECT_FALSE(downlink_timer().running);
    EXPECT_EQ(uplink_timer().cancels, 1);
    EXPECT_EQ(downlink_timer().cancels, 1);
    EXPECT_EQ(transport->close_calls, 1);
    EXPECT_EQ(response->ends, 1);
    EXPECT_EQ(controller->uplink_pending(), 0u);

    controller->on_client_end();
    controller->on_client_error("reset");
    EXPECT_EQ(transport->close_calls, 1);
    EXPECT_EQ(response->ends, 1);

    controller->on_client_data(AudioBytes(100, 0).data(), 100);
    EXPECT_EQ(controller->uplink_pending(), 0u);
}

TEST_F(StreamControllerTest, RemoteCloseRacingClientEndCleansUpOnce) {
    start_streaming();
    transport->emit_audio(AudioBytes(960, 0), 24000);

    transport->emit_close(1000, "bye");
    controller->on_client_end();

    EXPECT_EQ(controller->state(), StreamState::CLOSED);
    EXPECT_EQ(transport->close_calls, 1);
    EXPECT_EQ(response->ends, 1);
    EXPECT_EQ(uplink_timer().cancels, 1);
    EXPECT_EQ(downlink_timer().cancels, 1);
    EXPECT_TRUE(response->chunks.empty());
}

TEST_F(StreamControllerTest, ClientEndRacingRemoteCloseCleansUpOnce) {
    start_streaming();

    controller->on_client_end();
    transport->emit_close(1000, "bye");
    transport->emit_error("late");

    EXPECT_EQ(controller->state(), StreamState::CLOSED);
    EXPECT_EQ(transport->close_calls, 1);
    EXPECT_EQ(response->ends, 1);
}

TEST_F(StreamControllerTest, RemoteErrorEndsTheResponse) {
    start_streaming();
    transport->emit_error("connection reset");

    EXPECT_EQ(controller->state(), StreamState::CLOSED);
    EXPECT_EQ(response->ends, 1);
    EXPECT_EQ(response->fails, 0);
}

TEST_F(StreamControllerTest, ResponseWriteFailureCloses) {
    start_streaming();
    controller->on_response_error("broken pipe");

    EXPECT_EQ(controller->state(), StreamState::CLOSED);
    EXPECT_EQ(transport->close_calls, 1);
}

TEST_F(StreamControllerTest, ClientEndDuringConnectClosesAfterConnect) {
    make()->start();
    controller->on_client_data(AudioBytes(200, 0).data(), 200);
    controller->on_client_end();
    EXPECT_EQ(controller->state(), StreamState::CONNECTING);

    transport->complete(true);

    EXPECT_EQ(controller->state(), StreamState::CLOSED);
    EXPECT_EQ(transport->close_calls, 1);
    EXPECT_EQ(response->begins, 1);
    EXPECT_EQ(response->ends, 1);
    EXPECT_TRUE(response->chunks.empty());
    EXPECT_TRUE(transport->sent.empty());
    EXPECT_EQ(timer_starts(), 0);
}

TEST_F(StreamControllerTest, ClientErrorDuringConnectThenConnectFailure) {
    make()->start();
    controller->on_client_error("reset by peer");
    transport->complete(false);

    EXPECT_EQ(controller->state(), StreamState::CLOSED);
    EXPECT_EQ(response->failed_status, 502);
    EXPECT_EQ(timer_starts(), 0);
}

TEST_F(StreamControllerTest, NoKeepaliveForRawEndpoints) {
    cfg.send_keepalive_silence = false;
    make()->start();
    transport->complete(true);

    EXPECT_EQ(controller->state(), StreamState::STREAMING);
    EXPECT_TRUE(transport->sent.empty());
}

TEST(StreamStateName, AllStatesHaveNames) {
    EXPECT_STREQ(stream_state_name(StreamState::INIT), "INIT");
    EXPECT_STREQ(stream_state_name(StreamState::CONNECTING), "CONNECTING");
    EXPECT_STREQ(stream_state_name(StreamState::STREAMING), "STREAMING");
    EXPECT_STREQ(stream_state_name(StreamState::CLOSING), "CLOSING");
    EXPECT_STREQ(stream_state_name(StreamState::CLOSED), "CLOSED");
}

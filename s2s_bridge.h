#ifndef S2S_BRIDGE_H
#define S2S_BRIDGE_H

#define S2S_BRIDGE_NAME "s2s_bridge"
#define S2S_STREAM_PATH "/speech-to-speech-stream"
#define S2S_ENV_FILE ".env"
#define S2S_BODY_CHUNK_BYTES (4096)
#define S2S_HEADER_TIMEOUT_SECS (30)
#define S2S_SHUTDOWN_GRACE_MS (2000)

#endif //S2S_BRIDGE_H

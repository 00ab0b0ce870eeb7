#pragma once
// Frame Reassembler: byte chunks → protocol frames, per stream
//
// Newline-delimited framing, same as MCP stdio. Each (host, server, stream)
// owns a buffer; the trailing partial line waits for the next chunk.
//
// Buffers are capped. A line that outgrows the cap is abandoned: the
// buffer is cleared and the stream resynchronizes at the next '\n'.

#include "protocol.hpp"
#include "log.hpp"
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace drishti {

struct StreamKey {
    std::string host;
    std::string server;
    StreamKind kind = StreamKind::Stdout;

    bool operator<(const StreamKey& other) const {
        return std::tie(host, server, kind) < std::tie(other.host, other.server, other.kind);
    }
};

class FrameReassembler {
public:
    static constexpr size_t DEFAULT_MAX_BUFFER = 16 * 1024 * 1024;  // 16MB

    explicit FrameReassembler(size_t max_buffer_bytes = DEFAULT_MAX_BUFFER)
        : max_buffer_bytes_(max_buffer_bytes) {}

    // Feed one chunk. Completed frames are appended to `frames`; completed
    // non-frame lines go to `noise` when provided.
    size_t feed(const StreamKey& key, const std::string& chunk,
                std::vector<json>& frames,
                std::vector<std::string>* noise = nullptr) {
        StreamState& state = streams_[key];
        size_t emitted = 0;
        size_t pos = 0;

        while (pos < chunk.size()) {
            size_t nl = chunk.find('\n', pos);
            size_t end = (nl == std::string::npos) ? chunk.size() : nl;

            if (!state.discarding) {
                state.buffer.append(chunk, pos, end - pos);
                if (state.buffer.size() > max_buffer_bytes_) {
                    overflow(key, state);
                }
            }

            if (nl == std::string::npos) break;

            if (state.discarding) {
                // Tail of the abandoned line; resume with the next one
                state.discarding = false;
            } else {
                if (complete_line(state.buffer, frames, noise)) ++emitted;
                state.buffer.clear();
            }
            pos = nl + 1;
        }

        return emitted;
    }

    // Drop whatever partial line a stream holds
    void reset(const StreamKey& key) {
        streams_.erase(key);
    }

    void clear() {
        streams_.clear();
    }

    size_t buffered_bytes(const StreamKey& key) const {
        auto it = streams_.find(key);
        return it == streams_.end() ? 0 : it->second.buffer.size();
    }

    size_t overflow_count() const { return overflows_; }
    size_t max_buffer_bytes() const { return max_buffer_bytes_; }

private:
    struct StreamState {
        std::string buffer;
        bool discarding = false;
    };

    static bool complete_line(const std::string& raw, std::vector<json>& frames,
                              std::vector<std::string>* noise) {
        std::string line = protocol::trim(raw);
        if (line.empty()) return false;

        auto frame = protocol::parse_frame(line);
        if (frame) {
            frames.push_back(std::move(*frame));
            return true;
        }
        if (noise) noise->push_back(std::move(line));
        return false;
    }

    void overflow(const StreamKey& key, StreamState& state) {
        ++overflows_;
        log_warn("reassembler", "%s/%s %s: line exceeded %zu bytes, stream reset",
                 key.host.c_str(), key.server.c_str(), stream_kind_name(key.kind),
                 max_buffer_bytes_);
        state.buffer.clear();
        state.buffer.shrink_to_fit();
        state.discarding = true;
    }

    size_t max_buffer_bytes_;
    size_t overflows_ = 0;
    std::map<StreamKey, StreamState> streams_;
};

} // namespace drishti

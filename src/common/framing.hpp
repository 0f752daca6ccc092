// SPDX-License-Identifier: Apache-2.0
// Length-prefixed framing: 4-byte big-endian payload size followed by the payload
// (a serialized royale::ClientMessage / royale::ServerMessage).
#pragma once
#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace royale::netutil {

// Frames above this size are treated as a protocol violation.
inline constexpr uint32_t kMaxFrameBytes = 1u << 20;

inline void append_frame(std::string &out, const std::string &payload)
{
    uint32_t net = htonl(static_cast<uint32_t>(payload.size()));
    size_t offset = out.size();
    out.resize(offset + 4 + payload.size());
    std::memcpy(out.data() + offset, &net, 4);
    std::memcpy(out.data() + offset + 4, payload.data(), payload.size());
}

inline std::string build_frame(const std::string &payload)
{
    std::string frame;
    frame.reserve(4 + payload.size());
    append_frame(frame, payload);
    return frame;
}

struct FrameParseState
{
    std::vector<char> buffer; // accumulated bytes
    uint32_t expected_len{0};
    bool have_len{false};
    bool corrupt{false}; // set once an invalid length prefix was seen; connection must be dropped
};

// Try to extract one frame; returns true if a complete payload was moved into out.
inline bool try_extract(FrameParseState &st, std::string &out)
{
    if (st.corrupt)
        return false;
    if (!st.have_len) {
        if (st.buffer.size() < 4)
            return false;
        uint32_t net;
        std::memcpy(&net, st.buffer.data(), 4);
        st.expected_len = ntohl(net);
        if (st.expected_len == 0 || st.expected_len > kMaxFrameBytes) {
            st.corrupt = true;
            return false;
        }
        st.have_len = true;
    }
    if (st.buffer.size() < 4 + static_cast<size_t>(st.expected_len))
        return false;
    out.assign(st.buffer.data() + 4, st.expected_len);
    st.buffer.erase(st.buffer.begin(), st.buffer.begin() + 4 + st.expected_len);
    st.have_len = false;
    st.expected_len = 0;
    return true;
}

} // namespace royale::netutil

// SPDX-License-Identifier: Apache-2.0
// Frame parser: split delivery, back-to-back frames, protobuf payload round trip.
#include "common/framing.hpp"
#include "royale.pb.h"

#include <cassert>
#include <iostream>
#include <string>

int main()
{
    using namespace royale::netutil;
    std::string p1 = "hello";
    std::string p2 = std::string(100, 'x');
    auto f1 = build_frame(p1);
    auto f2 = build_frame(p2);
    assert(f1.size() == 4 + p1.size());
    FrameParseState st;
    // feed first half of combined frames
    std::string all = f1 + f2;
    size_t half = all.size() / 2;
    st.buffer.insert(st.buffer.end(), all.data(), all.data() + half);
    std::string out;
    bool got = try_extract(st, out);
    if (half >= f1.size()) {
        assert(got);
        assert(out == p1);
    } else {
        assert(!got);
    }
    st.buffer.insert(st.buffer.end(), all.data() + half, all.data() + all.size());
    if (!got) {
        bool got_now = try_extract(st, out);
        assert(got_now && out == p1);
    }
    std::string out2;
    bool got2 = try_extract(st, out2);
    assert(got2 && out2 == p2);
    assert(st.buffer.empty());
    assert(!st.corrupt);

    // A JoinRequest survives framing and parsing.
    royale::ClientMessage join;
    join.mutable_join()->set_name("alice");
    std::string payload;
    assert(join.SerializeToString(&payload));
    std::string batch;
    append_frame(batch, payload);
    append_frame(batch, payload);
    FrameParseState st2;
    st2.buffer.assign(batch.begin(), batch.end());
    int parsed = 0;
    while (try_extract(st2, out)) {
        royale::ClientMessage back;
        assert(back.ParseFromString(out));
        assert(back.has_join() && back.join().name() == "alice");
        ++parsed;
    }
    assert(parsed == 2);
    std::cout << "unit_framing OK" << std::endl;
    return 0;
}

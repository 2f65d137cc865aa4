/*
Purpose: Negative tests for alignment wire decoding.

What this tests: Decoding rejects truncated, padded or malformed buffers by throwing,
so bad data received from another rank cannot silently produce a corrupted alignment.
Activity names are carried byte for byte, including non-ASCII bytes and NULs.
*/

#include "alignment_wire.hpp"

#include <cassert>
#include <cstddef>
#include <string>
#include <vector>

namespace
{
    template <typename Fn>
    void expect_throw(Fn &&fn)
    {
        bool threw = false;
        try
        {
            fn();
        }
        catch (...)
        {
            threw = true;
        }
        assert(threw);
    }

    tracecheck::AlignmentRecord sample()
    {
        tracecheck::AlignmentRecord r;
        r.cost = 2.0;
        r.fitness = 0.5;
        r.bestWorstCost = 4.0;
        r.visitedStates = 11;
        r.alignment.push_back({tracecheck::AlignmentMove::Kind::Synchronous, "A", false});
        r.alignment.push_back({tracecheck::AlignmentMove::Kind::ModelOnly, "", true});
        r.alignment.push_back({tracecheck::AlignmentMove::Kind::LogOnly, "C", false});
        return r;
    }
}

int main()
{
    // Empty buffer is truncated.
    expect_throw([]
                 { (void)tracecheck::decode_alignment({}); });

    // A well-formed record decodes to the same moves.
    const tracecheck::ByteBuffer bytes = tracecheck::encode_alignment(sample());
    {
        const tracecheck::AlignmentRecord back = tracecheck::decode_alignment(std::span<const std::byte>(bytes.data(), bytes.size()));
        assert(back.alignment == sample().alignment);
        assert(back.cost == 2.0 && back.visitedStates == 11);
    }

    // Strings are copied byte for byte.
    {
        const std::string utf8 = "Pr\xC3\xBCfung";
        const std::string withNul("a\0b", 3);
        tracecheck::WireWriter w;
        w.write_string(utf8);
        w.write_string("");
        w.write_string(withNul);
        const tracecheck::ByteBuffer buf = w.take();
        assert(buf.size() == 4 + utf8.size() + 4 + 4 + 3);
        assert(buf[4] == std::byte{'P'});
        assert(buf[6] == std::byte{0xC3});

        tracecheck::WireReader r(std::span<const std::byte>(buf.data(), buf.size()));
        assert(r.read_string() == utf8);
        assert(r.read_string().empty());
        assert(r.read_string() == withNul);
        assert(r.eof());
    }

    // Missing last byte of the final activity name.
    {
        tracecheck::ByteBuffer cut = bytes;
        cut.pop_back();
        expect_throw([&]
                     { (void)tracecheck::decode_alignment(std::span<const std::byte>(cut.data(), cut.size())); });
    }

    // Trailing garbage.
    {
        tracecheck::ByteBuffer padded = bytes;
        padded.push_back(std::byte{0x01});
        expect_throw([&]
                     { (void)tracecheck::decode_alignment(std::span<const std::byte>(padded.data(), padded.size())); });
    }

    // Unknown move kind. The first move's kind byte follows three doubles, three
    // counters and the move count.
    {
        tracecheck::ByteBuffer bad = bytes;
        bad[3 * 8 + 3 * 8 + 4] = std::byte{0x7F};
        expect_throw([&]
                     { (void)tracecheck::decode_alignment(std::span<const std::byte>(bad.data(), bad.size())); });
    }

    return 0;
}

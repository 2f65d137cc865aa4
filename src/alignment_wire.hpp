#pragma once

#include "engines.hpp"
#include "wire.hpp"

#include <stdexcept>
#include <string>

namespace tracecheck
{
    inline void write_alignment(WireWriter &w, const AlignmentRecord &rec)
    {
        w.write_f64(rec.cost);
        w.write_f64(rec.fitness);
        w.write_f64(rec.bestWorstCost);
        w.write_u64(rec.visitedStates);
        w.write_u64(rec.queuedStates);
        w.write_u64(rec.traversedArcs);
        w.write_u32(static_cast<std::uint32_t>(rec.alignment.size()));
        for (const auto &m : rec.alignment)
        {
            w.write_u8(static_cast<std::uint8_t>(m.kind));
            w.write_u8(static_cast<std::uint8_t>(m.silent ? 1 : 0));
            w.write_string(m.activity);
        }
    }

    inline AlignmentRecord read_alignment(WireReader &r)
    {
        AlignmentRecord rec;
        rec.cost = r.read_f64();
        rec.fitness = r.read_f64();
        rec.bestWorstCost = r.read_f64();
        rec.visitedStates = r.read_u64();
        rec.queuedStates = r.read_u64();
        rec.traversedArcs = r.read_u64();
        const std::uint32_t moves = r.read_u32();
        for (std::uint32_t i = 0; i < moves; ++i)
        {
            AlignmentMove m;
            const std::uint8_t kind = r.read_u8();
            if (kind > static_cast<std::uint8_t>(AlignmentMove::Kind::ModelOnly))
            {
                throw std::runtime_error("read_alignment: bad move kind " + std::to_string(kind));
            }
            m.kind = static_cast<AlignmentMove::Kind>(kind);
            m.silent = (r.read_u8() != 0);
            m.activity = r.read_string();
            rec.alignment.push_back(std::move(m));
        }
        return rec;
    }

    inline ByteBuffer encode_alignment(const AlignmentRecord &rec)
    {
        WireWriter w;
        write_alignment(w, rec);
        return w.take();
    }

    inline AlignmentRecord decode_alignment(std::span<const std::byte> bytes)
    {
        WireReader r(bytes);
        AlignmentRecord rec = read_alignment(r);
        if (!r.eof())
        {
            throw std::runtime_error("decode_alignment: trailing bytes");
        }
        return rec;
    }
}

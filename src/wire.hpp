#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tracecheck
{
    using ByteBuffer = std::vector<std::byte>;

    // Little-endian writer used to ship results between MPI ranks.
    class WireWriter
    {
    public:
        void write_u8(std::uint8_t v) { m_buf.push_back(static_cast<std::byte>(v)); }
        void write_u32(std::uint32_t v)
        {
            for (int i = 0; i < 4; ++i)
            {
                m_buf.push_back(static_cast<std::byte>((v >> (8 * i)) & 0xFFu));
            }
        }
        void write_u64(std::uint64_t v)
        {
            for (int i = 0; i < 8; ++i)
            {
                m_buf.push_back(static_cast<std::byte>((v >> (8 * i)) & 0xFFu));
            }
        }
        void write_f64(double v)
        {
            static_assert(sizeof(double) == sizeof(std::uint64_t));
            std::uint64_t bits = 0;
            std::memcpy(&bits, &v, sizeof(bits));
            write_u64(bits);
        }
        void write_string(std::string_view s)
        {
            if (s.size() > 0xFFFFFFFFu)
            {
                throw std::runtime_error("WireWriter: string too long");
            }
            write_u32(static_cast<std::uint32_t>(s.size()));
            const std::size_t at = m_buf.size();
            m_buf.resize(at + s.size());
            if (!s.empty())
            {
                std::memcpy(m_buf.data() + at, s.data(), s.size());
            }
        }

        ByteBuffer take() { return std::move(m_buf); }

    private:
        ByteBuffer m_buf;
    };

    class WireReader
    {
    public:
        explicit WireReader(std::span<const std::byte> bytes) : m_bytes(bytes) {}

        bool eof() const { return m_pos >= m_bytes.size(); }

        std::uint8_t read_u8()
        {
            require_(1);
            return static_cast<std::uint8_t>(m_bytes[m_pos++]);
        }

        std::uint32_t read_u32()
        {
            require_(4);
            std::uint32_t out = 0;
            for (int i = 0; i < 4; ++i)
            {
                out |= (static_cast<std::uint32_t>(static_cast<std::uint8_t>(m_bytes[m_pos++])) << (8 * i));
            }
            return out;
        }

        std::uint64_t read_u64()
        {
            require_(8);
            std::uint64_t out = 0;
            for (int i = 0; i < 8; ++i)
            {
                out |= (static_cast<std::uint64_t>(static_cast<std::uint8_t>(m_bytes[m_pos++])) << (8 * i));
            }
            return out;
        }

        double read_f64()
        {
            const std::uint64_t bits = read_u64();
            double out = 0.0;
            std::memcpy(&out, &bits, sizeof(out));
            return out;
        }

        std::string read_string()
        {
            const auto n = read_u32();
            require_(n);
            std::string out(n, '\0');
            if (n != 0)
            {
                std::memcpy(out.data(), m_bytes.data() + m_pos, n);
            }
            m_pos += n;
            return out;
        }

    private:
        void require_(std::size_t n) const
        {
            if (m_pos + n > m_bytes.size())
            {
                throw std::runtime_error("WireReader: truncated buffer");
            }
        }

        std::span<const std::byte> m_bytes;
        std::size_t m_pos = 0;
    };
}

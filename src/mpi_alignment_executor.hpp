#pragma once

#include "alignment_wire.hpp"
#include "engines.hpp"
#include "log.hpp"
#include "wire.hpp"

#include <mpi.h>

#include <cstdint>
#include <exception>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tracecheck
{
    namespace detail
    {
        inline void mpi_check(int rc, const char *what)
        {
            if (rc != MPI_SUCCESS)
            {
                throw std::runtime_error(std::string("MpiAlignmentExecutor: ") + what + " failed");
            }
        }

        // Per-rank payload: u8 failed flag, then either the failure message or
        // a u32 entry count followed by (u64 index, alignment) entries.
        inline ByteBuffer encode_rank_results(const std::vector<std::pair<std::uint64_t, AlignmentRecord>> &entries,
                                              const std::optional<std::string> &failure)
        {
            WireWriter w;
            w.write_u8(failure ? 1 : 0);
            if (failure)
            {
                w.write_string(*failure);
                return w.take();
            }
            w.write_u32(static_cast<std::uint32_t>(entries.size()));
            for (const auto &[index, rec] : entries)
            {
                w.write_u64(index);
                write_alignment(w, rec);
            }
            return w.take();
        }
    }

    // Spreads trace alignment over the ranks of a communicator. Rank r aligns
    // every index i with i % size == r; the results are exchanged with
    // MPI_Allgatherv and every rank returns the full list in input order.
    //
    // run() is collective: all ranks must call it with the same count. A
    // failure on any rank is carried through the exchange and raised as
    // std::runtime_error on every rank.
    class MpiAlignmentExecutor final : public IAlignmentExecutor
    {
    public:
        explicit MpiAlignmentExecutor(MPI_Comm comm = MPI_COMM_WORLD) : m_comm(comm)
        {
            if (m_comm == MPI_COMM_NULL)
            {
                throw std::runtime_error("MpiAlignmentExecutor: null communicator");
            }
        }

        std::vector<AlignmentRecord> run(std::size_t count, const AlignOne &alignOne) const override
        {
            int rank = 0;
            int size = 1;
            detail::mpi_check(MPI_Comm_rank(m_comm, &rank), "MPI_Comm_rank");
            detail::mpi_check(MPI_Comm_size(m_comm, &size), "MPI_Comm_size");

            const std::size_t ranks = static_cast<std::size_t>(size);
            const std::size_t self = static_cast<std::size_t>(rank);

            std::vector<std::pair<std::uint64_t, AlignmentRecord>> local;
            std::optional<std::string> failure;
            if (!alignOne)
            {
                failure = "null align function";
            }
            for (std::size_t i = self; !failure && i < count; i += ranks)
            {
                try
                {
                    local.emplace_back(static_cast<std::uint64_t>(i), alignOne(i));
                }
                catch (const std::exception &e)
                {
                    failure = e.what();
                }
                catch (...)
                {
                    failure = "non-standard exception";
                }
            }

            Logger::instance().logf(LogLevel::Debug, "executor", "rank %d aligned %zu of %zu traces%s", rank, local.size(), count,
                                    failure ? " (failed)" : "");

            const ByteBuffer mine = detail::encode_rank_results(local, failure);
            if (mine.size() > static_cast<std::size_t>(INT32_MAX))
            {
                throw std::runtime_error("MpiAlignmentExecutor: rank payload too large");
            }

            int mySize = static_cast<int>(mine.size());
            std::vector<int> sizes(ranks, 0);
            detail::mpi_check(MPI_Allgather(&mySize, 1, MPI_INT, sizes.data(), 1, MPI_INT, m_comm), "MPI_Allgather");

            std::vector<int> displs(ranks, 0);
            std::size_t total = 0;
            for (std::size_t r = 0; r < ranks; ++r)
            {
                displs[r] = static_cast<int>(total);
                total += static_cast<std::size_t>(sizes[r]);
            }
            if (total > static_cast<std::size_t>(INT32_MAX))
            {
                throw std::runtime_error("MpiAlignmentExecutor: gathered payload too large");
            }

            ByteBuffer all(total);
            detail::mpi_check(MPI_Allgatherv(mine.data(), mySize, MPI_BYTE, all.data(), sizes.data(), displs.data(), MPI_BYTE, m_comm),
                              "MPI_Allgatherv");

            std::vector<std::optional<AlignmentRecord>> slots(count);
            for (std::size_t r = 0; r < ranks; ++r)
            {
                WireReader reader(std::span<const std::byte>(all.data() + displs[r], static_cast<std::size_t>(sizes[r])));
                if (reader.read_u8() != 0)
                {
                    throw std::runtime_error("MpiAlignmentExecutor: alignment failed on rank " + std::to_string(r) + ": " + reader.read_string());
                }
                const std::uint32_t n = reader.read_u32();
                for (std::uint32_t k = 0; k < n; ++k)
                {
                    const std::uint64_t index = reader.read_u64();
                    if (index >= count || slots[index])
                    {
                        throw std::runtime_error("MpiAlignmentExecutor: bad result index " + std::to_string(index) + " from rank " + std::to_string(r));
                    }
                    slots[index] = read_alignment(reader);
                }
            }

            std::vector<AlignmentRecord> out;
            out.reserve(count);
            for (std::size_t i = 0; i < count; ++i)
            {
                if (!slots[i])
                {
                    throw std::runtime_error("MpiAlignmentExecutor: no result for trace " + std::to_string(i));
                }
                out.push_back(std::move(*slots[i]));
            }
            return out;
        }

    private:
        MPI_Comm m_comm;
    };
}

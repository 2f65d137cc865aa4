#pragma once

#include "engines.hpp"
#include "log.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace tracecheck
{
    namespace detail
    {
        // Threads joined on destruction, including while an exception unwinds.
        class JoiningThreads
        {
        public:
            JoiningThreads() = default;
            JoiningThreads(const JoiningThreads &) = delete;
            JoiningThreads &operator=(const JoiningThreads &) = delete;
            ~JoiningThreads() { join_all(); }

            void reserve(std::size_t n) { m_threads.reserve(n); }

            template <class Fn>
            void spawn(Fn &&fn)
            {
                m_threads.emplace_back(std::forward<Fn>(fn));
            }

            void join_all()
            {
                for (auto &t : m_threads)
                {
                    if (t.joinable())
                    {
                        t.join();
                    }
                }
            }

            std::size_t size() const noexcept { return m_threads.size(); }

        private:
            std::vector<std::thread> m_threads;
        };
    }

    // Aligns traces on a fixed pool of threads. Each worker pulls the next
    // unclaimed index, so records land at their input position regardless of
    // completion order. The first worker failure is rethrown after all workers
    // have joined; no partial result is returned.
    class ThreadedAlignmentExecutor final : public IAlignmentExecutor
    {
    public:
        explicit ThreadedAlignmentExecutor(std::size_t workers = 0) : m_workers(workers) {}

        std::size_t worker_count(std::size_t count) const noexcept
        {
            std::size_t n = m_workers;
            if (n == 0)
            {
                n = std::max<std::size_t>(1, std::thread::hardware_concurrency());
            }
            return std::min(n, std::max<std::size_t>(1, count));
        }

        std::vector<AlignmentRecord> run(std::size_t count, const AlignOne &alignOne) const override
        {
            if (!alignOne)
            {
                throw std::runtime_error("ThreadedAlignmentExecutor: null align function");
            }

            std::vector<std::optional<AlignmentRecord>> slots(count);
            std::atomic<std::size_t> next{0};
            std::atomic<bool> failed{false};
            std::exception_ptr firstError;
            std::mutex errMu;

            const auto work = [&]()
            {
                while (!failed.load(std::memory_order_relaxed))
                {
                    const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
                    if (i >= count)
                    {
                        return;
                    }
                    try
                    {
                        slots[i] = alignOne(i);
                    }
                    catch (...)
                    {
                        std::lock_guard<std::mutex> lk(errMu);
                        if (!firstError)
                        {
                            firstError = std::current_exception();
                        }
                        failed.store(true, std::memory_order_relaxed);
                        return;
                    }
                }
            };

            const std::size_t n = worker_count(count);
            Logger::instance().logf(LogLevel::Debug, "executor", "aligning %zu traces on %zu threads", count, n);

            detail::JoiningThreads pool;
            pool.reserve(n);
            try
            {
                for (std::size_t w = 0; w < n; ++w)
                {
                    pool.spawn(work);
                }
            }
            catch (const std::system_error &)
            {
                // Stop the workers already started; the pool joins them on unwind.
                failed.store(true, std::memory_order_relaxed);
                throw;
            }
            pool.join_all();

            if (firstError)
            {
                std::rethrow_exception(firstError);
            }

            std::vector<AlignmentRecord> out;
            out.reserve(count);
            for (auto &s : slots)
            {
                out.push_back(std::move(*s));
            }
            return out;
        }

    private:
        std::size_t m_workers = 0;
    };
}

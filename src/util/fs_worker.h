#pragma once

#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>

#include "../namespaces.h"
#include "../or_throw.h"
#include "executor.h"

namespace tmpguard { namespace util {

namespace detail {
    // Completion signature of a job returning `R`.
    template<class R> struct completion_signature {
        using type = void(sys::error_code, R);
    };

    template<> struct completion_signature<void> {
        using type = void(sys::error_code);
    };
} // detail namespace

// Runs blocking filesystem calls on a dedicated thread.
//
// Coroutines use `run` to wait for a job without blocking their executor,
// destructors (which cannot wait) use `post` to hand work over.
// Copies of an `FsWorker` share the same thread,
// which is stopped after the last copy goes away
// once every job posted to it has run.
class FsWorker {
private:
    struct Impl;

public:
    // Used by handles not given a worker explicitly.
    // Created on first use, so it is stopped before the logger goes away.
    static FsWorker& global();

    // Refers to a worker without keeping it alive.
    class WeakRef {
    public:
        WeakRef() = default;

        boost::optional<FsWorker> lock() const {
            auto impl = _impl.lock();
            if (!impl) return boost::none;
            return FsWorker(std::move(impl));
        }

    private:
        friend class FsWorker;
        explicit WeakRef(std::weak_ptr<Impl> impl) : _impl(std::move(impl)) {}

        std::weak_ptr<Impl> _impl;
    };

    FsWorker();

    WeakRef weak_ref() const { return WeakRef(_impl); }

    // Whether jobs are still accepted.
    bool is_running() const;

    // Run `job(ec)` on the worker thread and resume the calling coroutine
    // with its result (and error) once it is done.
    // If the worker was stopped the job runs on the calling thread instead.
    template<class Job>
    auto run(Job job, asio::yield_context yield)
        -> std::invoke_result_t<Job&, sys::error_code&>;

    // Run `job(ec)` on the calling thread, reporting like `run` does.
    template<class Job>
    static auto run_here(Job job, asio::yield_context yield)
        -> std::invoke_result_t<Job&, sys::error_code&>;

    // Wait for every job posted before this call to finish.
    void flush(asio::yield_context yield) {
        run([] (sys::error_code&) {}, yield);
    }

    // Queue `job` on the worker thread without waiting for it.
    // Returns false (and drops the job) if the worker was stopped.
    template<class Job>
    bool post(Job job);

    // Stop accepting jobs, let queued ones finish and join the thread.
    // Idempotent.
    void stop();

private:
    explicit FsWorker(std::shared_ptr<Impl> impl) : _impl(std::move(impl)) {}

    // Jobs posted to `executor` while `lock` is held are guaranteed to run.
    struct Submission {
        AsioExecutor executor;
        std::unique_lock<std::mutex> lock;
    };

    // Empty if the worker was stopped.
    boost::optional<Submission> submission() const;

private:
    std::shared_ptr<Impl> _impl;
};

template<class Job>
auto FsWorker::run_here(Job job, asio::yield_context yield)
    -> std::invoke_result_t<Job&, sys::error_code&>
{
    using R = std::invoke_result_t<Job&, sys::error_code&>;
    sys::error_code ec;

    if constexpr (std::is_void<R>::value) {
        job(ec);
        return or_throw(yield, ec);
    } else {
        R r = job(ec);
        return or_throw(yield, ec, std::move(r));
    }
}

template<class Job>
bool FsWorker::post(Job job)
{
    auto sub = submission();
    if (!sub) return false;
    asio::post(sub->executor, std::move(job));
    return true;
}

template<class Job>
auto FsWorker::run(Job job, asio::yield_context yield)
    -> std::invoke_result_t<Job&, sys::error_code&>
{
    using R = std::invoke_result_t<Job&, sys::error_code&>;
    static constexpr bool is_void = std::is_void<R>::value;
    using Signature = typename detail::completion_signature<R>::type;

    auto sub = submission();

    if (!sub) return run_here(std::move(job), yield);

    return asio::async_initiate<asio::yield_context, Signature>(
        [ sub = std::move(*sub)
        , job = std::move(job)
        , work = asio::make_work_guard(yield_executor(yield))
        ] (auto completion_handler) mutable {
            asio::post(sub.executor,
            [ job = std::move(job)
            , handler = std::move(completion_handler)
            , work = std::move(work)
            ] () mutable {
                sys::error_code ec;
                if constexpr (is_void) {
                    job(ec);
                    asio::post(work.get_executor(),
                        [h = std::move(handler), ec] () mutable { h(ec); });
                } else {
                    R r = job(ec);
                    asio::post(work.get_executor(),
                        [h = std::move(handler), ec, r = std::move(r)] () mutable {
                            h(ec, std::move(r));
                        });
                }
            });
            // Do not hold it while the coroutine is suspended.
            sub.lock.unlock();
        },
        yield);
}

// Run `job(ec)` on the referred worker,
// or on the calling thread if it is gone or stopped.
template<class Job>
auto run_blocking(const FsWorker::WeakRef& worker, Job job, asio::yield_context yield)
    -> std::invoke_result_t<Job&, sys::error_code&>
{
    if (auto w = worker.lock()) return w->run(std::move(job), yield);
    return FsWorker::run_here(std::move(job), yield);
}

}} // namespaces

#include <thread>

#include <boost/asio/io_context.hpp>

#include "../logger.h"
#include "fs_worker.h"

namespace tmpguard { namespace util {

FsWorker& FsWorker::global()
{
    static FsWorker worker;
    return worker;
}

using WorkGuard = asio::executor_work_guard<AsioExecutor>;

struct FsWorker::Impl {
    // Shared with the thread, which may outlive this if it drops the last reference.
    std::shared_ptr<asio::io_context> ctx;
    AsioExecutor thread_exec;
    WorkGuard work_guard;
    std::thread thread;

    std::mutex mutex;
    bool stopped = false;

    Impl()
        : ctx(std::make_shared<asio::io_context>())
        , thread_exec(ctx->get_executor())
        , work_guard(thread_exec)
    {
        thread = std::thread([ctx = ctx] () {
            Logger::set_thread_tag("fs-worker");
            for (;;) {
                try {
                    ctx->run();
                    break;
                }
                catch (const std::exception& e) {
                    LOG_ERROR("Job failed: ", e.what());
                }
            }
        });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopped) return;
            stopped = true;
        }

        // Queued jobs still run before `run` returns.
        work_guard.reset();

        if (thread.get_id() == std::this_thread::get_id()) {
            // Last reference dropped by a job: the thread cannot join itself,
            // it finishes on its own and frees the context.
            thread.detach();
            return;
        }

        if (thread.joinable()) thread.join();
    }

    ~Impl() {
        stop();
    }
};

FsWorker::FsWorker()
    : _impl(std::make_shared<Impl>())
{}

bool FsWorker::is_running() const
{
    std::lock_guard<std::mutex> lock(_impl->mutex);
    return !_impl->stopped;
}

boost::optional<FsWorker::Submission> FsWorker::submission() const
{
    std::unique_lock<std::mutex> lock(_impl->mutex);
    if (_impl->stopped) return boost::none;
    return Submission{_impl->thread_exec, std::move(lock)};
}

void FsWorker::stop()
{
    _impl->stop();
}

}} // namespaces

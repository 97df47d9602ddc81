#include <pdfscrub/ScrubWorkerPool.hh>

#include <condition_variable>
#include <exception>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

class ScrubWorkerPool::Members
{
    friend class ScrubWorkerPool;

  public:
    Members() = default;
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    std::mutex mutex;
    std::condition_variable task_ready;
    std::condition_variable all_done;
    size_t pending{0};
    size_t failed{0};
    bool stop{false};
    std::exception_ptr first_error;
};

ScrubWorkerPool::ScrubWorkerPool(size_t threads) :
    m(std::make_unique<Members>())
{
    for (size_t i = 0; i < threads; ++i) {
        m->workers.emplace_back([this] { workerThread(); });
    }
}

ScrubWorkerPool::~ScrubWorkerPool()
{
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        m->stop = true;
    }
    m->task_ready.notify_all();
    for (auto& worker: m->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void
ScrubWorkerPool::runTask(std::function<void()> const& task)
{
    try {
        task();
    } catch (...) {
        // Hand the exception to the thread that calls waitAll().
        std::unique_lock<std::mutex> lock(m->mutex);
        ++m->failed;
        if (!m->first_error) {
            m->first_error = std::current_exception();
        }
    }
}

void
ScrubWorkerPool::submit(std::function<void()> task)
{
    if (m->workers.empty()) {
        runTask(task);
        return;
    }
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        ++m->pending;
        m->tasks.push(std::move(task));
    }
    m->task_ready.notify_one();
}

void
ScrubWorkerPool::waitAll()
{
    std::exception_ptr error;
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        m->all_done.wait(lock, [this] { return m->pending == 0 && m->tasks.empty(); });
        std::swap(error, m->first_error);
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

void
ScrubWorkerPool::forEachIndex(ScrubWorkerPool* pool, size_t n, std::function<void(size_t)> const& fn)
{
    if (pool == nullptr) {
        for (size_t i = 0; i < n; ++i) {
            fn(i);
        }
        return;
    }
    for (size_t i = 0; i < n; ++i) {
        pool->submit([&fn, i] { fn(i); });
    }
    pool->waitAll();
}

size_t
ScrubWorkerPool::getThreadCount() const
{
    return m->workers.size();
}

size_t
ScrubWorkerPool::getFailedTaskCount() const
{
    std::unique_lock<std::mutex> lock(m->mutex);
    return m->failed;
}

void
ScrubWorkerPool::workerThread()
{
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m->mutex);
            m->task_ready.wait(lock, [this] { return m->stop || !m->tasks.empty(); });
            if (m->stop && m->tasks.empty()) {
                return;
            }
            task = std::move(m->tasks.front());
            m->tasks.pop();
        }

        runTask(task);

        {
            std::unique_lock<std::mutex> lock(m->mutex);
            --m->pending;
            if (m->pending == 0 && m->tasks.empty()) {
                m->all_done.notify_all();
            }
        }
    }
}

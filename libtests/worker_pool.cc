#include <pdfscrub/assert_test.h>

#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubResourceTracker.hh>
#include <pdfscrub/ScrubWorkerPool.hh>

#include <atomic>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

static void
test_for_each()
{
    ScrubWorkerPool pool(4);
    assert(pool.getThreadCount() == 4);
    std::vector<size_t> slots(1000, 0);
    ScrubWorkerPool::forEachIndex(&pool, slots.size(), [&slots](size_t i) { slots.at(i) = i * 2; });
    for (size_t i = 0; i < slots.size(); ++i) {
        assert(slots.at(i) == i * 2);
    }

    // The pool is reusable after a barrier.
    std::atomic<int> count{0};
    for (int i = 0; i < 50; ++i) {
        pool.submit([&count] { ++count; });
    }
    pool.waitAll();
    assert(count == 50);
    assert(pool.getFailedTaskCount() == 0);

    // Without a pool, work happens in the calling thread.
    auto self = std::this_thread::get_id();
    bool same_thread = true;
    ScrubWorkerPool::forEachIndex(nullptr, 3, [&](size_t) {
        same_thread = same_thread && (std::this_thread::get_id() == self);
    });
    assert(same_thread);
}

static void
test_synchronous()
{
    ScrubWorkerPool pool(0);
    assert(pool.getThreadCount() == 0);
    int value = 0;
    pool.submit([&value] { value = 5; });
    // Already done before waitAll
    assert(value == 5);
    pool.waitAll();

    pool.submit([] { throw std::runtime_error("sync failure"); });
    assert(pool.getFailedTaskCount() == 1);
    bool thrown = false;
    try {
        pool.waitAll();
    } catch (std::runtime_error& e) {
        assert(std::string(e.what()) == "sync failure");
        thrown = true;
    }
    assert(thrown);
}

static void
test_exceptions()
{
    ScrubWorkerPool pool(3);
    std::atomic<int> finished{0};
    for (int i = 0; i < 20; ++i) {
        pool.submit([i, &finished] {
            if (i % 5 == 0) {
                throw ScrubExc(scrub_e_processing, "test", "", "task " + std::to_string(i));
            }
            ++finished;
        });
    }
    bool thrown = false;
    try {
        pool.waitAll();
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_processing);
        thrown = true;
    }
    assert(thrown);
    // Other tasks still ran.
    assert(finished == 16);
    assert(pool.getFailedTaskCount() == 4);

    // The error is reported once.
    pool.waitAll();
}

static void
test_tracker()
{
    ScrubResourceTracker tracker(100);
    assert(tracker.getLimit() == 100);
    tracker.allocate(60);
    bool thrown = false;
    try {
        tracker.allocate(50);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_processing);
        thrown = true;
    }
    assert(thrown);
    assert(tracker.getCurrent() == 60);
    tracker.release(60);
    assert(tracker.getCurrent() == 0);
    assert(tracker.getPeak() == 60);

    {
        ScrubResourceTracker::Reservation r(&tracker);
        r.add(30);
        r.add(40);
        assert(r.size() == 70);
        assert(tracker.getCurrent() == 70);
    }
    assert(tracker.getCurrent() == 0);
    assert(tracker.getPeak() == 70);

    // Without a tracker, a reservation only counts.
    ScrubResourceTracker::Reservation untracked(nullptr);
    untracked.add(1000);
    assert(untracked.size() == 1000);

    tracker.setLimit(0);
    tracker.allocate(1 << 20);
    assert(tracker.getPeak() == (1 << 20));
    tracker.release(1 << 20);

    // Many threads sharing one tracker
    ScrubResourceTracker shared;
    ScrubWorkerPool pool(4);
    ScrubWorkerPool::forEachIndex(&pool, 200, [&shared](size_t) {
        ScrubResourceTracker::Reservation r(&shared);
        r.add(10);
    });
    assert(shared.getCurrent() == 0);
    assert(shared.getPeak() >= 10);
    assert(shared.getPeak() <= 40);
}

int
main()
{
    test_for_each();
    test_synchronous();
    test_exceptions();
    test_tracker();
    std::cout << "worker pool tests passed" << std::endl;
    return 0;
}

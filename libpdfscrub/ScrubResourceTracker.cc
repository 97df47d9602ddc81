#include <pdfscrub/ScrubResourceTracker.hh>

#include <pdfscrub/ScrubExc.hh>

ScrubResourceTracker::ScrubResourceTracker(size_t limit) :
    limit(limit)
{
}

void
ScrubResourceTracker::allocate(size_t bytes)
{
    size_t cur = current.load();
    size_t next;
    do {
        next = cur + bytes;
        auto lim = limit.load();
        if (lim && next > lim) {
            throw ScrubExc(
                scrub_e_processing,
                "",
                "",
                "resource limit of " + std::to_string(lim) + " bytes exceeded (requested " +
                    std::to_string(bytes) + " with " + std::to_string(cur) + " in use)");
        }
    } while (!current.compare_exchange_weak(cur, next));

    size_t old_peak = peak.load();
    while (next > old_peak && !peak.compare_exchange_weak(old_peak, next)) {
    }
}

void
ScrubResourceTracker::release(size_t bytes)
{
    size_t cur = current.load();
    size_t next;
    do {
        next = (bytes > cur ? 0 : cur - bytes);
    } while (!current.compare_exchange_weak(cur, next));
}

size_t
ScrubResourceTracker::getCurrent() const
{
    return current.load();
}

size_t
ScrubResourceTracker::getPeak() const
{
    return peak.load();
}

size_t
ScrubResourceTracker::getLimit() const
{
    return limit.load();
}

void
ScrubResourceTracker::setLimit(size_t new_limit)
{
    limit = new_limit;
}

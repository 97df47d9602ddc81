#include <pdfscrub/assert_test.h>

#include <pdfscrub/Pl_Buffer.hh>
#include <pdfscrub/Pl_Count.hh>
#include <pdfscrub/Pl_Flate.hh>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubResourceTracker.hh>

#include <algorithm>
#include <iostream>
#include <stdexcept>

static std::string
sample_data()
{
    std::string data;
    for (int i = 0; i < 20000; ++i) {
        data += "line " + std::to_string(i % 97) + " of the sample\n";
    }
    return data;
}

static void
test_round_trip()
{
    auto data = sample_data();
    auto compressed = Pl_Flate::deflate(data);
    assert(compressed.size() < data.size());
    assert(Pl_Flate::inflate(compressed) == data);

    // Both directions chained through one pipeline, fed in small pieces
    Pl_Buffer out("out");
    Pl_Count count("count", &out);
    Pl_Flate inf("inf", &count, Pl_Flate::a_inflate);
    Pl_Flate def("def", &inf, Pl_Flate::a_deflate);
    size_t pos = 0;
    while (pos < data.size()) {
        size_t len = std::min(size_t(1000), data.size() - pos);
        def.write(reinterpret_cast<unsigned char const*>(data.data()) + pos, len);
        pos += len;
    }
    def.finish();
    assert(count.getCount() == static_cast<long long>(data.size()));
    assert(out.getString() == data);

    assert(Pl_Flate::inflate(Pl_Flate::deflate("")) == "");
}

static void
test_compression_level()
{
    auto data = sample_data();
    Pl_Flate::setCompressionLevel(1);
    auto fast = Pl_Flate::deflate(data);
    Pl_Flate::setCompressionLevel(9);
    auto best = Pl_Flate::deflate(data);
    Pl_Flate::setCompressionLevel(-1);
    assert(best.size() <= fast.size());
    assert(Pl_Flate::inflate(fast) == data);
    assert(Pl_Flate::inflate(best) == data);
}

static void
test_corrupt()
{
    bool thrown = false;
    try {
        Pl_Flate::inflate("this is not zlib data");
    } catch (std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
}

static void
test_tracker()
{
    auto data = sample_data();
    auto compressed = Pl_Flate::deflate(data);

    ScrubResourceTracker unlimited;
    assert(Pl_Flate::inflate(compressed, &unlimited) == data);
    assert(unlimited.getCurrent() == 0);
    assert(unlimited.getPeak() >= data.size());

    ScrubResourceTracker tracker(data.size() / 2);
    bool thrown = false;
    try {
        Pl_Flate::inflate(compressed, &tracker);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_processing);
        thrown = true;
    }
    assert(thrown);
    // Everything charged by the failed pipeline is returned.
    assert(tracker.getCurrent() == 0);
    assert(tracker.getPeak() > 0);
    assert(tracker.getPeak() <= tracker.getLimit());

    // Deflating is not charged.
    ScrubResourceTracker deflate_tracker(1);
    Pl_Buffer out("out");
    Pl_Flate def("def", &out, Pl_Flate::a_deflate);
    def.setResourceTracker(&deflate_tracker);
    def.write(reinterpret_cast<unsigned char const*>(data.data()), data.size());
    def.finish();
    assert(deflate_tracker.getPeak() == 0);
}

int
main()
{
    test_round_trip();
    test_compression_level();
    test_corrupt();
    test_tracker();
    std::cout << "flate tests passed" << std::endl;
    return 0;
}

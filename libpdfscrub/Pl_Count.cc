#include <pdfscrub/Pl_Count.hh>

#include <pdfscrub/ScrubIntC.hh>
#include <pdfscrub/Util.hh>

using namespace pdfscrub;

class Pl_Count::Members
{
  public:
    Members() = default;
    Members(Members const&) = delete;
    ~Members() = default;

    // Must be scrub_offset_t, not size_t, to handle writing more than
    // size_t can handle.
    scrub_offset_t count{0};
};

Pl_Count::Pl_Count(char const* identifier, Pipeline* next) :
    Pipeline(identifier, next),
    m(std::make_unique<Members>())
{
    util::assertion(next, "Attempt to create Pl_Count with nullptr as next");
}

// Must be explicit and not inline -- see PDFSCRUB_DLL_CLASS in DLL.h
Pl_Count::~Pl_Count() = default;

void
Pl_Count::write(unsigned char const* buf, size_t len)
{
    if (len) {
        m->count += ScrubIntC::to_offset(len);
        next()->write(buf, len);
    }
}

void
Pl_Count::finish()
{
    next()->finish();
}

scrub_offset_t
Pl_Count::getCount() const
{
    return m->count;
}

#include <pdfscrub/ScrubXRefEntry.hh>

#include <pdfscrub/ScrubIntC.hh>
#include <pdfscrub/Util.hh>

using namespace pdfscrub;

ScrubXRefEntry::ScrubXRefEntry() = default;

ScrubXRefEntry::ScrubXRefEntry(int type, scrub_offset_t field1, int field2) :
    type(type),
    field1(field1),
    field2(field2)
{
    util::assertion(type == 1 || type == 2, "invalid xref type " + std::to_string(type));
}

int
ScrubXRefEntry::getType() const
{
    return type;
}

scrub_offset_t
ScrubXRefEntry::getOffset() const
{
    util::assertion(type == 1, "getOffset called for xref entry of type != 1");
    return field1;
}

int
ScrubXRefEntry::getObjStreamNumber() const
{
    util::assertion(type == 2, "getObjStreamNumber called for xref entry of type != 2");
    return ScrubIntC::to_int(field1);
}

int
ScrubXRefEntry::getObjStreamIndex() const
{
    util::assertion(type == 2, "getObjStreamIndex called for xref entry of type != 2");
    return field2;
}

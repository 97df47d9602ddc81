#include <pdfscrub/ScrubDocument_private.hh>

#include <pdfscrub/Pl_Discard.hh>
#include <pdfscrub/ScrubWriter.hh>

using namespace pdfscrub;

ScrubXRefTable const&
ScrubDocument::rebuildXRef()
{
    // Offsets come from the same serializer that produces the file, so
    // there is no separate size model to keep in sync.
    Pl_Discard discard;
    ScrubWriter w(*this);
    w.setOutputPipeline(&discard);
    w.write();

    m->xref_tables.clear();
    m->xref_tables.push_back(w.getXRefTable());
    m->stats.xref_entries = m->xref_tables.back().size();
    debug(
        m->log,
        "rebuildXRef: " + std::to_string(m->stats.xref_entries) + " entries, xref at " +
            std::to_string(w.getStartXRef()));
    return m->xref_tables.back();
}

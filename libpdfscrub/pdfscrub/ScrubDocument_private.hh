#ifndef SCRUBDOCUMENT_PRIVATE_HH
#define SCRUBDOCUMENT_PRIVATE_HH

#include <pdfscrub/ScrubDocument.hh>

#include <pdfscrub/ScrubLogger.hh>
#include <pdfscrub/ScrubUtil.hh>

class ScrubDocument::Members
{
    friend class ScrubDocument;

  public:
    Members() = default;
    Members(Members const&) = default;
    ~Members() = default;

  private:
    std::shared_ptr<ScrubLogger> log{ScrubLogger::defaultLogger()};
    ObjectMap objects;
    Trailer trailer;
    std::optional<std::string> metadata;
    std::vector<ScrubXRefTable> xref_tables;
    std::vector<ScrubIssue> issues;
    StructureStats stats;
};

namespace pdfscrub
{
    // Write a diagnostic line to the info channel when PDFSCRUB_DEBUG
    // is set in the environment.
    inline void
    debug(std::shared_ptr<ScrubLogger> const& log, std::string const& msg)
    {
        static bool const enabled = ScrubUtil::get_env("PDFSCRUB_DEBUG");
        if (enabled && log) {
            log->info("DEBUG: " + msg + "\n");
        }
    }
} // namespace pdfscrub

#endif // SCRUBDOCUMENT_PRIVATE_HH

#include <pdfscrub/ScrubDocument_private.hh>

#include <cstdint>
#include <map>
#include <string_view>
#include <vector>

using namespace pdfscrub;

namespace
{
    // FNV-1a, 64-bit. Used for bucketing only; objects in the same
    // bucket are compared in full before they are merged.
    class FNV1a
    {
      public:
        void
        update(std::string_view data)
        {
            for (auto ch: data) {
                value ^= static_cast<unsigned char>(ch);
                value *= prime;
            }
        }

        void
        update(unsigned char ch)
        {
            value ^= ch;
            value *= prime;
        }

        uint64_t
        digest() const
        {
            return value;
        }

      private:
        static constexpr uint64_t prime = 0x100000001b3ULL;
        uint64_t value{0xcbf29ce484222325ULL};
    };

    size_t const stream_hash_prefix = 1024;
} // namespace

static uint64_t
object_hash(ScrubObject const& obj)
{
    FNV1a h;
    h.update(static_cast<unsigned char>(obj.getTypeCode()));
    if (obj.isStream()) {
        h.update(obj.getFilterKey());
        // Separate the filter from the data so that ("/A", "B...") and
        // ("/AB", "...") hash differently.
        h.update(static_cast<unsigned char>(0));
        auto const& data = obj.getStreamData();
        h.update(std::string_view(data).substr(0, stream_hash_prefix));
    } else {
        h.update(obj.unparse());
    }
    return h.digest();
}

static size_t
deduplicate_pass(ScrubDocument& doc, std::shared_ptr<ScrubLogger> const& log)
{
    auto& objects = doc.getObjects();

    // 1. Group by hash. The object map is ordered, so every group lists
    // its members in ascending id order.
    std::map<uint64_t, std::vector<ScrubObjGen>> groups;
    for (auto const& [og, obj]: objects) {
        groups[object_hash(obj)].push_back(og);
    }

    // 2. Within each group, the first member equal to a candidate is
    // its canonical copy.
    std::map<ScrubObjGen, ScrubObjGen> replacements;
    for (auto const& group: groups) {
        auto const& ids = group.second;
        if (ids.size() < 2) {
            continue;
        }
        std::vector<ScrubObjGen> masters;
        for (auto const& candidate: ids) {
            bool merged = false;
            auto const& cobj = objects.at(candidate);
            for (auto const& master: masters) {
                if (objects.at(master) == cobj) {
                    replacements[candidate] = master;
                    merged = true;
                    break;
                }
            }
            if (!merged) {
                masters.push_back(candidate);
            }
        }
    }

    if (replacements.empty()) {
        debug(log, "deduplicate_pass: no change");
        return 0;
    }
    debug(
        log,
        "deduplicate_pass: consolidated " + std::to_string(replacements.size()) +
            " duplicate objects");

    // 3. Point every reference, including the trailer's, at the
    // canonical copies and drop the duplicates.
    auto redirect = [&replacements](ScrubObjGen og) {
        auto iter = replacements.find(og);
        return ScrubObject::newReference(iter == replacements.end() ? og : iter->second);
    };
    for (auto& iter: objects) {
        iter.second.rewriteReferences(redirect);
    }
    auto& trailer = doc.getTrailer();
    if (trailer.encrypt) {
        trailer.encrypt->rewriteReferences(redirect);
    }
    trailer.root = redirect(trailer.root).getRef();
    if (trailer.info) {
        trailer.info = redirect(*trailer.info).getRef();
    }
    for (auto const& iter: replacements) {
        objects.erase(iter.first);
    }
    return replacements.size();
}

size_t
ScrubDocument::deduplicateObjects()
{
    // Merging children can make their parents identical, so repeat
    // until a pass finds nothing. Every productive pass removes at
    // least one object, so this terminates.
    size_t total = 0;
    int pass = 0;
    while (true) {
        ++pass;
        size_t removed = deduplicate_pass(*this, m->log);
        if (removed == 0) {
            break;
        }
        total += removed;
    }
    m->stats.duplicates_removed += total;
    debug(
        m->log,
        "deduplicateObjects: removed " + std::to_string(total) + " objects in " +
            std::to_string(pass) + " passes");
    return total;
}

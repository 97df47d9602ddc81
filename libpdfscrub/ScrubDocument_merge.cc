#include <pdfscrub/ScrubDocument_private.hh>

#include <vector>

using namespace pdfscrub;

static bool
can_merge(
    ScrubObject const& a, ScrubObject const& b, ScrubDocument::StreamMergeConfig const& config)
{
    auto filter = a.getFilterKey();
    if (filter != b.getFilterKey() || config.allowed_filters.count(filter) == 0) {
        return false;
    }
    if (a.getKey("/Type") != b.getKey("/Type") || a.getKey("/Subtype") != b.getKey("/Subtype") ||
        a.getKey("/DecodeParms") != b.getKey("/DecodeParms")) {
        return false;
    }
    // Image samples are laid out by /Width and /Height; two images
    // can't be joined by concatenation.
    return !a.isDictionaryOfType("", "/Image");
}

size_t
ScrubDocument::mergeSmallStreams()
{
    return mergeSmallStreams(StreamMergeConfig());
}

size_t
ScrubDocument::mergeSmallStreams(StreamMergeConfig const& config)
{
    std::vector<ScrubObjGen> candidates;
    for (auto const& [og, obj]: m->objects) {
        if (obj.isStream() && obj.getStreamData().size() < config.threshold) {
            candidates.push_back(og);
        }
    }

    // Map from each merged-away stream to the stream that absorbed it
    std::map<ScrubObjGen, ScrubObjGen> merged_into;
    ScrubObjGen keep;
    for (auto const& og: candidates) {
        auto& obj = m->objects.at(og);
        if (keep.isIndirect()) {
            auto& kept = m->objects.at(keep);
            if (kept.getStreamData().size() < config.threshold && can_merge(kept, obj, config)) {
                kept.replaceStreamData(kept.getStreamData() + obj.getStreamData());
                merged_into[og] = keep;
                continue;
            }
        }
        keep = og;
    }
    if (merged_into.empty()) {
        return 0;
    }

    auto redirect = [&merged_into](ScrubObjGen og) {
        auto iter = merged_into.find(og);
        return iter == merged_into.end() ? og : iter->second;
    };
    auto update = [&merged_into, &redirect](ScrubObject& obj) {
        if (obj.isReference()) {
            obj.setRef(redirect(obj.getRef()));
        } else if (obj.isArray()) {
            // [a b] where b was merged into a becomes [a], not [a a].
            ScrubObject::Array items;
            for (auto const& item: obj.getArray()) {
                if (item.isReference() && merged_into.count(item.getRef()) && !items.empty() &&
                    items.back().isReference() &&
                    items.back().getRef() == redirect(item.getRef())) {
                    continue;
                }
                items.push_back(item);
            }
            obj.getArray() = std::move(items);
        }
    };
    for (auto const& iter: merged_into) {
        m->objects.erase(iter.first);
    }
    for (auto& iter: m->objects) {
        iter.second.forEach(update);
    }
    if (m->trailer.encrypt) {
        m->trailer.encrypt->forEach(update);
    }
    m->trailer.root = redirect(m->trailer.root);
    if (m->trailer.info) {
        m->trailer.info = redirect(*m->trailer.info);
    }

    m->stats.streams_merged += merged_into.size();
    debug(m->log, "mergeSmallStreams: merged " + std::to_string(merged_into.size()) + " streams");
    return merged_into.size();
}

#include <pdfscrub/ScrubMetadataSanitizer.hh>

#include <pdfscrub/ScrubDocument.hh>
#include <pdfscrub/ScrubObject.hh>

std::set<std::string> const&
ScrubMetadataSanitizer::getMetadataKeys()
{
    static std::set<std::string> const keys{"/Metadata", "/Info", "/PieceInfo"};
    return keys;
}

size_t
ScrubMetadataSanitizer::removeMetadataKeys(ScrubObject& obj)
{
    auto const& keys = getMetadataKeys();
    size_t removed = 0;
    obj.forEach([&keys, &removed](ScrubObject& o) {
        if (o.isDictionary() || o.isStream()) {
            removed += std::erase_if(
                o.getDict(), [&keys](auto const& item) { return keys.count(item.first) > 0; });
        }
    });
    return removed;
}

size_t
ScrubMetadataSanitizer::sanitizeDocument(ScrubDocument& doc)
{
    if (doc.getMetadata()) {
        doc.clearMetadata();
        stats.document_metadata_removed = true;
    }
    if (doc.getTrailer().info) {
        doc.getTrailer().info.reset();
        stats.trailer_info_removed = true;
    }
    size_t total = 0;
    for (auto& iter: doc.getObjects()) {
        size_t removed = removeMetadataKeys(iter.second);
        if (removed) {
            total += removed;
            ++stats.objects_modified;
        }
    }
    stats.keys_removed += total;
    return total;
}

ScrubMetadataSanitizer::Stats const&
ScrubMetadataSanitizer::getStats() const
{
    return stats;
}

void
ScrubMetadataSanitizer::reset()
{
    stats = Stats();
}

#include <pdfscrub/ScrubBinarySanitizer.hh>

#include <pdfscrub/Pl_Flate.hh>
#include <pdfscrub/ScrubDocument.hh>
#include <pdfscrub/ScrubObject.hh>
#include <pdfscrub/ScrubWorkerPool.hh>

#include <set>
#include <stdexcept>

class ScrubBinarySanitizer::Members
{
    friend class ScrubBinarySanitizer;

  public:
    Members() = default;
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    ScrubResourceTracker* tracker{nullptr};
    Stats stats;
};

namespace
{
    std::set<std::string> const binary_subtypes{"/Image", "/Form", "/ICCProfile"};

    // Dictionary keys whose string values are bytes, not text: file
    // identifiers, standard security handler hashes, and certificates
    std::set<std::string> const binary_string_keys{
        "/ID", "/O", "/U", "/OE", "/UE", "/Perms", "/Cert"};

    unsigned char
    byte_at(std::string const& data, size_t pos)
    {
        return static_cast<unsigned char>(data.at(pos));
    }

    unsigned long
    read_be(std::string const& data, size_t pos, size_t len)
    {
        if (pos + len > data.size()) {
            throw std::runtime_error("binary data is truncated");
        }
        unsigned long result = 0;
        for (size_t i = 0; i < len; ++i) {
            result = (result << 8) | byte_at(data, pos + i);
        }
        return result;
    }

    void
    add_stats(ScrubBinarySanitizer::Stats& to, ScrubBinarySanitizer::Stats const& from)
    {
        to.objects_sanitized += from.objects_sanitized;
        to.bytes_processed += from.bytes_processed;
        to.bytes_removed += from.bytes_removed;
        to.metadata_removed += from.metadata_removed;
    }
} // namespace

ScrubBinarySanitizer::ScrubBinarySanitizer() :
    m(std::make_unique<Members>())
{
}

ScrubBinarySanitizer::~ScrubBinarySanitizer() = default;

void
ScrubBinarySanitizer::setResourceTracker(ScrubResourceTracker* tracker)
{
    m->tracker = tracker;
}

ScrubBinarySanitizer::data_type_e
ScrubBinarySanitizer::detectType(std::string const& data)
{
    if (data.size() >= 3 && data.compare(0, 3, "\xff\xd8\xff") == 0) {
        return dt_jpeg;
    }
    if (data.size() >= 8 && data.compare(0, 8, "\x89PNG\r\n\x1a\n") == 0) {
        return dt_png;
    }
    if (data.size() >= 128 && data.compare(36, 4, "acsp") == 0) {
        return dt_icc;
    }
    return dt_generic;
}

std::string
ScrubBinarySanitizer::cleanJPEG(std::string const& data, size_t& removed)
{
    if (detectType(data) != dt_jpeg) {
        throw std::runtime_error("cleanJPEG: data is not JPEG");
    }
    std::string result = data.substr(0, 2);
    size_t pos = 2;
    while (true) {
        if (pos >= data.size() || byte_at(data, pos) != 0xff) {
            throw std::runtime_error("JPEG data is truncated or missing a marker");
        }
        // Skip fill bytes
        while (pos < data.size() && byte_at(data, pos) == 0xff) {
            ++pos;
        }
        if (pos >= data.size()) {
            throw std::runtime_error("JPEG data is truncated");
        }
        unsigned char marker = byte_at(data, pos++);
        if (marker == 0xd9) {
            // EOI; anything after it is dropped.
            result += "\xff\xd9";
            return result;
        }
        if ((marker >= 0xd0 && marker <= 0xd7) || marker == 0x01) {
            result += '\xff';
            result += static_cast<char>(marker);
            continue;
        }
        size_t length = read_be(data, pos, 2);
        if (length < 2 || pos + length > data.size()) {
            throw std::runtime_error("JPEG segment is truncated");
        }
        size_t end = pos + length;
        bool drop = (marker == 0xfe) || (marker >= 0xe1 && marker <= 0xed) || (marker == 0xef);
        if (drop) {
            ++removed;
        } else {
            result += '\xff';
            result += static_cast<char>(marker);
            result.append(data, pos, length);
        }
        pos = end;
        if (marker == 0xda) {
            // Entropy-coded data runs to the next marker other than a
            // restart marker or a stuffed zero.
            size_t scan = pos;
            while (scan + 1 < data.size()) {
                if (byte_at(data, scan) == 0xff) {
                    unsigned char next = byte_at(data, scan + 1);
                    if (next != 0x00 && next != 0xff && !(next >= 0xd0 && next <= 0xd7)) {
                        break;
                    }
                }
                ++scan;
            }
            if (scan + 1 >= data.size()) {
                throw std::runtime_error("JPEG scan data is truncated");
            }
            result.append(data, pos, scan - pos);
            pos = scan;
        }
    }
}

std::string
ScrubBinarySanitizer::cleanPNG(std::string const& data, size_t& removed)
{
    if (detectType(data) != dt_png) {
        throw std::runtime_error("cleanPNG: data is not PNG");
    }
    static std::set<std::string> const drop{"tEXt", "zTXt", "iTXt", "tIME"};
    std::string result = data.substr(0, 8);
    size_t pos = 8;
    while (true) {
        size_t length = read_be(data, pos, 4);
        if (pos + 12 + length > data.size()) {
            throw std::runtime_error("PNG chunk is truncated");
        }
        std::string type = data.substr(pos + 4, 4);
        size_t chunk_size = 12 + length;
        if (drop.count(type)) {
            ++removed;
        } else {
            result.append(data, pos, chunk_size);
        }
        pos += chunk_size;
        if (type == "IEND") {
            return result;
        }
    }
}

std::string
ScrubBinarySanitizer::cleanICC(std::string const& data, size_t& removed)
{
    if (detectType(data) != dt_icc) {
        throw std::runtime_error("cleanICC: data is not an ICC profile");
    }
    static std::set<std::string> const text_tags{"desc", "cprt", "dmnd", "dmdd"};
    std::string result = data;
    // Creation date/time, bytes 24..35
    result.replace(24, 12, 12, '\0');
    // Profile ID (MD5), bytes 84..99
    result.replace(84, 16, 16, '\0');
    removed += 2;

    size_t count = read_be(data, 128, 4);
    for (size_t i = 0; i < count; ++i) {
        size_t entry = 132 + 12 * i;
        if (entry + 12 > data.size()) {
            throw std::runtime_error("ICC tag table is truncated");
        }
        std::string sig = data.substr(entry, 4);
        size_t offset = read_be(data, entry + 4, 4);
        size_t size = read_be(data, entry + 8, 4);
        if (!text_tags.count(sig)) {
            continue;
        }
        if (offset > data.size() || size > data.size() - offset) {
            throw std::runtime_error("ICC tag " + sig + " lies outside the profile");
        }
        // Keep the 4-byte type signature and 4 reserved bytes.
        if (size > 8) {
            result.replace(offset + 8, size - 8, size - 8, '\0');
            ++removed;
        }
    }
    return result;
}

std::string
ScrubBinarySanitizer::cleanGeneric(std::string const& data)
{
    auto end = data.find_last_not_of('\0');
    return end == std::string::npos ? std::string() : data.substr(0, end + 1);
}

std::string
ScrubBinarySanitizer::clean(std::string const& data, size_t& removed)
{
    switch (detectType(data)) {
    case dt_jpeg:
        return cleanJPEG(data, removed);
    case dt_png:
        return cleanPNG(data, removed);
    case dt_icc:
        return cleanICC(data, removed);
    case dt_generic:
        break;
    }
    return cleanGeneric(data);
}

bool
ScrubBinarySanitizer::hasControlCharacters(std::string const& str)
{
    for (auto ch: str) {
        auto uch = static_cast<unsigned char>(ch);
        if (uch < 32 && !(ch == '\t' || ch == '\n' || ch == '\f' || ch == '\r')) {
            return true;
        }
    }
    return false;
}

bool
ScrubBinarySanitizer::isUnicodeString(std::string const& str)
{
    return str.starts_with("\xfe\xff") || str.starts_with("\xff\xfe");
}

std::string
ScrubBinarySanitizer::cleanString(std::string const& str)
{
    std::string result;
    result.reserve(str.size());
    for (auto ch: str) {
        auto uch = static_cast<unsigned char>(ch);
        if (uch >= 32 || ch == '\t' || ch == '\n' || ch == '\f' || ch == '\r') {
            result += ch;
        }
    }
    return result;
}

bool
ScrubBinarySanitizer::sanitizeStream(ScrubObject& stream, Stats& stats) const
{
    auto filter = stream.getFilterKey();
    bool candidate = filter == "/JPXDecode";
    auto subtype = stream.getKey("/Subtype");
    if (subtype.isName() && binary_subtypes.count(subtype.getName())) {
        candidate = true;
    }
    if (!candidate) {
        return false;
    }
    bool flate = (filter == "/FlateDecode");
    if (!(filter.empty() || flate || filter == "/DCTDecode")) {
        return false;
    }

    std::string data =
        flate ? Pl_Flate::inflate(stream.getStreamData(), m->tracker) : stream.getStreamData();
    stats.bytes_processed += data.size();
    if (detectType(data) == dt_generic && subtype.isName() && subtype.getName() == "/Image") {
        // The length of raw samples is fixed by the image dimensions.
        return false;
    }
    size_t removed = 0;
    std::string cleaned = clean(data, removed);
    if (cleaned == data) {
        return false;
    }
    stats.bytes_removed += data.size() - cleaned.size();
    stats.metadata_removed += removed;
    stream.replaceStreamData(flate ? Pl_Flate::deflate(cleaned) : cleaned);
    return true;
}

bool
ScrubBinarySanitizer::sanitizeObject(
    ScrubObjGen og,
    ScrubObject& obj,
    bool clean_strings,
    Stats& stats,
    std::vector<ScrubIssue>& issues) const
{
    bool changed = false;
    if (obj.isStream()) {
        try {
            changed = sanitizeStream(obj, stats);
        } catch (std::runtime_error& e) {
            issues.emplace_back(
                ScrubIssue::l_warning,
                scrub_e_processing,
                og,
                std::string("binary sanitization failed: ") + e.what());
        }
    }
    if (clean_strings) {
        // Strings under binary keys, including those inside arrays
        // such as /ID, are left alone. forEach visits a container
        // before its members.
        std::set<ScrubObject const*> binary;
        obj.forEach([&stats, &changed, &binary](ScrubObject& o) {
            bool is_binary = binary.count(&o) > 0;
            if (o.isArray() && is_binary) {
                for (auto const& item: o.getArray()) {
                    binary.insert(&item);
                }
            } else if (o.isDictionary() || o.isStream()) {
                // A signature's /Contents is the signature itself.
                bool signature = o.hasKey("/ByteRange");
                for (auto const& [key, value]: o.getDict()) {
                    if (binary_string_keys.count(key) || (signature && key == "/Contents")) {
                        binary.insert(&value);
                    }
                }
            } else if (
                o.isString() && !is_binary && !isUnicodeString(o.getStringValue()) &&
                hasControlCharacters(o.getStringValue())) {
                auto const& value = o.getStringValue();
                auto cleaned = cleanString(value);
                stats.bytes_processed += value.size();
                stats.bytes_removed += value.size() - cleaned.size();
                o.setStringValue(cleaned);
                changed = true;
            }
        });
    }
    if (changed) {
        ++stats.objects_sanitized;
    }
    return changed;
}

size_t
ScrubBinarySanitizer::sanitizeDocument(ScrubDocument& doc, ScrubWorkerPool* pool)
{
    auto start = std::chrono::steady_clock::now();
    bool clean_strings = !doc.getTrailer().encrypt.has_value();
    if (!clean_strings) {
        doc.warn(
            scrub_e_processing,
            std::nullopt,
            "document is encrypted; strings were not checked for control characters");
    }

    struct Slot
    {
        ScrubObjGen og;
        ScrubObject* obj;
        bool changed{false};
        Stats stats;
        std::vector<ScrubIssue> issues;
    };
    std::vector<Slot> slots;
    for (auto& [og, obj]: doc.getObjects()) {
        slots.push_back({og, &obj, false, {}, {}});
    }

    ScrubWorkerPool::forEachIndex(pool, slots.size(), [this, &slots, clean_strings](size_t i) {
        auto& slot = slots.at(i);
        slot.changed = sanitizeObject(slot.og, *slot.obj, clean_strings, slot.stats, slot.issues);
    });

    size_t changed = 0;
    for (auto const& slot: slots) {
        if (slot.changed) {
            ++changed;
        }
        add_stats(m->stats, slot.stats);
        for (auto const& issue: slot.issues) {
            doc.addIssue(issue);
        }
    }
    m->stats.duration += std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    return changed;
}

ScrubBinarySanitizer::Stats const&
ScrubBinarySanitizer::getStats() const
{
    return m->stats;
}

void
ScrubBinarySanitizer::reset()
{
    m->stats = Stats();
}

#include <pdfscrub/ScrubForensicScanner.hh>

#include <pdfscrub/Pl_Flate.hh>
#include <pdfscrub/ScrubDocument.hh>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubObject.hh>
#include <pdfscrub/ScrubUtil.hh>
#include <pdfscrub/ScrubWorkerPool.hh>

#include <algorithm>
#include <set>
#include <stdexcept>

class ScrubForensicScanner::Members
{
    friend class ScrubForensicScanner;

  public:
    Members(ScanningConfig const& config) :
        config(config)
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    ScanningConfig config;
    ScrubResourceTracker* tracker{nullptr};
    std::vector<std::shared_ptr<ScrubDetector>> detectors;
    std::set<std::string> signature_ids;
    std::vector<ScrubIssue> pattern_issues;
    Stats stats;
};

namespace
{
    struct StructureKey
    {
        std::string key;
        char const* id;
        scrub_severity_e severity;
        char const* description;
    };

    std::vector<StructureKey> const structure_keys{
        {"/JavaScript", "javascript", scrub_sev_high, "document JavaScript"},
        {"/JS", "js", scrub_sev_high, "JavaScript action"},
        {"/Launch", "launch", scrub_sev_critical, "launch action"},
        {"/EmbeddedFile", "embedded_file", scrub_sev_medium, "embedded file"},
        {"/OpenAction", "open_action", scrub_sev_low, "action run when the document opens"},
        {"/AA", "additional_actions", scrub_sev_low, "additional actions"},
        {"/RichMedia", "rich_media", scrub_sev_medium, "rich media annotation"},
        {"/XFA", "xfa", scrub_sev_medium, "XFA form"},
    };

    // Returns nullopt for filters other than Flate.
    std::optional<std::string>
    decode_stream(ScrubObject const& obj, ScrubResourceTracker* tracker)
    {
        auto filter = obj.getFilterKey();
        if (filter.empty()) {
            return obj.getStreamData();
        }
        if (filter == "/FlateDecode") {
            return Pl_Flate::inflate(obj.getStreamData(), tracker);
        }
        return std::nullopt;
    }

    // Signatures a stream is supposed to carry, such as a JPEG header
    // at the start of DCT data or an XMP packet in a metadata stream.
    bool
    expected_signature(ScrubObject const& obj, bool is_metadata, ScrubFinding const& finding)
    {
        if (is_metadata && finding.kind == scrub_pt_metadata) {
            return true;
        }
        return finding.pattern_id == "jpeg" && finding.start == 0 &&
            obj.getFilterKey() == "/DCTDecode";
    }
} // namespace

ScrubForensicScanner::ScrubForensicScanner() :
    m(std::make_unique<Members>(ScanningConfig()))
{
    init();
}

ScrubForensicScanner::ScrubForensicScanner(ScanningConfig const& config) :
    m(std::make_unique<Members>(config))
{
    init();
}

// Must be explicit and not inline -- see PDFSCRUB_DLL_CLASS in DLL.h
ScrubForensicScanner::~ScrubForensicScanner() = default;

void
ScrubForensicScanner::init()
{
    for (auto& d: ScrubDetector::builtinSignatures()) {
        addDetector(d);
    }
    for (auto& d: ScrubDetector::builtinPatterns()) {
        addDetector(d);
    }
    for (auto const& p: m->config.custom_patterns) {
        try {
            addDetector(std::make_shared<ScrubRegexDetector>(
                p.id, p.regex, p.severity, 1.0, p.description, p.pattern_type));
        } catch (ScrubExc& e) {
            m->pattern_issues.emplace_back(
                ScrubIssue::l_warning, e.getErrorCode(), std::nullopt, e.what());
        }
    }
}

ScrubForensicScanner::ScanningConfig const&
ScrubForensicScanner::getConfig() const
{
    return m->config;
}

void
ScrubForensicScanner::setResourceTracker(ScrubResourceTracker* tracker)
{
    m->tracker = tracker;
}

void
ScrubForensicScanner::addDetector(std::shared_ptr<ScrubDetector> detector)
{
    if (!detector) {
        throw std::logic_error("ScrubForensicScanner::addDetector called with null detector");
    }
    if (detector->getInput() == ScrubDetector::i_binary) {
        m->signature_ids.insert(detector->getId());
    }
    m->detectors.push_back(std::move(detector));
}

std::vector<std::shared_ptr<ScrubDetector>> const&
ScrubForensicScanner::getDetectors() const
{
    return m->detectors;
}

std::vector<ScrubIssue> const&
ScrubForensicScanner::getPatternIssues() const
{
    return m->pattern_issues;
}

std::vector<std::string> const&
ScrubForensicScanner::getStructureKeys()
{
    static std::vector<std::string> const keys = []() {
        std::vector<std::string> result;
        for (auto const& k: structure_keys) {
            result.push_back(k.key);
        }
        return result;
    }();
    return keys;
}

void
ScrubForensicScanner::runDetector(
    ScrubDetector const& detector,
    std::string const& data,
    std::optional<ScrubObjGen> og,
    std::optional<scrub_pattern_type_e> kind,
    std::vector<ScrubFinding>& result) const
{
    if (detector.getConfidence() < m->config.confidence_threshold) {
        return;
    }
    auto const ctx = m->config.context_size;
    size_t offset = 0;
    while (auto found = detector.scan(data, offset)) {
        auto& finding = *found;
        offset = std::max(finding.end, finding.start + 1);
        if (kind && finding.kind == scrub_pt_content) {
            finding.kind = *kind;
        }
        finding.og = og;
        size_t before = finding.start > ctx ? finding.start - ctx : 0;
        finding.context_before = data.substr(before, finding.start - before);
        finding.context_after = data.substr(finding.end, ctx);
        result.push_back(std::move(finding));
    }
}

std::vector<ScrubFinding>
ScrubForensicScanner::scanText(
    std::string const& data, std::optional<ScrubObjGen> og, scrub_pattern_type_e kind) const
{
    std::vector<ScrubFinding> result;
    for (auto const& d: m->detectors) {
        if (d->getInput() == ScrubDetector::i_text) {
            runDetector(*d, data, og, kind, result);
        }
    }
    return result;
}

std::vector<ScrubFinding>
ScrubForensicScanner::scanBinary(std::string const& data, std::optional<ScrubObjGen> og) const
{
    std::vector<ScrubFinding> result;
    for (auto const& d: m->detectors) {
        if (d->getInput() == ScrubDetector::i_binary) {
            runDetector(*d, data, og, std::nullopt, result);
        }
    }
    return result;
}

void
ScrubForensicScanner::scanStructure(
    ScrubObjGen og, ScrubObject const& obj, std::vector<ScrubFinding>& result) const
{
    obj.forEach([&og, &result](ScrubObject const& o) {
        if (!(o.isDictionary() || o.isStream())) {
            return;
        }
        for (auto const& k: structure_keys) {
            if (o.hasKey(k.key)) {
                ScrubFinding finding(
                    scrub_pt_structure,
                    k.id,
                    k.severity,
                    1.0,
                    std::string(k.description) + " (" + k.key + ")");
                finding.og = og;
                result.push_back(std::move(finding));
            }
        }
    });
}

void
ScrubForensicScanner::scanStream(
    ScrubObjGen og,
    ScrubObject const& obj,
    bool is_metadata,
    std::vector<ScrubFinding>& result,
    std::vector<ScrubIssue>& issues) const
{
    auto const& config = m->config;
    auto const& raw = obj.getStreamData();
    std::optional<std::string> decoded;
    try {
        decoded = decode_stream(obj, m->tracker);
    } catch (std::runtime_error& e) {
        issues.emplace_back(
            ScrubIssue::l_warning,
            scrub_e_processing,
            og,
            std::string("stream data could not be decoded for scanning: ") + e.what());
    }

    if (config.scan_binary) {
        std::vector<ScrubFinding> found = scanBinary(raw, og);
        if (decoded && obj.getFilterKey() == "/FlateDecode") {
            auto more = scanBinary(*decoded, og);
            found.insert(found.end(), more.begin(), more.end());
        }
        for (auto& f: found) {
            if (!expected_signature(obj, is_metadata, f)) {
                result.push_back(std::move(f));
            }
        }
    }

    if (!decoded || obj.isDictionaryOfType("", "/Image") || !ScrubUtil::is_text(*decoded)) {
        return;
    }
    if (is_metadata ? config.scan_metadata : config.scan_content) {
        auto found = scanText(*decoded, og, is_metadata ? scrub_pt_metadata : scrub_pt_content);
        result.insert(result.end(), found.begin(), found.end());
    }
}

std::vector<ScrubFinding>
ScrubForensicScanner::scanObject(
    ScrubObjGen og, ScrubObject const& obj, bool is_info, std::vector<ScrubIssue>& issues) const
{
    auto const& config = m->config;
    std::vector<ScrubFinding> result;
    bool is_metadata = is_info || (obj.isStream() && obj.isDictionaryOfType("/Metadata"));

    if (is_metadata ? config.scan_metadata : config.scan_content) {
        auto kind = is_metadata ? scrub_pt_metadata : scrub_pt_content;
        obj.forEach([this, &og, kind, &result](ScrubObject const& o) {
            if (o.isString()) {
                auto found = scanText(o.getStringValue(), og, kind);
                result.insert(result.end(), found.begin(), found.end());
            }
        });
    }
    if (config.scan_structure) {
        scanStructure(og, obj, result);
    }
    if (obj.isStream()) {
        scanStream(og, obj, is_metadata, result, issues);
    }
    return result;
}

std::vector<ScrubFinding>
ScrubForensicScanner::scanDocument(ScrubDocument& doc, ScrubWorkerPool* pool)
{
    auto start = std::chrono::steady_clock::now();
    for (auto const& issue: m->pattern_issues) {
        doc.addIssue(issue);
    }
    auto info = doc.getTrailer().info;

    struct Slot
    {
        ScrubObjGen og;
        ScrubObject const* obj;
        std::vector<ScrubFinding> findings;
        std::vector<ScrubIssue> issues;
    };
    std::vector<Slot> slots;
    for (auto const& [og, obj]: doc.getObjects()) {
        slots.push_back({og, &obj, {}, {}});
    }

    ScrubWorkerPool::forEachIndex(pool, slots.size(), [this, &slots, &info](size_t i) {
        auto& slot = slots.at(i);
        bool is_info = info && *info == slot.og;
        try {
            slot.findings = scanObject(slot.og, *slot.obj, is_info, slot.issues);
        } catch (std::runtime_error& e) {
            slot.issues.emplace_back(
                ScrubIssue::l_warning,
                scrub_e_processing,
                slot.og,
                std::string("scan failed: ") + e.what());
        }
    });

    std::vector<ScrubFinding> result;
    for (auto& slot: slots) {
        ++m->stats.objects_scanned;
        if (!slot.findings.empty()) {
            ++m->stats.suspicious_objects;
        }
        for (auto& f: slot.findings) {
            if (m->signature_ids.count(f.pattern_id)) {
                ++m->stats.signatures_matched;
            }
            result.push_back(std::move(f));
        }
        for (auto const& issue: slot.issues) {
            doc.addIssue(issue);
        }
    }
    if (m->config.scan_metadata && doc.getMetadata()) {
        auto found = scanText(*doc.getMetadata(), std::nullopt, scrub_pt_metadata);
        result.insert(result.end(), found.begin(), found.end());
    }
    m->stats.patterns_detected += result.size();
    m->stats.duration += std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

ScrubForensicScanner::Stats const&
ScrubForensicScanner::getStats() const
{
    return m->stats;
}

void
ScrubForensicScanner::reset()
{
    m->stats = Stats();
}

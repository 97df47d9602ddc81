#include <pdfscrub/ScrubStegoDetector.hh>

#include <pdfscrub/Pl_DCT.hh>
#include <pdfscrub/Pl_Flate.hh>
#include <pdfscrub/Pl_String.hh>
#include <pdfscrub/ScrubDocument.hh>
#include <pdfscrub/ScrubObject.hh>
#include <pdfscrub/ScrubTokenizer.hh>
#include <pdfscrub/ScrubUtil.hh>
#include <pdfscrub/ScrubWorkerPool.hh>

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

class ScrubStegoDetector::Members
{
    friend class ScrubStegoDetector;

  public:
    Members(DetectionConfig const& config) :
        config(config)
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    DetectionConfig config;
    ScrubResourceTracker* tracker{nullptr};
    Stats stats;
};

namespace
{
    void
    add_stats(ScrubStegoDetector::Stats& to, ScrubStegoDetector::Stats const& from)
    {
        to.objects_analyzed += from.objects_analyzed;
        to.images_analyzed += from.images_analyzed;
        to.images_skipped += from.images_skipped;
    }

    std::string
    confidence_string(double confidence)
    {
        return ScrubUtil::double_to_string(confidence, 2);
    }

    ScrubFinding
    stego_finding(
        ScrubObjGen og,
        char const* id,
        scrub_severity_e severity,
        double confidence,
        std::string const& description)
    {
        ScrubFinding finding(scrub_pt_steganography, id, severity, confidence, description);
        finding.og = og;
        return finding;
    }
} // namespace

ScrubStegoDetector::ScrubStegoDetector() :
    m(std::make_unique<Members>(DetectionConfig()))
{
}

ScrubStegoDetector::ScrubStegoDetector(DetectionConfig const& config) :
    m(std::make_unique<Members>(config))
{
}

// Must be explicit and not inline -- see PDFSCRUB_DLL_CLASS in DLL.h
ScrubStegoDetector::~ScrubStegoDetector() = default;

ScrubStegoDetector::DetectionConfig const&
ScrubStegoDetector::getConfig() const
{
    return m->config;
}

void
ScrubStegoDetector::setResourceTracker(ScrubResourceTracker* tracker)
{
    m->tracker = tracker;
}

int
ScrubStegoDetector::getComponents(ScrubObject const& color_space, ScrubDocument const& doc)
{
    auto cs = doc.resolve(color_space);
    if (cs.isName()) {
        auto const& name = cs.getName();
        if (name == "/DeviceGray" || name == "/G" || name == "/CalGray") {
            return 1;
        }
        if (name == "/DeviceRGB" || name == "/RGB" || name == "/CalRGB" || name == "/Lab") {
            return 3;
        }
        if (name == "/DeviceCMYK" || name == "/CMYK") {
            return 4;
        }
        return 0;
    }
    if (!cs.isArray() || cs.getArrayNItems() == 0) {
        return 0;
    }
    auto family = cs.getArrayItem(0);
    if (family.isNameAndEquals("/Indexed") || family.isNameAndEquals("/I")) {
        return 1;
    }
    if (family.isNameAndEquals("/ICCBased")) {
        auto profile = doc.resolve(cs.getArrayItem(1));
        auto n = profile.getKey("/N");
        return n.isInteger() ? static_cast<int>(n.getIntValue()) : 0;
    }
    if (family.isName()) {
        // [/CalRGB << ... >>] and similar
        return getComponents(family, doc);
    }
    return 0;
}

ScrubStegoDetector::ImageFeatures
ScrubStegoDetector::analyzeSamples(std::string const& samples, size_t components)
{
    if (components == 0) {
        throw std::logic_error("ScrubStegoDetector::analyzeSamples called with 0 components");
    }
    ImageFeatures f;
    f.components = components;
    f.pixels = samples.size() / components;
    if (f.pixels == 0) {
        return f;
    }
    auto sample = [&samples, components](size_t pixel, size_t channel) {
        return static_cast<unsigned char>(samples[pixel * components + channel]);
    };

    size_t channels = std::min(components, size_t(3));
    std::array<double, 3> weights{1.0, 1.0, 1.0};
    if (components == 3) {
        weights = {0.299, 0.587, 0.114};
    }
    double weighted = 0.0;
    double total_weight = 0.0;
    auto pixels = static_cast<double>(f.pixels);
    for (size_t c = 0; c < channels; ++c) {
        size_t ones = 0;
        size_t flips = 0;
        unsigned int prev = 0;
        for (size_t p = 0; p < f.pixels; ++p) {
            unsigned int bit = sample(p, c) & 1U;
            ones += bit;
            if (p > 0 && bit != prev) {
                ++flips;
            }
            prev = bit;
        }
        double lsb = static_cast<double>(ones) / pixels;
        double transition = static_cast<double>(flips) / pixels;
        f.lsb_ratios.push_back(lsb);
        f.transition_ratios.push_back(transition);
        double score =
            std::clamp(1.0 - (std::fabs(lsb - 0.5) + std::fabs(transition - 0.5)), 0.0, 1.0);
        weighted += weights.at(c) * score;
        total_weight += weights.at(c);
    }
    f.lsb_confidence = weighted / total_weight;

    std::array<size_t, 256> histogram{};
    double sum = 0.0;
    double sum_sq = 0.0;
    for (size_t p = 0; p < f.pixels; ++p) {
        double luma = sample(p, 0);
        if (channels == 3) {
            luma = 0.299 * sample(p, 0) + 0.587 * sample(p, 1) + 0.114 * sample(p, 2);
        }
        auto bin = std::min(size_t(255), static_cast<size_t>(std::lround(luma)));
        ++histogram.at(bin);
        sum += luma;
        sum_sq += luma * luma;
    }
    f.luma_mean = sum / pixels;
    f.luma_stddev = std::sqrt(std::max(0.0, sum_sq / pixels - f.luma_mean * f.luma_mean));

    // Embedding in low bits evens out the counts within each pair of
    // values. An image with almost no spread trivially has balanced
    // pairs, so damp by the standard deviation.
    double balance = 0.0;
    for (size_t k = 0; k < 256; k += 2) {
        auto a = static_cast<double>(histogram.at(k));
        auto b = static_cast<double>(histogram.at(k + 1));
        if (a + b > 0) {
            balance += (a + b) - std::fabs(a - b);
        }
    }
    double damping = std::min(1.0, f.luma_stddev / 32.0);
    f.histogram_confidence = std::clamp(balance / pixels * damping, 0.0, 1.0);
    return f;
}

std::optional<std::string>
ScrubStegoDetector::decodeImage(
    ScrubObject const& stream,
    ScrubDocument const& doc,
    size_t& components,
    std::string& reason) const
{
    if (stream.getKey("/ImageMask").isBool() && stream.getKey("/ImageMask").getBoolValue()) {
        reason = "image mask";
        return std::nullopt;
    }
    auto filter = stream.getFilterKey();
    if (filter == "/DCTDecode") {
        std::string samples;
        Pl_String out("stego samples", nullptr, samples);
        Pl_DCT dct("stego jpeg", &out);
        dct.setResourceTracker(m->tracker);
        dct.write(
            reinterpret_cast<unsigned char const*>(stream.getStreamData().data()),
            stream.getStreamData().size());
        dct.finish();
        components = static_cast<size_t>(dct.getOutputComponents());
        return samples;
    }

    auto bpc = stream.getKey("/BitsPerComponent");
    if (!(bpc.isInteger() && bpc.getIntValue() == 8)) {
        reason = "not 8 bits per component";
        return std::nullopt;
    }
    int n = getComponents(stream.getKey("/ColorSpace"), doc);
    if (n <= 0) {
        reason = "unknown color space";
        return std::nullopt;
    }
    components = static_cast<size_t>(n);
    if (filter.empty()) {
        return stream.getStreamData();
    }
    if (filter == "/FlateDecode") {
        auto predictor = doc.resolve(stream.getKey("/DecodeParms")).getKey("/Predictor");
        if (predictor.isInteger() && predictor.getIntValue() > 1) {
            reason = "predictor";
            return std::nullopt;
        }
        return Pl_Flate::inflate(stream.getStreamData(), m->tracker);
    }
    reason = "unsupported filter " + filter;
    return std::nullopt;
}

void
ScrubStegoDetector::analyzeImage(
    ScrubObjGen og,
    ScrubObject const& obj,
    ScrubDocument const& doc,
    std::vector<ScrubFinding>& result,
    std::vector<ScrubIssue>& issues,
    Stats& stats) const
{
    auto const& config = m->config;
    size_t components = 0;
    std::string reason;
    std::optional<std::string> samples;
    try {
        samples = decodeImage(obj, doc, components, reason);
    } catch (std::runtime_error& e) {
        issues.emplace_back(
            ScrubIssue::l_warning,
            scrub_e_processing,
            og,
            std::string("image could not be decoded for analysis: ") + e.what());
        ++stats.images_skipped;
        return;
    }
    if (!samples || components == 0 || samples->size() / components < config.min_pixels) {
        ++stats.images_skipped;
        return;
    }

    auto f = analyzeSamples(*samples, components);
    ++stats.images_analyzed;
    if (f.lsb_confidence > config.statistical_threshold) {
        result.push_back(stego_finding(
            og,
            "lsb_embedding",
            scrub_sev_medium,
            f.lsb_confidence,
            "suspected data hidden in least significant bits (confidence " +
                confidence_string(f.lsb_confidence) + ")"));
    }
    if (f.histogram_confidence > config.statistical_threshold) {
        result.push_back(stego_finding(
            og,
            "histogram_pairs",
            scrub_sev_medium,
            f.histogram_confidence,
            "suspected embedding from balanced value pairs (luma mean " +
                ScrubUtil::double_to_string(f.luma_mean, 1) + ", stddev " +
                ScrubUtil::double_to_string(f.luma_stddev, 1) + ")"));
    }
}

void
ScrubStegoDetector::analyzeContent(
    ScrubObjGen og,
    ScrubObject const& obj,
    std::vector<ScrubFinding>& result,
    std::vector<ScrubIssue>& issues) const
{
    std::string data;
    auto filter = obj.getFilterKey();
    if (filter.empty()) {
        data = obj.getStreamData();
    } else if (filter == "/FlateDecode") {
        try {
            data = Pl_Flate::inflate(obj.getStreamData(), m->tracker);
        } catch (std::runtime_error& e) {
            issues.emplace_back(
                ScrubIssue::l_warning,
                scrub_e_processing,
                og,
                std::string("content stream could not be decoded for analysis: ") + e.what());
            return;
        }
    } else {
        return;
    }

    ScrubTokenizer::Token previous;
    for (auto const& token: ScrubTokenizer::tokenize(data)) {
        if (token.isWord("Tr") && previous.getType() == ScrubTokenizer::tt_integer &&
            previous.getValue() == "3") {
            result.push_back(stego_finding(
                og, "invisible_text", scrub_sev_low, 1.0, "content uses invisible text (3 Tr)"));
            return;
        }
        previous = token;
    }
}

std::vector<ScrubFinding>
ScrubStegoDetector::analyzeObject(
    ScrubObjGen og,
    ScrubObject const& obj,
    ScrubDocument const& doc,
    bool is_info,
    std::vector<ScrubIssue>& issues,
    Stats& stats) const
{
    auto const& config = m->config;
    std::vector<ScrubFinding> result;
    ++stats.objects_analyzed;

    if (is_info && config.analyze_metadata) {
        obj.forEach([&config, &og, &result](ScrubObject const& o) {
            if (!o.isString()) {
                return;
            }
            auto const& value = o.getStringValue();
            if (value.size() < config.entropy_min_length) {
                return;
            }
            double entropy = ScrubUtil::byte_entropy(value);
            if (entropy >= config.entropy_threshold) {
                result.push_back(stego_finding(
                    og,
                    "high_entropy_metadata",
                    scrub_sev_medium,
                    std::min(1.0, entropy / 8.0),
                    "suspected hidden payload in metadata string (" +
                        ScrubUtil::double_to_string(entropy, 2) + " bits per byte)"));
            }
        });
    }

    if (!obj.isStream()) {
        return result;
    }
    if (obj.isDictionaryOfType("", "/Image")) {
        if (config.analyze_images) {
            analyzeImage(og, obj, doc, result, issues, stats);
        }
    } else if (
        config.analyze_content && !obj.isDictionaryOfType("/Metadata") &&
        !obj.isDictionaryOfType("", "/ICCProfile") && !obj.hasKey("/N")) {
        analyzeContent(og, obj, result, issues);
    }
    return result;
}

std::vector<ScrubFinding>
ScrubStegoDetector::analyzeDocument(ScrubDocument& doc, ScrubWorkerPool* pool)
{
    auto start = std::chrono::steady_clock::now();
    auto info = doc.getTrailer().info;

    struct Slot
    {
        ScrubObjGen og;
        ScrubObject const* obj;
        std::vector<ScrubFinding> findings;
        std::vector<ScrubIssue> issues;
        Stats stats;
    };
    std::vector<Slot> slots;
    for (auto const& [og, obj]: doc.getObjects()) {
        slots.push_back({og, &obj, {}, {}, {}});
    }

    ScrubDocument const& cdoc = doc;
    ScrubWorkerPool::forEachIndex(pool, slots.size(), [this, &slots, &cdoc, &info](size_t i) {
        auto& slot = slots.at(i);
        bool is_info = info && *info == slot.og;
        try {
            slot.findings =
                analyzeObject(slot.og, *slot.obj, cdoc, is_info, slot.issues, slot.stats);
        } catch (std::runtime_error& e) {
            slot.issues.emplace_back(
                ScrubIssue::l_warning,
                scrub_e_processing,
                slot.og,
                std::string("analysis failed: ") + e.what());
        }
    });

    std::vector<ScrubFinding> result;
    for (auto& slot: slots) {
        add_stats(m->stats, slot.stats);
        if (!slot.findings.empty()) {
            ++m->stats.suspicious_objects;
        }
        m->stats.patterns_detected += slot.findings.size();
        for (auto& f: slot.findings) {
            result.push_back(std::move(f));
        }
        for (auto const& issue: slot.issues) {
            doc.addIssue(issue);
        }
    }
    m->stats.duration += std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

ScrubStegoDetector::Stats const&
ScrubStegoDetector::getStats() const
{
    return m->stats;
}

void
ScrubStegoDetector::reset()
{
    m->stats = Stats();
}

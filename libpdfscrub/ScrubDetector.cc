#include <pdfscrub/ScrubDetector.hh>

#include <pdfscrub/ScrubExc.hh>

#include <re2/re2.h>

#include <stdexcept>

ScrubDetector::ScrubDetector(
    std::string id,
    scrub_pattern_type_e kind,
    scrub_severity_e severity,
    double confidence,
    std::string description) :
    id(std::move(id)),
    kind(kind),
    severity(severity),
    confidence(confidence),
    description(std::move(description))
{
}

// Must be explicit and not inline -- see PDFSCRUB_DLL_CLASS in DLL.h
ScrubDetector::~ScrubDetector() = default;

std::string const&
ScrubDetector::getId() const
{
    return id;
}

scrub_pattern_type_e
ScrubDetector::getKind() const
{
    return kind;
}

scrub_severity_e
ScrubDetector::getSeverity() const
{
    return severity;
}

double
ScrubDetector::getConfidence() const
{
    return confidence;
}

std::string const&
ScrubDetector::getDescription() const
{
    return description;
}

ScrubFinding
ScrubDetector::makeFinding(size_t start, size_t end) const
{
    ScrubFinding finding(kind, id, severity, confidence, description);
    finding.start = start;
    finding.end = end;
    return finding;
}

std::vector<std::shared_ptr<ScrubDetector>>
ScrubDetector::builtinSignatures()
{
    // "MZ" is two bytes and turns up by chance in compressed data.
    return {
        std::make_shared<ScrubSignatureDetector>(
            "jpeg", "\xff\xd8\xff", scrub_sev_medium, 0.9, "embedded JPEG image"),
        std::make_shared<ScrubSignatureDetector>(
            "png", "\x89PNG\r\n\x1a\n", scrub_sev_medium, 0.95, "embedded PNG image"),
        std::make_shared<ScrubSignatureDetector>(
            "zip", "PK\x03\x04", scrub_sev_high, 0.8, "embedded ZIP archive"),
        std::make_shared<ScrubSignatureDetector>(
            "gzip", "\x1f\x8b\x08", scrub_sev_high, 0.7, "embedded GZIP data"),
        std::make_shared<ScrubSignatureDetector>(
            "pe", "MZ", scrub_sev_critical, 0.5, "embedded Windows executable"),
        std::make_shared<ScrubSignatureDetector>(
            "elf", "\x7f" "ELF", scrub_sev_critical, 0.9, "embedded ELF executable"),
        std::make_shared<ScrubSignatureDetector>(
            "pdf", "%PDF-", scrub_sev_high, 0.9, "embedded PDF document"),
        std::make_shared<ScrubSignatureDetector>(
            "xpacket", "<?xpacket", scrub_sev_medium, 0.9, "XMP packet", scrub_pt_metadata),
        std::make_shared<ScrubSignatureDetector>(
            "xmpmeta", "<x:xmpmeta", scrub_sev_medium, 0.9, "XMP metadata", scrub_pt_metadata),
    };
}

std::vector<std::shared_ptr<ScrubDetector>>
ScrubDetector::builtinPatterns()
{
    return {
        std::make_shared<ScrubRegexDetector>(
            "email",
            R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})",
            scrub_sev_high,
            0.9,
            "email address"),
        std::make_shared<ScrubRegexDetector>(
            "phone", R"(\b\d{3}[-.]?\d{3}[-.]?\d{4}\b)", scrub_sev_high, 0.6, "phone number"),
        std::make_shared<ScrubRegexDetector>(
            "ssn", R"(\b\d{3}-\d{2}-\d{4}\b)", scrub_sev_high, 0.8, "social security number"),
        std::make_shared<ScrubRegexDetector>(
            "credit_card",
            R"(\b\d{4}[-\s]?\d{4}[-\s]?\d{4}[-\s]?\d{4}\b)",
            scrub_sev_high,
            0.7,
            "credit card number"),
        std::make_shared<ScrubRegexDetector>(
            "ipv4",
            R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)",
            scrub_sev_medium,
            0.6,
            "IPv4 address"),
        std::make_shared<ScrubRegexDetector>(
            "url",
            R"((?:[A-Za-z][A-Za-z0-9+.-]*://|www\.)[^\s()<>]+)",
            scrub_sev_medium,
            0.7,
            "URL"),
    };
}

ScrubSignatureDetector::ScrubSignatureDetector(
    std::string id,
    std::string signature,
    scrub_severity_e severity,
    double confidence,
    std::string description,
    scrub_pattern_type_e kind) :
    ScrubDetector(std::move(id), kind, severity, confidence, std::move(description)),
    signature(std::move(signature))
{
    if (this->signature.empty()) {
        throw std::logic_error("ScrubSignatureDetector: empty signature");
    }
}

ScrubDetector::input_e
ScrubSignatureDetector::getInput() const
{
    return i_binary;
}

std::optional<ScrubFinding>
ScrubSignatureDetector::scan(std::string_view data, size_t offset) const
{
    if (offset >= data.size()) {
        return std::nullopt;
    }
    auto pos = data.find(signature, offset);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    return makeFinding(pos, pos + signature.size());
}

std::string const&
ScrubSignatureDetector::getSignature() const
{
    return signature;
}

ScrubRegexDetector::ScrubRegexDetector(
    std::string id,
    std::string const& pattern,
    scrub_severity_e severity,
    double confidence,
    std::string description,
    scrub_pattern_type_e kind) :
    ScrubDetector(id, kind, severity, confidence, std::move(description)),
    pattern(pattern)
{
    RE2::Options options;
    options.set_encoding(RE2::Options::EncodingLatin1);
    options.set_log_errors(false);
    re = std::make_unique<RE2>(pattern, options);
    if (!re->ok()) {
        throw ScrubExc(
            scrub_e_pattern, "scan", id, "invalid pattern \"" + pattern + "\": " + re->error());
    }
}

// Must be explicit and not inline -- RE2 is incomplete in the header
ScrubRegexDetector::~ScrubRegexDetector() = default;

ScrubDetector::input_e
ScrubRegexDetector::getInput() const
{
    return i_text;
}

std::optional<ScrubFinding>
ScrubRegexDetector::scan(std::string_view data, size_t offset) const
{
    // The whole buffer is the match context, so \b sees the byte
    // before `offset'.
    re2::StringPiece text(data.data(), data.size());
    re2::StringPiece match;
    while (offset < data.size()) {
        if (!re->Match(text, offset, data.size(), RE2::UNANCHORED, &match, 1)) {
            break;
        }
        size_t start = static_cast<size_t>(match.data() - data.data());
        if (!match.empty()) {
            return makeFinding(start, start + match.size());
        }
        // Skip empty matches from custom patterns.
        offset = start + 1;
    }
    return std::nullopt;
}

std::string const&
ScrubRegexDetector::getPattern() const
{
    return pattern;
}

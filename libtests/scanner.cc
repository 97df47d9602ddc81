#include <pdfscrub/assert_test.h>

#include <pdfscrub/Pl_Flate.hh>
#include <pdfscrub/ScrubDocument.hh>
#include <pdfscrub/ScrubForensicScanner.hh>
#include <pdfscrub/ScrubWorkerPool.hh>

#include <algorithm>
#include <iostream>

using Scanner = ScrubForensicScanner;

static ScrubObject
name(std::string const& n)
{
    return ScrubObject::newName(n);
}

static ScrubObject
str(std::string const& s)
{
    return ScrubObject::newString(s);
}

static size_t
count(
    std::vector<ScrubFinding> const& findings,
    std::string const& id,
    std::optional<ScrubObjGen> og = std::nullopt)
{
    return static_cast<size_t>(
        std::count_if(findings.begin(), findings.end(), [&id, &og](ScrubFinding const& f) {
            return f.pattern_id == id && (!og || f.og == og);
        }));
}

static void
test_single_string()
{
    ScrubDocument doc;
    doc.replaceObject(
        ScrubObjGen(1),
        ScrubObject::newDictionary(
            {{"/Type", name("/Catalog")}, {"/Title", str("Contact test@example.com now")}}));
    doc.setRoot(ScrubObjGen(1));

    Scanner scanner;
    auto findings = scanner.scanDocument(doc);
    assert(findings.size() == 1);
    auto const& f = findings.at(0);
    assert(f.pattern_id == "email");
    assert(f.severity == scrub_sev_high);
    assert(f.kind == scrub_pt_content);
    assert(f.og == ScrubObjGen(1));
    assert(f.start == 8);
    assert(f.end == 24);
    assert(f.context_before == "Contact ");
    assert(f.context_after == " now");
    assert(!doc.anyIssues());

    auto const& stats = scanner.getStats();
    assert(stats.objects_scanned == 1);
    assert(stats.patterns_detected == 1);
    assert(stats.suspicious_objects == 1);
    assert(stats.signatures_matched == 0);

    Scanner::ScanningConfig config;
    config.context_size = 3;
    Scanner small_context(config);
    findings = small_context.scanDocument(doc);
    assert(findings.at(0).context_before == "ct ");
    assert(findings.at(0).context_after == " no");

    config.scan_content = false;
    Scanner no_content(config);
    assert(no_content.scanDocument(doc).empty());
}

static ScrubDocument
make_document()
{
    ScrubDocument doc;
    doc.replaceObject(
        ScrubObjGen(1),
        ScrubObject::newDictionary(
            {{"/Type", name("/Catalog")},
             {"/OpenAction", ScrubObject::newReference(ScrubObjGen(2))},
             {"/Metadata", ScrubObject::newReference(ScrubObjGen(6))}}));
    doc.replaceObject(
        ScrubObjGen(2),
        ScrubObject::newDictionary({{"/S", name("/JavaScript")}, {"/JS", str("app.alert(1)")}}));
    doc.replaceObject(
        ScrubObjGen(3),
        ScrubObject::newStream(
            {{"/Filter", name("/FlateDecode")}},
            Pl_Flate::deflate("data %PDF-1.4 more data")));
    doc.replaceObject(
        ScrubObjGen(4),
        ScrubObject::newStream(
            {{"/Subtype", name("/Image")}, {"/Filter", name("/DCTDecode")}},
            "\xff\xd8\xff\xe0 rest of image"));
    doc.replaceObject(
        ScrubObjGen(5), ScrubObject::newDictionary({{"/Author", str("alice@example.org")}}));
    doc.replaceObject(
        ScrubObjGen(6),
        ScrubObject::newStream(
            {{"/Type", name("/Metadata")}, {"/Subtype", name("/XML")}},
            "<x:xmpmeta>bob@example.net</x:xmpmeta>"));
    doc.replaceObject(
        ScrubObjGen(7), ScrubObject::newStream({{"/Filter", name("/FlateDecode")}}, "garbage"));
    doc.replaceObject(
        ScrubObjGen(8), ScrubObject::newStream({}, "BT (mail me: dave@example.com) Tj ET"));
    doc.setRoot(ScrubObjGen(1));
    doc.setInfo(ScrubObjGen(5));
    doc.setMetadata("<?xpacket begin=''?> carol@example.com");
    return doc;
}

static void
test_document()
{
    for (size_t threads: {0, 4}) {
        auto doc = make_document();
        ScrubWorkerPool pool(threads);
        Scanner scanner;
        auto findings = scanner.scanDocument(doc, &pool);

        // Structure keys
        assert(count(findings, "open_action", ScrubObjGen(1)) == 1);
        assert(count(findings, "js", ScrubObjGen(2)) == 1);
        // /JavaScript is only reported as a key.
        assert(count(findings, "javascript") == 0);

        // A PDF signature inside Flate data
        assert(count(findings, "pdf", ScrubObjGen(3)) == 1);
        // A JPEG header at the start of DCT data is expected.
        assert(std::none_of(findings.begin(), findings.end(), [](ScrubFinding const& f) {
            return f.og == ScrubObjGen(4);
        }));

        // The Info dictionary is metadata.
        auto info = std::find_if(findings.begin(), findings.end(), [](ScrubFinding const& f) {
            return f.og == ScrubObjGen(5);
        });
        assert(info != findings.end());
        assert(info->pattern_id == "email");
        assert(info->kind == scrub_pt_metadata);

        // The XMP in a metadata stream is expected, but the address in
        // it is not.
        assert(count(findings, "xmpmeta") == 0);
        assert(count(findings, "email", ScrubObjGen(6)) == 1);

        // Text inside an unfiltered content stream
        assert(count(findings, "email", ScrubObjGen(8)) == 1);

        // Document-level XMP comes last.
        auto const& last = findings.back();
        assert(!last.og.has_value());
        assert(last.pattern_id == "email");
        assert(last.kind == scrub_pt_metadata);
        assert(count(findings, "xpacket") == 0);

        // Findings are in object order.
        ScrubObjGen prev;
        for (auto const& f: findings) {
            if (f.og) {
                assert(!(*f.og < prev));
                prev = *f.og;
            }
        }

        // Undecodable data is an issue, not a failure.
        assert(doc.getIssues().size() == 1);
        assert(doc.getIssues().at(0).og == ScrubObjGen(7));

        auto const& stats = scanner.getStats();
        assert(stats.objects_scanned == 8);
        assert(stats.patterns_detected == findings.size());
        assert(stats.signatures_matched >= 1);
        assert(stats.suspicious_objects >= 6);
    }
}

static void
test_threshold()
{
    std::string text = "call 555-123-4567 or write to x@y.com";
    Scanner scanner;
    auto findings = scanner.scanText(text);
    assert(findings.size() == 2);
    assert(count(findings, "phone") == 1);
    assert(count(findings, "email") == 1);

    Scanner::ScanningConfig config;
    config.confidence_threshold = 0.85;
    Scanner strict(config);
    findings = strict.scanText(text);
    assert(findings.size() == 1);
    assert(findings.at(0).pattern_id == "email");

    // "MZ" has confidence 0.5.
    assert(count(scanner.scanBinary("xxMZxx"), "pe") == 1);
    assert(strict.scanBinary("xxMZxx").empty());

    // Every occurrence is reported.
    findings = scanner.scanBinary("PK\x03\x04 and PK\x03\x04");
    assert(count(findings, "zip") == 2);
    assert(findings.at(1).start == 9);
}

static void
test_large_text()
{
    // One long token is matched in a single pass.
    std::string text = "see www." + std::string(300000, 'a');
    Scanner scanner;
    auto findings = scanner.scanText(text, std::nullopt, scrub_pt_content);
    assert(findings.size() == 1);
    assert(findings.at(0).pattern_id == "url");
    assert(findings.at(0).start == 4);
    assert(findings.at(0).end == text.size());
    assert(findings.at(0).context_before == "see ");
    assert(findings.at(0).context_after.empty());

    ScrubDocument doc;
    doc.replaceObject(
        ScrubObjGen(1),
        ScrubObject::newDictionary(
            {{"/Type", name("/Catalog")}, {"/T", str(std::string(500000, '1') + " x@y.com")}}));
    doc.setRoot(ScrubObjGen(1));
    findings = scanner.scanDocument(doc);
    assert(count(findings, "email", ScrubObjGen(1)) == 1);
    assert(!doc.anyIssues());
}

static void
test_custom_patterns()
{
    Scanner::ScanningConfig config;
    config.custom_patterns.push_back(
        {"codename", scrub_pt_custom, "Project [A-Z][a-z]+", "project codename", scrub_sev_low});
    config.custom_patterns.push_back(
        {"broken", scrub_pt_custom, "([unclosed", "bad pattern", scrub_sev_low});
    Scanner scanner(config);
    assert(scanner.getDetectors().size() == 16);
    assert(scanner.getPatternIssues().size() == 1);
    assert(scanner.getPatternIssues().at(0).error_code == scrub_e_pattern);

    // Custom patterns keep their own type.
    auto findings = scanner.scanText("see Project Falcon", std::nullopt, scrub_pt_metadata);
    assert(findings.size() == 1);
    assert(findings.at(0).pattern_id == "codename");
    assert(findings.at(0).kind == scrub_pt_custom);
    assert(findings.at(0).confidence == 1.0);

    ScrubDocument doc;
    doc.replaceObject(ScrubObjGen(1), ScrubObject::newDictionary({{"/T", str("Project Osprey")}}));
    doc.setRoot(ScrubObjGen(1));
    findings = scanner.scanDocument(doc);
    assert(findings.size() == 1);
    assert(doc.getIssues().size() == 1);
    assert(doc.getIssues().at(0).error_code == scrub_e_pattern);

    // Detectors can be added directly.
    scanner.addDetector(std::make_shared<ScrubSignatureDetector>(
        "magic", "\xca\xfe", scrub_sev_low, 0.9, "magic bytes"));
    assert(count(scanner.scanBinary("..\xca\xfe.."), "magic") == 1);

    auto const& keys = Scanner::getStructureKeys();
    assert(std::find(keys.begin(), keys.end(), "/Launch") != keys.end());
}

int
main()
{
    test_single_string();
    test_document();
    test_threshold();
    test_large_text();
    test_custom_patterns();
    std::cout << "scanner tests passed" << std::endl;
    return 0;
}

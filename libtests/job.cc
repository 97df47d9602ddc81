#include <pdfscrub/assert_test.h>

#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubJob.hh>
#include <pdfscrub/ScrubLogger.hh>

#include <algorithm>
#include <functional>
#include <iostream>
#include <sstream>

static ScrubObject
ref(uint32_t n)
{
    return ScrubObject::newReference(ScrubObjGen(n));
}

static ScrubObject
name(std::string const& n)
{
    return ScrubObject::newName(n);
}

static ScrubDocument
make_document()
{
    ScrubDocument doc;
    doc.replaceObject(
        ScrubObjGen(1),
        ScrubObject::newDictionary(
            {{"/Type", name("/Catalog")}, {"/Pages", ref(2)}, {"/Metadata", ref(6)}}));
    doc.replaceObject(
        ScrubObjGen(2),
        ScrubObject::newDictionary(
            {{"/Type", name("/Pages")},
             {"/Kids", ScrubObject::newArray({ref(3)})},
             {"/Count", ScrubObject::newInteger(1)}}));
    doc.replaceObject(
        ScrubObjGen(3),
        ScrubObject::newDictionary(
            {{"/Type", name("/Page")},
             {"/Parent", ref(2)},
             {"/Contents", ref(4)},
             {"/Resources",
              ScrubObject::newDictionary(
                  {{"/Font", ScrubObject::newDictionary({{"/F1", ref(5)}})}})}}));
    doc.replaceObject(
        ScrubObjGen(4),
        ScrubObject::newStream({}, "%drafted by alice\nq q BT /F1 12 Tf (Hi) Tj ET Q"));
    doc.replaceObject(
        ScrubObjGen(5),
        ScrubObject::newDictionary(
            {{"/Type", name("/Font")},
             {"/Subtype", name("/Type1")},
             {"/BaseFont", name("/Helvetica")}}));
    doc.replaceObject(
        ScrubObjGen(6),
        ScrubObject::newStream(
            {{"/Type", name("/Metadata")}, {"/Subtype", name("/XML")}},
            "<x:xmpmeta>alice</x:xmpmeta>"));
    doc.replaceObject(
        ScrubObjGen(7),
        ScrubObject::newDictionary({{"/Author", ScrubObject::newString("alice@example.com")}}));
    doc.replaceObject(
        ScrubObjGen(8), ScrubObject::newDictionary({{"/Orphan", ScrubObject::newBool(true)}}));
    doc.setRoot(ScrubObjGen(1));
    doc.setInfo(ScrubObjGen(7));
    doc.setMetadata("<x:xmpmeta>carol@example.com</x:xmpmeta>");
    return doc;
}

static std::vector<std::string>
stage_names(ScrubJob::Result const& result)
{
    std::vector<std::string> names;
    for (auto const& stage: result.stages) {
        names.push_back(stage.name);
    }
    return names;
}

static ScrubJob::StageResult const&
stage(ScrubJob::Result const& result, std::string const& name)
{
    auto iter = std::find_if(
        result.stages.begin(), result.stages.end(), [&name](ScrubJob::StageResult const& s) {
            return s.name == name;
        });
    assert(iter != result.stages.end());
    return *iter;
}

static scrub_error_code_e
error_code(std::function<void()> fn)
{
    try {
        fn();
    } catch (ScrubExc& e) {
        return e.getErrorCode();
    }
    return scrub_e_success;
}

static void
test_run()
{
    for (size_t threads: {0, 3}) {
        ScrubJob::Config config;
        config.worker_threads = threads;
        ScrubJob job(config);
        auto result = job.run(make_document());

        assert(!result.cancelled);
        assert(
            stage_names(result) ==
            std::vector<std::string>(
                {"Reference-Map",
                 "Reachability",
                 "Dedup",
                 "Stream-Merge",
                 "Compact",
                 "XRef-Rebuild",
                 "Content-Sanitize",
                 "Binary-Sanitize",
                 "Metadata-Strip",
                 "Final-Cleanup"}));
        for (auto const& s: result.stages) {
            assert(s.succeeded);
        }
        assert(stage(result, "Reachability").changes == 1);
        assert(stage(result, "Content-Sanitize").changes == 1);
        assert(stage(result, "Metadata-Strip").changes == 1);
        // The metadata stream and the Info dictionary are no longer
        // reachable once their keys are gone.
        assert(stage(result, "Final-Cleanup").changes == 2);
        assert(result.structure.objects_removed == 3);

        auto const& doc = result.document;
        assert(doc.getObjectCount() == 5);
        assert(doc.getTrailer().root == ScrubObjGen(1));
        assert(!doc.getTrailer().info);
        assert(!doc.getMetadata());
        assert(!doc.getTrailer().encrypt);
        assert(!doc.getObject(ScrubObjGen(1)).hasKey("/Metadata"));
        assert(doc.getObject(ScrubObjGen(4)).getStreamData() == "q\nBT\n/F1 12 Tf\n(Hi) Tj\nET\nQ\n");
        // Resources are kept while functionality is preserved.
        assert(
            doc.getObject(ScrubObjGen(3)).getKey("/Resources").getKey("/Font").hasKey("/F1"));
        assert(doc.getXRefTables().size() == 1);
        assert(result.issues.empty());
        assert(result.content.streams_processed == 1);
        assert(result.metadata.trailer_info_removed);
        assert(result.metadata.document_metadata_removed);
        assert(result.findings_before.empty());
        assert(result.findings_after.empty());
    }
}

static void
test_selected_stages()
{
    ScrubJob::Config config;
    config.cleaning.clean_structure = false;
    config.cleaning.clean_streams = false;
    config.cleaning.clean_binary = false;
    ScrubJob job(config);
    auto result = job.run(make_document());
    assert(
        stage_names(result) ==
        std::vector<std::string>({"Content-Sanitize", "Metadata-Strip"}));
    // Nothing prunes the orphan without structure cleaning.
    assert(result.document.getObjectCount() == 8);
    assert(!result.document.getTrailer().info);

    config = ScrubJob::Config();
    config.cleaning.remove_metadata = false;
    config.cleaning.remove_hidden = false;
    config.processing.remove_comments = false;
    ScrubJob keep(config);
    result = keep.run(make_document());
    assert(result.document.getTrailer().info == ScrubObjGen(7));
    assert(result.document.getMetadata());
    assert(
        result.document.getObject(ScrubObjGen(4)).getStreamData().substr(0, 18) ==
        "%drafted by alice\n");

    // Removing hidden data without preserving functionality also drops
    // unused resources.
    config = ScrubJob::Config();
    config.cleaning.preserve_functionality = false;
    auto doc = make_document();
    auto& page_dict = doc.getObject(ScrubObjGen(3));
    auto resources = page_dict.getKey("/Resources");
    auto font_dict = resources.getKey("/Font");
    font_dict.replaceKey("/F9", ref(5));
    resources.replaceKey("/Font", font_dict);
    page_dict.replaceKey("/Resources", resources);
    ScrubJob aggressive(config);
    auto page = aggressive.run(doc).document.getObject(ScrubObjGen(3));
    auto fonts = page.getKey("/Resources").getKey("/Font");
    assert(fonts.hasKey("/F1"));
    assert(!fonts.hasKey("/F9"));

    // Content that can't be read keeps every resource.
    for (auto const& contents:
         {ScrubObject::newStream({}, "BT /F1 12 Tf (Hi) Tj ET BX 3 vendorop EX"),
          ScrubObject::newStream(
              {{"/Filter", name("/ASCIIHexDecode")}}, "4254202f46312031322054662045543e>")}) {
        doc.replaceObject(ScrubObjGen(4), contents);
        auto kept = aggressive.run(doc);
        fonts = kept.document.getObject(ScrubObjGen(3)).getKey("/Resources").getKey("/Font");
        assert(fonts.hasKey("/F1"));
        assert(fonts.hasKey("/F9"));
        assert(kept.content.streams_skipped == 1);
        assert(std::any_of(kept.issues.begin(), kept.issues.end(), [](ScrubIssue const& i) {
            return i.og == ScrubObjGen(4) && i.level == ScrubIssue::l_warning;
        }));
    }
}

static void
test_unicode_title()
{
    std::string title("\xfe\xff\x00H\x00i", 6);
    auto doc = make_document();
    auto& info = doc.getObject(ScrubObjGen(7));
    info.replaceKey("/Title", ScrubObject::newString(title));
    ScrubJob::Config config;
    config.cleaning.remove_metadata = false;
    ScrubJob job(config);
    auto result = job.run(doc);
    assert(result.document.getTrailer().info == ScrubObjGen(7));
    auto const& kept = result.document.getObject(ScrubObjGen(7));
    assert(kept.getKey("/Title").getStringValue() == title);
}

static void
test_scanning()
{
    ScrubJob::Config config;
    config.scan_before = true;
    config.scan_after = true;
    ScrubJob job(config);
    auto result = job.run(make_document());
    auto emails = [](std::vector<ScrubFinding> const& findings) {
        return std::count_if(findings.begin(), findings.end(), [](ScrubFinding const& f) {
            return f.pattern_id == "email";
        });
    };
    // The Info author and the document XMP
    assert(emails(result.findings_before) == 2);
    assert(emails(result.findings_after) == 0);
    assert(result.scanning.objects_scanned > 0);
    assert(result.detection.objects_analyzed > 0);

    auto doc = make_document();
    auto findings = job.scan(doc);
    assert(emails(findings) == 2);
}

static void
test_encryption()
{
    ScrubJob::Config config;
    config.encryption = ScrubEncryptor::EncryptionConfig();
    ScrubJob job(config);
    auto result = job.run(make_document());
    assert(result.stages.back().name == "Encrypt");
    assert(result.stages.back().succeeded);
    assert(result.stages.back().changes == 4);
    assert(result.document.getTrailer().encrypt);
    assert(result.encryption.objects_encrypted == 4);
    auto encrypted = result.document.getObject(ScrubObjGen(4)).getStreamData();
    assert(encrypted != "q\nBT\n/F1 12 Tf\n(Hi) Tj\nET\nQ\n");

    job.getEncryptor().decryptDocument(result.document);
    assert(
        result.document.getObject(ScrubObjGen(4)).getStreamData() ==
        "q\nBT\n/F1 12 Tf\n(Hi) Tj\nET\nQ\n");

    // A stage failure is recorded and the document is left as it was.
    auto doc = make_document();
    doc.getTrailer().encrypt = ScrubObject::newDictionary({{"/Filter", name("/Standard")}});
    ScrubJob again(config);
    result = again.run(doc);
    assert(!result.stages.back().succeeded);
    auto failure = std::find_if(
        result.issues.begin(), result.issues.end(), [](ScrubIssue const& issue) {
            return issue.level == ScrubIssue::l_error;
        });
    assert(failure != result.issues.end());
    assert(failure->error_code == scrub_e_crypto);
    assert(failure->description.substr(0, 14) == "Encrypt failed");
    assert(
        result.document.getObject(ScrubObjGen(4)).getStreamData() ==
        "q\nBT\n/F1 12 Tf\n(Hi) Tj\nET\nQ\n");

    ScrubJob plain;
    bool thrown = false;
    try {
        plain.encrypt(doc);
    } catch (std::logic_error&) {
        thrown = true;
    }
    assert(thrown);
}

static void
test_errors()
{
    ScrubJob job;
    auto doc = make_document();
    doc.setRoot(ScrubObjGen(20));
    assert(error_code([&job, &doc]() { job.run(doc); }) == scrub_e_structure);

    ScrubJob::Config config;
    config.scanning.confidence_threshold = 1.5;
    assert(error_code([&config]() { ScrubJob::validateConfig(config); }) == scrub_e_config);
    assert(error_code([&config]() { ScrubJob j(config); }) == scrub_e_config);

    config = ScrubJob::Config();
    config.detection.entropy_threshold = 9.0;
    assert(error_code([&config]() { ScrubJob::validateConfig(config); }) == scrub_e_config);

    config = ScrubJob::Config();
    config.stream_merge.allowed_filters.clear();
    assert(error_code([&config]() { ScrubJob::validateConfig(config); }) == scrub_e_config);

    config = ScrubJob::Config();
    ScrubEncryptor::EncryptionConfig encryption;
    encryption.key_length = 64;
    config.encryption = encryption;
    assert(
        error_code([&config]() { ScrubJob::validateConfig(config); }) ==
        scrub_e_invalid_encryption_config);
}

static void
test_cancel()
{
    ScrubJob job;
    assert(!job.isCancelled());
    job.cancel();
    assert(job.isCancelled());
    auto result = job.run(make_document());
    assert(result.cancelled);
    assert(result.stages.empty());
    assert(result.document.getObjectCount() == 8);
    assert(result.document.getTrailer().info == ScrubObjGen(7));
}

static void
test_verbose()
{
    ScrubDocument doc;
    doc.replaceObject(
        ScrubObjGen(1),
        ScrubObject::newDictionary({{"/Type", name("/Catalog")}, {"/Extra", ref(2)}}));
    doc.replaceObject(ScrubObjGen(2), ScrubObject::newStream({}, "q foo Q"));
    doc.setRoot(ScrubObjGen(1));

    std::ostringstream out;
    std::ostringstream err;
    auto logger = ScrubLogger::create();
    logger->setOutputStreams(&out, &err);

    ScrubJob::Config config;
    config.verbose = true;
    ScrubJob job(config);
    job.setLogger(logger);
    assert(job.getLogger() == logger);
    auto result = job.run(doc);
    assert(result.issues.size() == 1);
    assert(
        err.str().find("WARNING: 2 0 R: content stream could not be tokenized") !=
        std::string::npos);

    // Quiet by default
    std::ostringstream quiet_err;
    logger->setOutputStreams(&out, &quiet_err);
    ScrubJob quiet;
    quiet.setLogger(logger);
    quiet.run(doc);
    assert(quiet_err.str().empty());
}

static void
test_stage_names()
{
    auto const& names = ScrubJob::getStageNames();
    assert(names.size() == 11);
    assert(names.front() == "Reference-Map");
    assert(names.back() == "Encrypt");
}

int
main()
{
    test_run();
    test_selected_stages();
    test_unicode_title();
    test_scanning();
    test_encryption();
    test_errors();
    test_cancel();
    test_verbose();
    test_stage_names();
    std::cout << "job tests passed" << std::endl;
    return 0;
}

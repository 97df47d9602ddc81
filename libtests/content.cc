#include <pdfscrub/assert_test.h>

#include <pdfscrub/Pl_Flate.hh>
#include <pdfscrub/ScrubContentSanitizer.hh>
#include <pdfscrub/ScrubDocument.hh>
#include <pdfscrub/ScrubResourceTracker.hh>
#include <pdfscrub/ScrubWorkerPool.hh>

#include <iostream>

using Sanitizer = ScrubContentSanitizer;

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

// Parse, apply the default or given policy, and re-encode.
static std::string
rewrite(std::string const& data, Sanitizer::ProcessingConfig const& config = {})
{
    Sanitizer sanitizer(config);
    std::vector<Sanitizer::Operation> ops;
    std::string error;
    assert(Sanitizer::parseOperations(data, ops, error));
    Sanitizer::Stats stats;
    Sanitizer::ResourceUsage usage;
    return Sanitizer::encodeOperations(sanitizer.applyPolicy(ops, stats, usage));
}

static void
test_parse()
{
    std::vector<Sanitizer::Operation> ops;
    std::string error;
    assert(Sanitizer::parseOperations("0 0 1 rg [(a) 2 (b)] TJ /P <</MCID 3>> BDC", ops, error));
    assert(ops.size() == 3);
    assert(ops.at(0).op == "rg");
    assert(ops.at(0).operands.size() == 3);
    assert(ops.at(1).op == "TJ");
    assert(ops.at(1).operands.size() == 1);
    assert(ops.at(1).operands.at(0).raw == "[ (a) 2 (b) ]");
    assert(ops.at(2).operands.at(1).raw == "<< /MCID 3 >>");
    assert(Sanitizer::encodeOperations(ops) == "0 0 1 rg\n[ (a) 2 (b) ] TJ\n/P << /MCID 3 >> BDC\n");

    // Inline images keep their data byte for byte.
    assert(Sanitizer::parseOperations("BI /W 1 /H 1 /CS /G ID \x80 EI Q", ops, error));
    assert(ops.size() == 2);
    assert(ops.at(0).kind == Sanitizer::Operation::k_inline_image);
    assert(ops.at(0).operands.size() == 6);
    assert(ops.at(0).image_data == "\x80 ");
    assert(Sanitizer::encodeOperations(ops) == "BI /W 1 /H 1 /CS /G\nID \x80 EI\nQ\n");

    assert(!Sanitizer::parseOperations("q foo Q", ops, error));
    assert(error == "unknown operator foo");
    assert(!Sanitizer::parseOperations("q [1 2 Q", ops, error));
    assert(!Sanitizer::parseOperations("(open", ops, error));
    assert(error.find("unterminated string") != std::string::npos);
    assert(!Sanitizer::parseOperations("EI", ops, error));

    assert(Sanitizer::isContentOperator("T*"));
    assert(Sanitizer::isContentOperator("\""));
    assert(!Sanitizer::isContentOperator("obj"));
}

static void
test_policy()
{
    // Redundant q is collapsed.
    assert(rewrite("q q Q") == "q\nQ\n");
    assert(rewrite("1 0 0 1 5 5 cm 1 0 0 1 5 5 cm 2 0 0 2 0 0 cm") ==
           "1 0 0 1 5 5 cm\n2 0 0 2 0 0 cm\n");
    assert(rewrite("/GS1 gs /GS1 gs /GS2 gs") == "/GS1 gs\n/GS2 gs\n");
    // Other operators are never collapsed.
    assert(rewrite("0 0 m 0 0 m") == "0 0 m\n0 0 m\n");

    Sanitizer::ProcessingConfig keep;
    keep.remove_comments = false;
    keep.remove_redundant_graphics_state = false;
    keep.merge_text_operators = false;
    assert(rewrite("%hidden\nq q (a) Tj (b) Tj Q", keep) == "%hidden\nq\nq\n(a) Tj\n(b) Tj\nQ\n");

    Sanitizer::ProcessingConfig config;
    config.remove_operators = {"Td"};
    Sanitizer sanitizer(config);
    std::vector<Sanitizer::Operation> ops;
    std::string error;
    assert(Sanitizer::parseOperations(
        "%author: someone\nBT /F1 12 Tf 10 20 Td (a) Tj (b) Tj [(c)] TJ (d) Tj ET\n"
        "/CS0 cs /DeviceRGB CS /Im1 Do",
        ops,
        error));
    Sanitizer::Stats stats;
    Sanitizer::ResourceUsage usage;
    auto result = Sanitizer::encodeOperations(sanitizer.applyPolicy(ops, stats, usage));
    assert(result == "BT\n/F1 12 Tf\n(ab) Tj\n[ (c) ] TJ\n(d) Tj\nET\n/CS0 cs\n/DeviceRGB CS\n/Im1 Do\n");
    assert(stats.operators_removed == 2);
    assert(stats.operators_merged == 1);
    assert(usage.at("/Font") == std::set<std::string>({"/F1"}));
    assert(usage.at("/XObject") == std::set<std::string>({"/Im1"}));
    // Device colour spaces are not resources.
    assert(usage.at("/ColorSpace") == std::set<std::string>({"/CS0"}));

    // Merging escapes what needs escaping.
    assert(rewrite("(a\\)) Tj (\\() Tj") == "(a\\)\\() Tj\n");
}

static ScrubDocument
make_document()
{
    ScrubDocument doc;
    doc.replaceObject(
        ScrubObjGen(1),
        ScrubObject::newDictionary({{"/Type", name("/Catalog")}, {"/Pages", ref(2)}}));
    doc.replaceObject(
        ScrubObjGen(2),
        ScrubObject::newDictionary(
            {{"/Type", name("/Page")},
             {"/Contents", ref(3)},
             {"/Resources",
              ScrubObject::newDictionary(
                  {{"/Font", ScrubObject::newDictionary({{"/F1", ref(5)}, {"/F2", ref(6)}})},
                   {"/XObject", ScrubObject::newDictionary({{"/Im1", ref(7)}})}})}}));
    doc.replaceObject(
        ScrubObjGen(3),
        ScrubObject::newStream(
            {{"/Filter", name("/FlateDecode")}},
            Pl_Flate::deflate("q q BT /F1 12 Tf (x) Tj ET Q")));
    doc.replaceObject(
        ScrubObjGen(4),
        ScrubObject::newStream(
            {{"/Subtype", name("/Form")}, {"/Filter", name("/LZWDecode")}}, "opaque"));
    doc.replaceObject(ScrubObjGen(5), ScrubObject::newDictionary({{"/Type", name("/Font")}}));
    doc.replaceObject(ScrubObjGen(6), ScrubObject::newDictionary({{"/Type", name("/Font")}}));
    doc.replaceObject(
        ScrubObjGen(7),
        ScrubObject::newStream(
            {{"/Subtype", name("/Image")}, {"/Filter", name("/DCTDecode")}}, "\xff\xd8\xff"));
    doc.replaceObject(ScrubObjGen(8), ScrubObject::newStream({}, "q foo Q"));
    doc.replaceObject(ScrubObjGen(9), ScrubObject::newStream({}, "hello world"));
    doc.replaceObject(
        ScrubObjGen(10), ScrubObject::newStream({{"/Subtype", name("/Image")}}, "\x01\x02 )"));
    doc.setRoot(ScrubObjGen(1));
    return doc;
}

static void
test_document()
{
    for (size_t threads: {0, 3}) {
        auto doc = make_document();
        ScrubWorkerPool pool(threads);
        Sanitizer sanitizer;
        assert(sanitizer.sanitizeDocument(doc, &pool) == 1);

        auto const& contents = doc.getObject(ScrubObjGen(3));
        assert(contents.getKey("/Filter").isNameAndEquals("/FlateDecode"));
        assert(
            Pl_Flate::inflate(contents.getStreamData()) == "q\nBT\n/F1 12 Tf\n(x) Tj\nET\nQ\n");
        assert(
            contents.getKey("/Length").getIntValue() ==
            static_cast<long long>(contents.getStreamData().size()));

        // The LZW form and the unparseable stream are reported in
        // object order. The DCT image, the plain data, and the raw
        // image samples are silently skipped.
        auto const& issues = doc.getIssues();
        assert(issues.size() == 2);
        assert(issues.at(0).og == ScrubObjGen(4));
        assert(issues.at(0).level == ScrubIssue::l_warning);
        assert(issues.at(1).og == ScrubObjGen(8));
        assert(doc.getObject(ScrubObjGen(8)).getStreamData() == "q foo Q");
        assert(doc.getObject(ScrubObjGen(9)).getStreamData() == "hello world");

        auto const& stats = sanitizer.getStats();
        assert(stats.streams_processed == 1);
        assert(stats.operators_removed == 1);
        assert(stats.bytes_before == std::string("q q BT /F1 12 Tf (x) Tj ET Q").size());
        assert(sanitizer.getFontsUsed() == std::set<std::string>({"/F1"}));
        assert(sanitizer.getXObjectsUsed().empty());

        // The LZW form and the unparseable stream may use anything.
        assert(stats.streams_skipped == 2);
        assert(sanitizer.findUnusedResources(doc).empty());

        sanitizer.reset();
        assert(sanitizer.getStats().streams_processed == 0);
        assert(sanitizer.getResourceUsage().empty());
    }
}

// A page using /F1 with the given content stream, and unused /F2 and
// /Im1
static ScrubDocument
make_page(ScrubObject const& contents)
{
    ScrubDocument doc;
    doc.replaceObject(
        ScrubObjGen(1),
        ScrubObject::newDictionary(
            {{"/Type", name("/Page")},
             {"/Contents", ref(2)},
             {"/Resources",
              ScrubObject::newDictionary(
                  {{"/Font", ScrubObject::newDictionary({{"/F1", ref(3)}, {"/F2", ref(3)}})},
                   {"/XObject", ScrubObject::newDictionary({{"/Im1", ref(4)}})}})}}));
    doc.replaceObject(ScrubObjGen(2), contents);
    doc.replaceObject(ScrubObjGen(3), ScrubObject::newDictionary({{"/Type", name("/Font")}}));
    doc.replaceObject(
        ScrubObjGen(4), ScrubObject::newStream({{"/Subtype", name("/Image")}}, "\x80"));
    doc.setRoot(ScrubObjGen(1));
    return doc;
}

static void
test_remove_unused()
{
    auto doc = make_page(ScrubObject::newStream(
        {{"/Filter", name("/FlateDecode")}}, Pl_Flate::deflate("BT /F1 12 Tf (x) Tj ET")));
    Sanitizer report_only;
    report_only.sanitizeDocument(doc);
    auto unused = report_only.findUnusedResources(doc);
    assert(unused.size() == 1);
    assert(unused.at(ScrubObjGen(1)).at("/Font") == std::set<std::string>({"/F2"}));
    assert(unused.at(ScrubObjGen(1)).at("/XObject") == std::set<std::string>({"/Im1"}));
    // Not enabled
    assert(report_only.removeUnusedResources(doc) == 0);

    Sanitizer::ProcessingConfig config;
    config.remove_unused_resources = true;
    Sanitizer sanitizer(config);
    sanitizer.sanitizeDocument(doc);
    assert(sanitizer.removeUnusedResources(doc) == 2);
    auto resources = doc.getObject(ScrubObjGen(1)).getKey("/Resources");
    assert(resources.getKey("/Font").getKeys() == std::set<std::string>({"/F1"}));
    assert(resources.getKey("/XObject").getKeys().empty());
    assert(sanitizer.findUnusedResources(doc).empty());
}

static void
test_skipped_content()
{
    Sanitizer::ProcessingConfig config;
    config.remove_unused_resources = true;

    // Page content under a filter we don't decode
    auto doc = make_page(ScrubObject::newStream(
        {{"/Filter", name("/ASCIIHexDecode")}}, "4254202f46312031322054662028782920546a204554>"));
    Sanitizer hex(config);
    assert(hex.sanitizeDocument(doc) == 0);
    assert(hex.getStats().streams_skipped == 1);
    assert(doc.getIssues().size() == 1);
    assert(doc.getIssues().at(0).og == ScrubObjGen(2));
    assert(hex.removeUnusedResources(doc) == 0);
    auto fonts = doc.getObject(ScrubObjGen(1)).getKey("/Resources").getKey("/Font");
    assert(fonts.getKeys() == std::set<std::string>({"/F1", "/F2"}));

    // Operators we don't know inside a compatibility section
    doc = make_page(
        ScrubObject::newStream({}, "BT /F1 12 Tf (x) Tj ET BX 1 2 newop EX /Im1 Do"));
    Sanitizer compat(config);
    assert(compat.sanitizeDocument(doc) == 0);
    assert(compat.getStats().streams_skipped == 1);
    assert(compat.findUnusedResources(doc).empty());
    assert(compat.removeUnusedResources(doc) == 0);
    auto resources = doc.getObject(ScrubObjGen(1)).getKey("/Resources");
    assert(resources.getKey("/Font").getKeys().size() == 2);
    assert(resources.getKey("/XObject").hasKey("/Im1"));

    // A form that does not inflate
    doc = make_page(ScrubObject::newStream({}, "BT /F1 12 Tf (x) Tj ET"));
    doc.replaceObject(
        ScrubObjGen(5),
        ScrubObject::newStream(
            {{"/Subtype", name("/Form")}, {"/Filter", name("/FlateDecode")}}, "not zlib"));
    Sanitizer bad_form(config);
    assert(bad_form.sanitizeDocument(doc) == 1);
    assert(bad_form.getStats().streams_skipped == 1);
    assert(bad_form.removeUnusedResources(doc) == 0);
}

static ScrubObject
gray_image(long long width, long long height, std::string const& data)
{
    return ScrubObject::newStream(
        {{"/Subtype", name("/Image")},
         {"/Width", ScrubObject::newInteger(width)},
         {"/Height", ScrubObject::newInteger(height)},
         {"/BitsPerComponent", ScrubObject::newInteger(8)},
         {"/ColorSpace", name("/DeviceGray")}},
        data);
}

static void
test_image_samples()
{
    ScrubDocument doc;
    // Samples that happen to tokenize as operands
    doc.replaceObject(ScrubObjGen(1), gray_image(15, 1, "1 1 1 1 1 1 1 1"));
    // Samples that happen to contain operators
    doc.replaceObject(ScrubObjGen(2), gray_image(5, 1, "q q Q"));
    auto deflated = gray_image(7, 1, "");
    deflated.replaceKey("/Filter", name("/FlateDecode"));
    deflated.replaceStreamData(Pl_Flate::deflate("0 0 m S"));
    doc.replaceObject(ScrubObjGen(3), deflated);
    // Colour space we can't count without resolving it
    auto indirect = gray_image(100, 100, "q q Q");
    indirect.replaceKey("/ColorSpace", ref(9));
    doc.replaceObject(ScrubObjGen(4), indirect);
    // Bilevel mask: one bit per sample
    auto mask = ScrubObject::newStream(
        {{"/Subtype", name("/Image")},
         {"/Width", ScrubObject::newInteger(40)},
         {"/Height", ScrubObject::newInteger(1)},
         {"/ImageMask", ScrubObject::newBool(true)}},
        "q q Q");
    doc.replaceObject(ScrubObjGen(5), mask);
    // Much shorter than its samples and made of operators
    doc.replaceObject(ScrubObjGen(6), gray_image(10, 10, "q q Q"));
    auto before = doc;

    Sanitizer sanitizer;
    assert(sanitizer.sanitizeDocument(doc) == 1);
    for (uint32_t i = 1; i <= 5; ++i) {
        assert(doc.getObject(ScrubObjGen(i)) == before.getObject(ScrubObjGen(i)));
    }
    assert(doc.getObject(ScrubObjGen(6)).getStreamData() == "q\nQ\n");
    assert(!doc.anyIssues());
    assert(sanitizer.getStats().streams_skipped == 0);
}

static void
test_resource_limit()
{
    ScrubDocument doc;
    std::string big(100000, ' ');
    big += "q Q";
    doc.replaceObject(
        ScrubObjGen(1),
        ScrubObject::newStream({{"/Filter", name("/FlateDecode")}}, Pl_Flate::deflate(big)));
    doc.setRoot(ScrubObjGen(1));
    auto before = doc.getObject(ScrubObjGen(1));

    ScrubResourceTracker tracker(1000);
    Sanitizer sanitizer;
    sanitizer.setResourceTracker(&tracker);
    assert(sanitizer.sanitizeDocument(doc) == 0);
    assert(doc.getIssues().size() == 1);
    assert(doc.getIssues().at(0).error_code == scrub_e_processing);
    assert(doc.getObject(ScrubObjGen(1)) == before);
    assert(tracker.getCurrent() == 0);
}

int
main()
{
    test_parse();
    test_policy();
    test_document();
    test_remove_unused();
    test_skipped_content();
    test_image_samples();
    test_resource_limit();
    std::cout << "content tests passed" << std::endl;
    return 0;
}

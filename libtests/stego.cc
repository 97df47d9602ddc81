#include <pdfscrub/assert_test.h>

#include <pdfscrub/Pl_Buffer.hh>
#include <pdfscrub/Pl_DCT.hh>
#include <pdfscrub/Pl_Flate.hh>
#include <pdfscrub/ScrubDocument.hh>
#include <pdfscrub/ScrubStegoDetector.hh>
#include <pdfscrub/ScrubWorkerPool.hh>

#include <iostream>
#include <stdexcept>

using Stego = ScrubStegoDetector;

static ScrubObject
name(std::string const& n)
{
    return ScrubObject::newName(n);
}

static ScrubObject
integer(long long i)
{
    return ScrubObject::newInteger(i);
}

// Mid-grey with random low bits, as left by LSB embedding
static std::string
random_lsb_samples(size_t pixels)
{
    std::string result;
    unsigned long x = 20261018;
    for (size_t i = 0; i < pixels; ++i) {
        x = (x * 1103515245UL + 12345UL) & 0x7fffffffUL;
        result += static_cast<char>(128 | ((x >> 16) & 1));
    }
    return result;
}

static std::string
even_samples(size_t pixels)
{
    std::string result;
    for (size_t i = 0; i < pixels; ++i) {
        result += static_cast<char>(2 * (i % 120));
    }
    return result;
}

static ScrubObject
image(size_t width, size_t height, char const* color_space, std::string const& data)
{
    return ScrubObject::newStream(
        {{"/Subtype", name("/Image")},
         {"/Width", integer(static_cast<long long>(width))},
         {"/Height", integer(static_cast<long long>(height))},
         {"/BitsPerComponent", integer(8)},
         {"/ColorSpace", name(color_space)}},
        data);
}

static void
test_samples()
{
    auto f = Stego::analyzeSamples(random_lsb_samples(4096), 1);
    assert(f.pixels == 4096);
    assert(f.components == 1);
    assert(f.lsb_ratios.size() == 1);
    assert(f.lsb_ratios.at(0) > 0.45 && f.lsb_ratios.at(0) < 0.55);
    assert(f.lsb_confidence > 0.8);
    // Almost no spread, so balanced pairs mean nothing.
    assert(f.luma_mean > 128.0 && f.luma_mean < 129.0);
    assert(f.luma_stddev < 1.0);
    assert(f.histogram_confidence < 0.1);

    f = Stego::analyzeSamples(even_samples(4096), 1);
    assert(f.lsb_ratios.at(0) == 0.0);
    assert(f.transition_ratios.at(0) == 0.0);
    assert(f.lsb_confidence == 0.0);
    assert(f.histogram_confidence == 0.0);
    assert(f.luma_stddev > 32.0);

    // RGB, channels weighted by luma contribution
    std::string rgb;
    auto noise = random_lsb_samples(3000);
    for (size_t i = 0; i < 1000; ++i) {
        rgb += noise.at(i);
        rgb += '\x40';
        rgb += '\x40';
    }
    f = Stego::analyzeSamples(rgb, 3);
    assert(f.pixels == 1000);
    assert(f.lsb_ratios.size() == 3);
    assert(f.lsb_ratios.at(1) == 0.0);
    assert(f.lsb_confidence < 0.5);

    f = Stego::analyzeSamples("", 3);
    assert(f.pixels == 0);

    bool thrown = false;
    try {
        Stego::analyzeSamples("abc", 0);
    } catch (std::logic_error&) {
        thrown = true;
    }
    assert(thrown);
}

static void
test_components()
{
    ScrubDocument doc;
    doc.replaceObject(
        ScrubObjGen(5), ScrubObject::newStream({{"/N", integer(3)}}, "profile data"));
    doc.replaceObject(
        ScrubObjGen(6),
        ScrubObject::newArray({name("/ICCBased"), ScrubObject::newReference(ScrubObjGen(5))}));

    assert(Stego::getComponents(name("/DeviceGray"), doc) == 1);
    assert(Stego::getComponents(name("/DeviceRGB"), doc) == 3);
    assert(Stego::getComponents(name("/DeviceCMYK"), doc) == 4);
    assert(Stego::getComponents(name("/Pattern"), doc) == 0);
    assert(Stego::getComponents(integer(3), doc) == 0);
    assert(Stego::getComponents(ScrubObject::newReference(ScrubObjGen(6)), doc) == 3);
    assert(
        Stego::getComponents(
            ScrubObject::newArray(
                {name("/Indexed"), name("/DeviceRGB"), integer(1), ScrubObject::newString("abcdef")}),
            doc) == 1);
    assert(
        Stego::getComponents(
            ScrubObject::newArray({name("/CalRGB"), ScrubObject::newDictionary()}), doc) == 3);
    assert(Stego::getComponents(ScrubObject::newReference(ScrubObjGen(99)), doc) == 0);
}

static void
test_decode()
{
    ScrubDocument doc;
    Stego detector;
    size_t components = 0;
    std::string reason;

    // A JPEG made with libjpeg
    size_t const w = 16;
    size_t const h = 8;
    std::string rgb;
    for (size_t y = 0; y < h; ++y) {
        for (size_t x = 0; x < w; ++x) {
            rgb += static_cast<char>(x * 16);
            rgb += static_cast<char>(y * 32);
            rgb += static_cast<char>(128);
        }
    }
    Pl_Buffer jpeg_out("jpeg");
    Pl_DCT compress("compress", &jpeg_out, w, h, 3, JCS_RGB);
    compress.writeString(rgb);
    compress.finish();
    auto jpeg = jpeg_out.getString();

    auto jpeg_image = image(w, h, "/DeviceRGB", jpeg);
    jpeg_image.replaceKey("/Filter", name("/DCTDecode"));
    auto samples = detector.decodeImage(jpeg_image, doc, components, reason);
    assert(samples);
    assert(components == 3);
    assert(samples->size() == w * h * 3);

    // Flate without a predictor
    auto gray = even_samples(100);
    auto flate_image = image(10, 10, "/DeviceGray", Pl_Flate::deflate(gray));
    flate_image.replaceKey("/Filter", name("/FlateDecode"));
    samples = detector.decodeImage(flate_image, doc, components, reason);
    assert(samples == gray);
    assert(components == 1);

    flate_image.replaceKey(
        "/DecodeParms", ScrubObject::newDictionary({{"/Predictor", integer(15)}}));
    assert(!detector.decodeImage(flate_image, doc, components, reason));
    assert(reason == "predictor");

    auto bilevel = image(10, 10, "/DeviceGray", gray);
    bilevel.replaceKey("/BitsPerComponent", integer(1));
    assert(!detector.decodeImage(bilevel, doc, components, reason));
    assert(reason == "not 8 bits per component");

    auto mask = image(10, 10, "/DeviceGray", gray);
    mask.replaceKey("/ImageMask", ScrubObject::newBool(true));
    assert(!detector.decodeImage(mask, doc, components, reason));
    assert(reason == "image mask");

    auto jbig2 = image(10, 10, "/DeviceGray", gray);
    jbig2.replaceKey("/Filter", name("/JBIG2Decode"));
    assert(!detector.decodeImage(jbig2, doc, components, reason));
    assert(reason == "unsupported filter /JBIG2Decode");

    auto corrupt = image(10, 10, "/DeviceGray", "not a jpeg at all");
    corrupt.replaceKey("/Filter", name("/DCTDecode"));
    bool thrown = false;
    try {
        detector.decodeImage(corrupt, doc, components, reason);
    } catch (std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
}

static std::string
high_entropy_string()
{
    std::string result;
    for (int i = 0; i < 256; ++i) {
        result += static_cast<char>(i);
    }
    return result;
}

static ScrubDocument
make_document()
{
    ScrubDocument doc;
    doc.replaceObject(
        ScrubObjGen(1),
        ScrubObject::newDictionary(
            {{"/Type", name("/Catalog")}, {"/Note", ScrubObject::newString(high_entropy_string())}}));
    doc.replaceObject(ScrubObjGen(2), image(64, 64, "/DeviceGray", random_lsb_samples(4096)));
    auto even = image(64, 64, "/DeviceGray", Pl_Flate::deflate(even_samples(4096)));
    even.replaceKey("/Filter", name("/FlateDecode"));
    doc.replaceObject(ScrubObjGen(3), even);
    doc.replaceObject(
        ScrubObjGen(4),
        ScrubObject::newStream(
            {{"/Filter", name("/FlateDecode")}},
            Pl_Flate::deflate("BT /F1 12 Tf 3 Tr (hidden) Tj 0 Tr (shown) Tj ET")));
    doc.replaceObject(
        ScrubObjGen(5),
        ScrubObject::newDictionary(
            {{"/Producer", ScrubObject::newString(high_entropy_string())},
             {"/Title", ScrubObject::newString(std::string(100, 'a'))},
             {"/Subject", ScrubObject::newString(high_entropy_string().substr(0, 32))}}));
    doc.replaceObject(ScrubObjGen(6), image(4, 4, "/DeviceGray", random_lsb_samples(16)));
    auto corrupt = image(64, 64, "/DeviceGray", "not a jpeg at all");
    corrupt.replaceKey("/Filter", name("/DCTDecode"));
    doc.replaceObject(ScrubObjGen(7), corrupt);
    doc.replaceObject(ScrubObjGen(8), ScrubObject::newStream({}, "BT 0 Tr (plain) Tj ET"));
    doc.setRoot(ScrubObjGen(1));
    doc.setInfo(ScrubObjGen(5));
    return doc;
}

static void
test_document()
{
    for (size_t threads: {0, 2}) {
        auto doc = make_document();
        ScrubWorkerPool pool(threads);
        Stego detector;
        auto findings = detector.analyzeDocument(doc, &pool);

        assert(findings.size() == 3);
        assert(findings.at(0).og == ScrubObjGen(2));
        assert(findings.at(0).pattern_id == "lsb_embedding");
        assert(findings.at(0).kind == scrub_pt_steganography);
        assert(findings.at(0).confidence > 0.8);
        assert(findings.at(1).og == ScrubObjGen(4));
        assert(findings.at(1).pattern_id == "invisible_text");
        // Only the Info dictionary is checked for entropy, and only
        // long strings.
        assert(findings.at(2).og == ScrubObjGen(5));
        assert(findings.at(2).pattern_id == "high_entropy_metadata");
        assert(findings.at(2).confidence == 1.0);

        assert(doc.getIssues().size() == 1);
        assert(doc.getIssues().at(0).og == ScrubObjGen(7));

        auto const& stats = detector.getStats();
        assert(stats.objects_analyzed == 8);
        assert(stats.images_analyzed == 2);
        assert(stats.images_skipped == 2);
        assert(stats.suspicious_objects == 3);
        assert(stats.patterns_detected == 3);
    }

    // Each analysis can be turned off.
    Stego::DetectionConfig config;
    config.analyze_images = false;
    config.analyze_content = false;
    config.analyze_metadata = false;
    auto doc = make_document();
    Stego quiet(config);
    assert(quiet.analyzeDocument(doc).empty());
    assert(!doc.anyIssues());

    // Statistical confidences never exceed 1.
    config = Stego::DetectionConfig();
    config.statistical_threshold = 1.0;
    doc = make_document();
    Stego lenient(config);
    auto findings = lenient.analyzeDocument(doc);
    assert(findings.size() == 2);
    assert(findings.at(0).pattern_id == "invisible_text");
}

int
main()
{
    test_samples();
    test_components();
    test_decode();
    test_document();
    std::cout << "stego tests passed" << std::endl;
    return 0;
}

#include <pdfscrub/assert_test.h>

// Tests for binary payload and metadata cleaning

#include <pdfscrub/Pl_Flate.hh>
#include <pdfscrub/ScrubBinarySanitizer.hh>
#include <pdfscrub/ScrubDocument.hh>
#include <pdfscrub/ScrubMetadataSanitizer.hh>
#include <pdfscrub/ScrubWorkerPool.hh>

#include <iostream>
#include <stdexcept>

using Binary = ScrubBinarySanitizer;

static ScrubObject
name(std::string const& n)
{
    return ScrubObject::newName(n);
}

static ScrubObject
ref(uint32_t n)
{
    return ScrubObject::newReference(ScrubObjGen(n));
}

static std::string
be(unsigned long value, size_t bytes)
{
    std::string result;
    for (size_t i = bytes; i > 0; --i) {
        result += static_cast<char>((value >> (8 * (i - 1))) & 0xff);
    }
    return result;
}

static std::string
segment(unsigned char marker, std::string const& payload)
{
    return std::string("\xff") + static_cast<char>(marker) + be(payload.size() + 2, 2) + payload;
}

static std::string
chunk(std::string const& type, std::string const& data)
{
    return be(data.size(), 4) + type + data + "CRC!";
}

static std::string const jfif = segment(0xe0, std::string("JFIF\0\1\1\0\0\1\0\1\0\0", 14));
static std::string const sos = segment(0xda, std::string("\1\1\0\0\x3f\0", 6));
static std::string const scan = std::string("\x12\x34\xff\x00\x56\xff\xd0\x78", 8);
static std::string const png_sig = "\x89PNG\r\n\x1a\n";
static std::string const ihdr = chunk("IHDR", std::string(13, '\1'));
static std::string const idat = chunk("IDAT", "xyz");
static std::string const iend = chunk("IEND", "");

static std::string
make_jpeg()
{
    return "\xff\xd8" + jfif + segment(0xfe, "made with potato") + segment(0xe1, "Exif-data") +
        sos + scan + "\xff\xd9" + "junk after EOI";
}

static std::string const clean_jpeg = "\xff\xd8" + jfif + sos + scan + "\xff\xd9";

static std::string
make_png()
{
    return png_sig + ihdr + chunk("tEXt", std::string("Author\0someone", 14)) + idat +
        chunk("tIME", "1234567") + iend + "trailing";
}

static std::string const clean_png = png_sig + ihdr + idat + iend;

static std::string
make_icc()
{
    std::string icc(200, '\0');
    icc.replace(0, 4, be(200, 4));
    icc.replace(24, 12, "202601021530");
    icc.replace(36, 4, "acsp");
    icc.replace(84, 16, "0123456789abcdef");
    icc.replace(128, 4, be(2, 4));
    icc.replace(132, 12, "desc" + be(160, 4) + be(20, 4));
    icc.replace(144, 12, "rXYZ" + be(180, 4) + be(20, 4));
    icc.replace(160, 20, std::string("desc\0\0\0\0", 8) + "Secret Name!");
    icc.replace(180, 20, std::string("XYZ \0\0\0\0", 8) + "twelve bytes");
    return icc;
}

static void
test_jpeg()
{
    auto jpeg = make_jpeg();
    assert(Binary::detectType(jpeg) == Binary::dt_jpeg);
    size_t removed = 0;
    assert(Binary::cleanJPEG(jpeg, removed) == clean_jpeg);
    assert(removed == 2);

    // Already clean data is unchanged.
    removed = 0;
    assert(Binary::clean(clean_jpeg, removed) == clean_jpeg);
    assert(removed == 0);

    bool thrown = false;
    try {
        Binary::cleanJPEG("\xff\xd8\xff\xe0\x00", removed);
    } catch (std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
}

static void
test_png()
{
    auto png = make_png();
    assert(Binary::detectType(png) == Binary::dt_png);
    size_t removed = 0;
    assert(Binary::cleanPNG(png, removed) == clean_png);
    assert(removed == 2);

    bool thrown = false;
    try {
        Binary::cleanPNG(png_sig + ihdr, removed);
    } catch (std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
}

static void
test_icc()
{
    auto icc = make_icc();
    assert(Binary::detectType(icc) == Binary::dt_icc);
    size_t removed = 0;
    auto cleaned = Binary::cleanICC(icc, removed);
    assert(removed == 3);
    assert(cleaned.size() == icc.size());
    assert(cleaned.substr(24, 12) == std::string(12, '\0'));
    assert(cleaned.substr(84, 16) == std::string(16, '\0'));
    assert(cleaned.substr(160, 8) == icc.substr(160, 8));
    assert(cleaned.substr(168, 12) == std::string(12, '\0'));
    // Other tags and the header are untouched.
    assert(cleaned.substr(180) == icc.substr(180));
    assert(cleaned.substr(0, 24) == icc.substr(0, 24));

    // Too short to be a profile
    assert(Binary::detectType(icc.substr(0, 100)) == Binary::dt_generic);
}

static void
test_generic()
{
    assert(Binary::cleanGeneric(std::string("abc\0\0\0", 6)) == "abc");
    assert(Binary::cleanGeneric(std::string("\0\0", 2)).empty());
    assert(Binary::cleanGeneric(std::string("a\0b", 3)) == std::string("a\0b", 3));

    assert(Binary::hasControlCharacters("a\x01z"));
    assert(!Binary::hasControlCharacters("tab\there\r\n\f"));
    assert(!Binary::hasControlCharacters("caf\xc3\xa9"));
    assert(Binary::cleanString("a\x01\x1f b\x7f") == "a b\x7f");
}

static ScrubDocument
make_document()
{
    ScrubDocument doc;
    doc.replaceObject(
        ScrubObjGen(1),
        ScrubObject::newDictionary(
            {{"/Type", name("/Catalog")},
             {"/Note", ScrubObject::newString("hidden\x01mark")},
             {"/Kids", ScrubObject::newArray({ScrubObject::newString("ok\tvalue")})}}));
    doc.replaceObject(
        ScrubObjGen(2),
        ScrubObject::newStream(
            {{"/Subtype", name("/Image")}, {"/Filter", name("/DCTDecode")}}, make_jpeg()));
    doc.replaceObject(
        ScrubObjGen(3),
        ScrubObject::newStream(
            {{"/Subtype", name("/Form")}, {"/Filter", name("/FlateDecode")}},
            Pl_Flate::deflate(make_png())));
    doc.replaceObject(
        ScrubObjGen(4),
        ScrubObject::newStream({{"/Subtype", name("/Image")}}, std::string("\x10\x20\0\0", 4)));
    doc.replaceObject(
        ScrubObjGen(5), ScrubObject::newStream({{"/Subtype", name("/ICCProfile")}}, make_icc()));
    doc.replaceObject(
        ScrubObjGen(6),
        ScrubObject::newStream({{"/Subtype", name("/Form")}}, std::string("q Q\0\0\0", 6)));
    doc.replaceObject(
        ScrubObjGen(7),
        ScrubObject::newStream(
            {{"/Subtype", name("/Image")}, {"/Filter", name("/DCTDecode")}},
            "\xff\xd8\xff\xe0"));
    doc.replaceObject(ScrubObjGen(8), ScrubObject::newStream({}, std::string("abc\0\0", 5)));
    doc.replaceObject(
        ScrubObjGen(9),
        ScrubObject::newStream(
            {{"/Subtype", name("/Image")}, {"/Filter", name("/LZWDecode")}}, make_jpeg()));
    doc.setRoot(ScrubObjGen(1));
    return doc;
}

static void
test_document()
{
    auto doc = make_document();
    ScrubWorkerPool pool(2);
    Binary sanitizer;
    assert(sanitizer.sanitizeDocument(doc, &pool) == 5);

    auto const& catalog = doc.getObject(ScrubObjGen(1));
    assert(catalog.getKey("/Note").getStringValue() == "hiddenmark");
    assert(catalog.getKey("/Kids").getArrayItem(0).getStringValue() == "ok\tvalue");
    assert(doc.getObject(ScrubObjGen(2)).getStreamData() == clean_jpeg);
    assert(Pl_Flate::inflate(doc.getObject(ScrubObjGen(3)).getStreamData()) == clean_png);
    // Raw samples keep their length.
    assert(doc.getObject(ScrubObjGen(4)).getStreamData().size() == 4);
    assert(doc.getObject(ScrubObjGen(5)).getStreamData().substr(84, 16) == std::string(16, '\0'));
    assert(doc.getObject(ScrubObjGen(6)).getStreamData() == "q Q");
    assert(doc.getObject(ScrubObjGen(6)).getKey("/Length").getIntValue() == 3);
    assert(doc.getObject(ScrubObjGen(8)).getStreamData().size() == 5);
    assert(doc.getObject(ScrubObjGen(9)).getStreamData() == make_jpeg());

    assert(doc.getIssues().size() == 1);
    assert(doc.getIssues().at(0).og == ScrubObjGen(7));
    assert(doc.getObject(ScrubObjGen(7)).getStreamData() == "\xff\xd8\xff\xe0");

    auto const& stats = sanitizer.getStats();
    assert(stats.objects_sanitized == 5);
    assert(stats.metadata_removed == 7);
    assert(stats.bytes_removed > 0);

    // A second pass finds nothing to do.
    doc.clearIssues();
    sanitizer.reset();
    assert(sanitizer.sanitizeDocument(doc) == 0);
    assert(sanitizer.getStats().bytes_removed == 0);
}

static void
test_encrypted_strings()
{
    ScrubDocument doc;
    doc.replaceObject(
        ScrubObjGen(1),
        ScrubObject::newDictionary({{"/Note", ScrubObject::newString("\x02\x03\x04")}}));
    doc.setRoot(ScrubObjGen(1));
    doc.getTrailer().encrypt = ScrubObject::newDictionary({{"/Filter", name("/Standard")}});

    Binary sanitizer;
    assert(sanitizer.sanitizeDocument(doc) == 0);
    assert(doc.getObject(ScrubObjGen(1)).getKey("/Note").getStringValue() == "\x02\x03\x04");
    assert(doc.getIssues().size() == 1);
    assert(!doc.getIssues().at(0).og.has_value());
}

static void
test_text_strings()
{
    std::string utf16("\xfe\xff\x00H\x00i", 6);
    std::string utf16le("\xff\xfeH\x00i\x00", 6);
    std::string id("\x8a\x01\x00\x17", 4);
    std::string hash("\x00\x02\x1f" "abc", 6);
    assert(Binary::isUnicodeString(utf16));
    assert(Binary::isUnicodeString(utf16le));
    assert(!Binary::isUnicodeString(id));

    ScrubDocument doc;
    doc.replaceObject(
        ScrubObjGen(1),
        ScrubObject::newDictionary(
            {{"/Title", ScrubObject::newString(utf16)},
             {"/Subject", ScrubObject::newString(utf16le)},
             {"/Note", ScrubObject::newString("a\x02" "b")},
             {"/ID",
              ScrubObject::newArray({ScrubObject::newString(id), ScrubObject::newString(id)})}}));
    doc.replaceObject(
        ScrubObjGen(2),
        ScrubObject::newDictionary(
            {{"/Filter", name("/Standard")},
             {"/O", ScrubObject::newString(hash)},
             {"/U", ScrubObject::newString(hash)}}));
    doc.replaceObject(
        ScrubObjGen(3),
        ScrubObject::newDictionary(
            {{"/Type", name("/Sig")},
             {"/ByteRange",
              ScrubObject::newArray(
                  {ScrubObject::newInteger(0), ScrubObject::newInteger(10)})},
             {"/Contents", ScrubObject::newString(hash)},
             {"/Name", ScrubObject::newString("x\x01y")}}));
    // Without /ByteRange, /Contents is ordinary text.
    doc.replaceObject(
        ScrubObjGen(4),
        ScrubObject::newDictionary({{"/Contents", ScrubObject::newString("note\x07")}}));
    doc.setRoot(ScrubObjGen(1));

    Binary sanitizer;
    assert(sanitizer.sanitizeDocument(doc) == 3);
    auto const& info = doc.getObject(ScrubObjGen(1));
    assert(info.getKey("/Title").getStringValue() == utf16);
    assert(info.getKey("/Subject").getStringValue() == utf16le);
    assert(info.getKey("/Note").getStringValue() == "ab");
    assert(info.getKey("/ID").getArrayItem(0).getStringValue() == id);
    assert(info.getKey("/ID").getArrayItem(1).getStringValue() == id);
    assert(doc.getObject(ScrubObjGen(2)).getKey("/O").getStringValue() == hash);
    assert(doc.getObject(ScrubObjGen(2)).getKey("/U").getStringValue() == hash);
    auto const& sig = doc.getObject(ScrubObjGen(3));
    assert(sig.getKey("/Contents").getStringValue() == hash);
    assert(sig.getKey("/Name").getStringValue() == "xy");
    assert(doc.getObject(ScrubObjGen(4)).getKey("/Contents").getStringValue() == "note");
    assert(sanitizer.getStats().bytes_removed == 3);
}

static void
test_metadata()
{
    auto obj = ScrubObject::newDictionary(
        {{"/Metadata", ref(5)}, {"/Info", ref(6)}, {"/Unrelated", ScrubObject::newInteger(1)}});
    assert(ScrubMetadataSanitizer::removeMetadataKeys(obj) == 2);
    assert(obj.getKeys() == std::set<std::string>({"/Unrelated"}));

    ScrubDocument doc;
    doc.replaceObject(
        ScrubObjGen(1),
        ScrubObject::newDictionary(
            {{"/Type", name("/Catalog")},
             {"/Metadata", ref(3)},
             {"/Pages",
              ScrubObject::newArray({ScrubObject::newDictionary(
                  {{"/PieceInfo", ScrubObject::newDictionary()},
                   {"/Type", name("/Page")}})})}}));
    doc.replaceObject(
        ScrubObjGen(2), ScrubObject::newDictionary({{"/Producer", ScrubObject::newString("x")}}));
    doc.replaceObject(
        ScrubObjGen(3),
        ScrubObject::newStream(
            {{"/Type", name("/Metadata")}, {"/Metadata", ref(4)}}, "<x:xmpmeta/>"));
    doc.replaceObject(ScrubObjGen(4), ScrubObject::newDictionary());
    doc.setRoot(ScrubObjGen(1));
    doc.setInfo(ScrubObjGen(2));
    doc.setMetadata("<x:xmpmeta/>");

    ScrubMetadataSanitizer sanitizer;
    assert(sanitizer.sanitizeDocument(doc) == 3);
    assert(!doc.getMetadata().has_value());
    assert(!doc.getTrailer().info.has_value());
    auto const& catalog = doc.getObject(ScrubObjGen(1));
    assert(!catalog.hasKey("/Metadata"));
    assert(catalog.getKey("/Pages").getArrayItem(0).getKeys() == std::set<std::string>({"/Type"}));
    // /Type /Metadata is a value, not a key.
    assert(doc.getObject(ScrubObjGen(3)).getKeys() == std::set<std::string>({"/Length", "/Type"}));
    // The objects themselves remain until unreachable objects are removed.
    assert(doc.hasObject(ScrubObjGen(2)));

    auto const& stats = sanitizer.getStats();
    assert(stats.keys_removed == 3);
    assert(stats.objects_modified == 2);
    assert(stats.document_metadata_removed);
    assert(stats.trailer_info_removed);
    assert(doc.removeUnreachable() == 3);

    // Nothing left to do
    sanitizer.reset();
    assert(sanitizer.sanitizeDocument(doc) == 0);
    assert(!sanitizer.getStats().trailer_info_removed);
}

int
main()
{
    test_jpeg();
    test_png();
    test_icc();
    test_generic();
    test_document();
    test_encrypted_strings();
    test_text_strings();
    test_metadata();
    std::cout << "binary tests passed" << std::endl;
    return 0;
}

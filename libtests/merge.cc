#include <pdfscrub/assert_test.h>

// Tests for merging small adjacent streams

#include <pdfscrub/ScrubDocument.hh>

#include <iostream>

static ScrubObject
ref(uint32_t n)
{
    return ScrubObject::newReference(ScrubObjGen(n));
}

static ScrubObject
flate_stream(std::string const& data)
{
    return ScrubObject::newStream({{"/Filter", ScrubObject::newName("/FlateDecode")}}, data);
}

static void
test_flate_opt_in()
{
    auto make = []() {
        ScrubDocument doc;
        doc.replaceObject(
            ScrubObjGen(1),
            ScrubObject::newDictionary({{"/Contents", ScrubObject::newArray({ref(2), ref(3)})}}));
        doc.replaceObject(ScrubObjGen(2), flate_stream("abc"));
        doc.replaceObject(ScrubObjGen(3), flate_stream("def"));
        doc.setRoot(ScrubObjGen(1));
        return doc;
    };

    // Flate is not merged unless it is allowed.
    auto doc = make();
    assert(doc.mergeSmallStreams() == 0);
    assert(doc.getObjectCount() == 3);

    ScrubDocument::StreamMergeConfig config;
    config.allowed_filters = {"/FlateDecode"};
    doc = make();
    assert(doc.mergeSmallStreams(config) == 1);
    assert(doc.getObjectCount() == 2);
    auto const& merged = doc.getObject(ScrubObjGen(2));
    assert(merged.getKey("/Length").getIntValue() == 6);
    assert(merged.getStreamData() == "abcdef");
    assert(!doc.hasObject(ScrubObjGen(3)));
    // [2 0 R 3 0 R] collapses to [2 0 R].
    auto contents = doc.getObject(ScrubObjGen(1)).getKey("/Contents");
    assert(contents.getArrayNItems() == 1);
    assert(contents.getArrayItem(0).getRef() == ScrubObjGen(2));
    assert(doc.getStructureStats().streams_merged == 1);
}

static void
test_threshold()
{
    ScrubDocument doc;
    doc.replaceObject(
        ScrubObjGen(1),
        ScrubObject::newArray({ref(2), ref(3), ref(4), ref(5)}));
    doc.replaceObject(ScrubObjGen(2), ScrubObject::newStream({}, "11111"));
    doc.replaceObject(ScrubObjGen(3), ScrubObject::newStream({}, "22222"));
    doc.replaceObject(ScrubObjGen(4), ScrubObject::newStream({}, "33333"));
    // At the threshold, so not a candidate
    doc.replaceObject(ScrubObjGen(5), ScrubObject::newStream({}, "44444444"));
    doc.setRoot(ScrubObjGen(1));

    ScrubDocument::StreamMergeConfig config;
    config.threshold = 8;
    // 2 absorbs 3 and reaches the threshold, so 4 stands alone.
    assert(doc.mergeSmallStreams(config) == 1);
    assert(doc.getObject(ScrubObjGen(2)).getStreamData() == "1111122222");
    assert(doc.getObject(ScrubObjGen(4)).getStreamData() == "33333");
    assert(doc.getObject(ScrubObjGen(5)).getStreamData() == "44444444");
    auto const& root = doc.getObject(ScrubObjGen(1));
    assert(root.getArrayNItems() == 3);
    assert(root.getArrayItem(1).getRef() == ScrubObjGen(4));
}

static void
test_incompatible()
{
    ScrubDocument doc;
    doc.replaceObject(ScrubObjGen(1), ScrubObject::newArray({ref(2), ref(3), ref(4), ref(5)}));
    // Different filters
    doc.replaceObject(ScrubObjGen(2), ScrubObject::newStream({}, "a"));
    doc.replaceObject(ScrubObjGen(3), flate_stream("b"));
    // Images are never merged.
    auto image = [](std::string const& data) {
        return ScrubObject::newStream(
            {{"/Type", ScrubObject::newName("/XObject")},
             {"/Subtype", ScrubObject::newName("/Image")}},
            data);
    };
    doc.replaceObject(ScrubObjGen(4), image("c"));
    doc.replaceObject(ScrubObjGen(5), image("d"));
    doc.setRoot(ScrubObjGen(1));

    ScrubDocument::StreamMergeConfig config;
    config.allowed_filters = {"", "/FlateDecode"};
    assert(doc.mergeSmallStreams(config) == 0);
    assert(doc.getObjectCount() == 5);
}

static void
test_trailer_redirect()
{
    ScrubDocument doc;
    doc.replaceObject(ScrubObjGen(1), ScrubObject::newStream({}, "x"));
    doc.replaceObject(ScrubObjGen(2), ScrubObject::newStream({}, "y"));
    doc.replaceObject(ScrubObjGen(3), ScrubObject::newDictionary({{"/S", ref(2)}}));
    doc.setRoot(ScrubObjGen(3));
    doc.setInfo(ScrubObjGen(2));
    assert(doc.mergeSmallStreams() == 1);
    assert(*doc.getTrailer().info == ScrubObjGen(1));
    assert(doc.getObject(ScrubObjGen(3)).getKey("/S").getRef() == ScrubObjGen(1));
    assert(doc.getObject(ScrubObjGen(1)).getStreamData() == "xy");
}

int
main()
{
    test_flate_opt_in();
    test_threshold();
    test_incompatible();
    test_trailer_redirect();
    std::cout << "merge tests passed" << std::endl;
    return 0;
}

#include <pdfscrub/assert_test.h>

// Tests for collapsing structurally identical objects

#include <pdfscrub/ScrubDocument.hh>

#include <iostream>

static ScrubObject
ref(uint32_t n)
{
    return ScrubObject::newReference(ScrubObjGen(n));
}

static ScrubObject
font()
{
    return ScrubObject::newDictionary(
        {{"/Type", ScrubObject::newName("/Font")},
         {"/BaseFont", ScrubObject::newName("/Helvetica")}});
}

static ScrubObject
page(uint32_t font_ref)
{
    return ScrubObject::newDictionary(
        {{"/Type", ScrubObject::newName("/Page")}, {"/Font", ref(font_ref)}});
}

static void
test_cascade()
{
    ScrubDocument doc;
    doc.replaceObject(
        ScrubObjGen(1),
        ScrubObject::newDictionary(
            {{"/Pages", ScrubObject::newArray({ref(5), ref(6)})},
             {"/S", ScrubObject::newArray({ref(7), ref(8), ref(9)})}}));
    doc.replaceObject(ScrubObjGen(2), font());
    doc.replaceObject(ScrubObjGen(3), font());
    doc.replaceObject(ScrubObjGen(4), font());
    doc.replaceObject(ScrubObjGen(5), page(2));
    doc.replaceObject(ScrubObjGen(6), page(4));
    doc.replaceObject(ScrubObjGen(7), ScrubObject::newStream({}, "data"));
    doc.replaceObject(ScrubObjGen(8), ScrubObject::newStream({}, "data"));
    // Same data, different dictionary
    doc.replaceObject(
        ScrubObjGen(9),
        ScrubObject::newStream({{"/Filter", ScrubObject::newName("/FlateDecode")}}, "data"));
    doc.replaceObject(
        ScrubObjGen(10), ScrubObject::newDictionary({{"/Title", ScrubObject::newString("x")}}));
    doc.replaceObject(
        ScrubObjGen(11), ScrubObject::newDictionary({{"/Title", ScrubObject::newString("x")}}));
    doc.setRoot(ScrubObjGen(1));
    doc.setInfo(ScrubObjGen(11));

    // The first pass merges the fonts, the streams, and the info
    // dictionaries, which makes the two pages identical for the second.
    assert(doc.deduplicateObjects() == 5);
    assert(doc.getStructureStats().duplicates_removed == 5);
    assert(doc.getObjectCount() == 6);
    for (uint32_t n: {1, 2, 5, 7, 9, 10}) {
        assert(doc.hasObject(ScrubObjGen(n)));
    }

    auto const& root = doc.getObject(ScrubObjGen(1));
    assert(root.getKey("/Pages").getArrayItem(0).getRef() == ScrubObjGen(5));
    assert(root.getKey("/Pages").getArrayItem(1).getRef() == ScrubObjGen(5));
    assert(root.getKey("/S").getArrayItem(1).getRef() == ScrubObjGen(7));
    assert(root.getKey("/S").getArrayItem(2).getRef() == ScrubObjGen(9));
    assert(doc.getObject(ScrubObjGen(5)).getKey("/Font").getRef() == ScrubObjGen(2));
    assert(doc.getTrailer().info && *doc.getTrailer().info == ScrubObjGen(10));

    // Idempotent
    assert(doc.deduplicateObjects() == 0);
}

static void
test_no_duplicates()
{
    ScrubDocument doc;
    auto root = doc.addObject(ScrubObject::newArray({ref(2), ref(3)}));
    doc.addObject(ScrubObject::newInteger(1));
    doc.addObject(ScrubObject::newReal(1.0));
    doc.setRoot(root);
    assert(doc.deduplicateObjects() == 0);
    assert(doc.getObjectCount() == 3);
}

static void
test_root_redirect()
{
    // A duplicate of the root with a lower number becomes the root.
    ScrubDocument doc;
    doc.replaceObject(ScrubObjGen(1), ScrubObject::newDictionary({{"/A", ref(3)}}));
    doc.replaceObject(ScrubObjGen(2), ScrubObject::newDictionary({{"/A", ref(3)}}));
    doc.replaceObject(ScrubObjGen(3), ScrubObject::newNull());
    doc.setRoot(ScrubObjGen(2));
    assert(doc.deduplicateObjects() == 1);
    assert(doc.getTrailer().root == ScrubObjGen(1));
    assert(doc.hasValidRoot());
}

int
main()
{
    test_cascade();
    test_no_duplicates();
    test_root_redirect();
    std::cout << "dedupe tests passed" << std::endl;
    return 0;
}

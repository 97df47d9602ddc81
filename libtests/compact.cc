#include <pdfscrub/assert_test.h>

// Tests for object renumbering

#include <pdfscrub/ScrubDocument.hh>
#include <pdfscrub/ScrubExc.hh>

#include <iostream>

static void
test_renumber()
{
    ScrubDocument doc;
    doc.replaceObject(ScrubObjGen(3), ScrubObject::newString("three"));
    doc.replaceObject(
        ScrubObjGen(7),
        ScrubObject::newDictionary(
            {{"/A", ScrubObject::newReference(ScrubObjGen(3))},
             {"/B", ScrubObject::newReference(ScrubObjGen(12, 2))},
             {"/C", ScrubObject::newReference(ScrubObjGen(40))}}));
    doc.replaceObject(ScrubObjGen(12, 2), ScrubObject::newInteger(12));
    doc.setRoot(ScrubObjGen(7));

    auto mapping = doc.compactObjectNumbers();
    assert(mapping.size() == 3);
    assert(mapping.at(ScrubObjGen(3)) == ScrubObjGen(1));
    assert(mapping.at(ScrubObjGen(7)) == ScrubObjGen(2));
    assert(mapping.at(ScrubObjGen(12, 2)) == ScrubObjGen(3, 0));

    assert(doc.getTrailer().root == ScrubObjGen(2));
    auto const& root = doc.getObject(ScrubObjGen(2));
    assert(root.getKey("/A").getRef() == ScrubObjGen(1));
    assert(root.getKey("/B").getRef() == ScrubObjGen(3));
    // The dangling reference is replaced and reported.
    assert(root.getKey("/C").isNull());
    assert(doc.getIssues().size() == 1);
    assert(doc.getIssues().at(0).error_code == scrub_e_structure);
    assert(doc.getIssues().at(0).og == ScrubObjGen(7));
    assert(doc.getStructureStats().dangling_references == 1);
    assert(doc.getStructureStats().objects_renumbered == 3);
    assert(doc.getObject(ScrubObjGen(1)).getStringValue() == "three");

    // Already compact
    mapping = doc.compactObjectNumbers();
    for (auto const& [from, to]: mapping) {
        assert(from == to);
    }
    assert(doc.getStructureStats().objects_renumbered == 3);
}

static void
test_trailer()
{
    ScrubDocument doc;
    doc.replaceObject(ScrubObjGen(5), ScrubObject::newDictionary());
    doc.replaceObject(ScrubObjGen(9), ScrubObject::newNull());
    doc.setRoot(ScrubObjGen(5));
    doc.setInfo(ScrubObjGen(20));
    doc.getTrailer().encrypt = ScrubObject::newDictionary(
        {{"/K", ScrubObject::newReference(ScrubObjGen(9))},
         {"/L", ScrubObject::newReference(ScrubObjGen(30))}});

    doc.compactObjectNumbers();
    auto const& trailer = doc.getTrailer();
    assert(trailer.root == ScrubObjGen(1));
    assert(!trailer.info);
    assert(trailer.encrypt->getKey("/K").getRef() == ScrubObjGen(2));
    assert(trailer.encrypt->getKey("/L").isNull());
    assert(doc.getIssues().size() == 2);
}

static void
test_missing_root()
{
    ScrubDocument doc;
    doc.replaceObject(ScrubObjGen(4), ScrubObject::newInteger(4));
    doc.setRoot(ScrubObjGen(2));
    bool thrown = false;
    try {
        doc.compactObjectNumbers();
    } catch (ScrubExc& e) {
        thrown = true;
        assert(e.getErrorCode() == scrub_e_structure);
    }
    assert(thrown);
    // Nothing changed
    assert(doc.hasObject(ScrubObjGen(4)));
    assert(doc.getTrailer().root == ScrubObjGen(2));
    assert(!doc.anyIssues());
}

int
main()
{
    test_renumber();
    test_trailer();
    test_missing_root();
    std::cout << "compact tests passed" << std::endl;
    return 0;
}

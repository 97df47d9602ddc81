#include <pdfscrub/assert_test.h>

// Tests for reference maps and unreachable object removal

#include <pdfscrub/ScrubDocument.hh>

#include <iostream>

static ScrubObject
ref(uint32_t n)
{
    return ScrubObject::newReference(ScrubObjGen(n));
}

static void
test_sweep()
{
    // root -> A -> B, and C is not referenced by anything.
    ScrubDocument doc;
    auto root = doc.addObject(ScrubObject::newDictionary({{"/A", ref(2)}}));
    auto a = doc.addObject(ScrubObject::newDictionary({{"/B", ref(3)}}));
    auto b = doc.addObject(ScrubObject::newInteger(1));
    auto c = doc.addObject(ScrubObject::newInteger(2));
    doc.setRoot(root);

    assert(doc.removeUnreachable() == 1);
    assert(doc.hasObject(root) && doc.hasObject(a) && doc.hasObject(b));
    assert(!doc.hasObject(c));
    assert(doc.getStructureStats().objects_removed == 1);

    // Nothing further to remove
    assert(doc.removeUnreachable() == 0);
}

static void
test_reference_map()
{
    ScrubDocument doc;
    doc.addObject(ScrubObject::newDictionary({{"/Pages", ref(2)}}));
    doc.addObject(ScrubObject::newDictionary({{"/Kids", ScrubObject::newArray({ref(3)})}}));
    // Cycle back to the parent and a reference to a missing object
    doc.addObject(ScrubObject::newDictionary({{"/Parent", ref(2)}, {"/Extra", ref(99)}}));
    doc.addObject(ScrubObject::newString("orphan"));
    doc.addObject(ScrubObject::newArray({ref(4)}));
    doc.setRoot(ScrubObjGen(1));

    auto refs = doc.getReferenceMap();
    assert(refs.size() == 4);
    assert(refs.at(ScrubObjGen(1)) == std::set<ScrubObjGen>{ScrubObjGen(2)});
    assert(refs.at(ScrubObjGen(3)) == (std::set<ScrubObjGen>{ScrubObjGen(2), ScrubObjGen(99)}));
    assert(refs.at(ScrubObjGen(5)) == std::set<ScrubObjGen>{ScrubObjGen(4)});
    assert(refs.count(ScrubObjGen(4)) == 0);

    auto reachable = doc.findReachable(refs);
    assert(
        reachable ==
        (std::set<ScrubObjGen>{ScrubObjGen(1), ScrubObjGen(2), ScrubObjGen(3), ScrubObjGen(99)}));

    assert(doc.removeUnreachable(refs) == 2);
    assert(doc.getObjectCount() == 3);
    assert(doc.findReachable() == reachable);
}

static void
test_trailer_roots()
{
    // The info dictionary and anything the Encrypt dictionary refers to
    // are kept.
    ScrubDocument doc;
    auto root = doc.addObject(ScrubObject::newDictionary());
    auto info = doc.addObject(
        ScrubObject::newDictionary({{"/Producer", ScrubObject::newString("x")}}));
    auto key = doc.addObject(ScrubObject::newString("key"));
    auto junk = doc.addObject(ScrubObject::newNull());
    doc.setRoot(root);
    doc.setInfo(info);
    doc.getTrailer().encrypt = ScrubObject::newDictionary({{"/K", ref(key.getObj())}});

    assert(doc.removeUnreachable() == 1);
    assert(doc.hasObject(info) && doc.hasObject(key));
    assert(!doc.hasObject(junk));
}

static void
test_missing_root()
{
    ScrubDocument doc;
    doc.addObject(ScrubObject::newNull());
    doc.setRoot(ScrubObjGen(7));
    assert(!doc.hasValidRoot());
    // Nothing is reachable except the dangling root itself.
    assert(doc.findReachable() == std::set<ScrubObjGen>{ScrubObjGen(7)});
    assert(doc.removeUnreachable() == 1);
    assert(doc.getObjectCount() == 0);
}

int
main()
{
    test_sweep();
    test_reference_map();
    test_trailer_roots();
    test_missing_root();
    std::cout << "reachability tests passed" << std::endl;
    return 0;
}

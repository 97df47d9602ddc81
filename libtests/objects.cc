#include <pdfscrub/assert_test.h>

// This program tests ScrubObject and ScrubObjGen

#include <pdfscrub/ScrubObjGen.hh>
#include <pdfscrub/ScrubObject.hh>

#include <iostream>
#include <stdexcept>
#include <utility>

static void
test_scalars()
{
    auto n = ScrubObject::newNull();
    assert(n.isNull() && n.isScalar());
    assert(n.getTypeCode() == scrub_ot_null);
    assert(ScrubObject().isNull());

    auto b = ScrubObject::newBool(true);
    assert(b.isBool() && b.getBoolValue());
    assert(b.unparse() == "true");

    auto i = ScrubObject::newInteger(-42);
    assert(i.isInteger() && i.isNumber() && !i.isReal());
    assert(i.getIntValue() == -42);
    assert(i.getNumericValue() == -42.0);
    assert(i.unparse() == "-42");

    auto r = ScrubObject::newReal(2.5);
    assert(r.isReal() && r.isNumber());
    assert(r.getNumericValue() == 2.5);

    auto name = ScrubObject::newName("/Type");
    assert(name.isName() && name.getName() == "/Type");
    assert(name.isNameAndEquals("/Type"));
    assert(!name.isNameAndEquals("/Subtype"));
    assert(ScrubObject::newName("/A B").unparse() == "/A#20B");

    auto s = ScrubObject::newString("potato");
    assert(s.isString() && s.getStringValue() == "potato");
    assert(s.unparse() == "(potato)");
    s.setStringValue("salad");
    assert(s.getStringValue() == "salad");

    auto ref = ScrubObject::newReference(ScrubObjGen(3, 0));
    assert(ref.isReference() && ref.isScalar());
    assert(ref.getRef() == ScrubObjGen(3));
    assert(ref.unparse() == "3 0 R");
    ref.setRef(ScrubObjGen(4, 1));
    assert(ref.unparse() == "4 1 R");

    // Accessors check their type.
    bool thrown = false;
    try {
        name.getIntValue();
    } catch (std::logic_error&) {
        thrown = true;
    }
    assert(thrown);
    thrown = false;
    try {
        i.getStreamData();
    } catch (std::logic_error&) {
        thrown = true;
    }
    assert(thrown);
}

static void
test_containers()
{
    auto a = ScrubObject::newArray({ScrubObject::newInteger(1), ScrubObject::newInteger(2)});
    assert(a.isArray() && !a.isScalar());
    assert(a.getArrayNItems() == 2);
    assert(a.getArrayItem(1).getIntValue() == 2);
    assert(a.getArrayItem(7).isNull());
    a.appendItem(ScrubObject::newName("/N"));
    assert(a.unparse() == "[ 1 2 /N ]");

    auto d = ScrubObject::newDictionary(
        {{"/Type", ScrubObject::newName("/Page")}, {"/Subtype", ScrubObject::newName("/X")}});
    assert(d.isDictionary());
    assert(d.isDictionaryOfType("/Page"));
    assert(d.isDictionaryOfType("/Page", "/X"));
    assert(d.isDictionaryOfType("", "/X"));
    assert(!d.isDictionaryOfType("/Pages"));
    assert(!a.isDictionaryOfType(""));
    assert(d.hasKey("/Type"));
    assert(d.getKey("/Missing").isNull());
    assert(a.getKey("/Type").isNull());
    d.replaceKey("/Count", ScrubObject::newInteger(0));
    assert(d.getKeys().size() == 3);
    d.removeKey("/Subtype");
    assert(!d.hasKey("/Subtype"));
    assert(d.unparse() == "<< /Count 0 /Type /Page >>");

    auto st = ScrubObject::newStream({{"/Filter", ScrubObject::newName("/FlateDecode")}}, "abc");
    assert(st.isStream() && !st.isDictionary());
    assert(st.isDictionaryOfType(""));
    assert(st.getKey("/Length").getIntValue() == 3);
    assert(st.getFilterKey() == "/FlateDecode");
    st.replaceStreamData("abcdef");
    assert(st.getKey("/Length").getIntValue() == 6);
    assert(st.getStreamData() == "abcdef");

    auto plain = ScrubObject::newStream({}, "xyz");
    assert(plain.getFilterKey().empty());
    assert(plain.unparse() == "<< /Length 3 >>\nstream\nxyz\nendstream");
    plain.replaceKey(
        "/Filter", ScrubObject::newArray({ScrubObject::newName("/FlateDecode")}));
    assert(plain.getFilterKey() == "/FlateDecode");
    plain.replaceKey(
        "/Filter",
        ScrubObject::newArray(
            {ScrubObject::newName("/ASCIIHexDecode"), ScrubObject::newName("/FlateDecode")}));
    assert(plain.getFilterKey() == "[ /ASCIIHexDecode /FlateDecode ]");
}

static void
test_equality()
{
    auto make = [](long long v) {
        return ScrubObject::newDictionary(
            {{"/A", ScrubObject::newArray({ScrubObject::newInteger(v)})},
             {"/R", ScrubObject::newReference(ScrubObjGen(2))}});
    };
    assert(make(1) == make(1));
    assert(make(1) != make(2));
    assert(ScrubObject::newInteger(1) != ScrubObject::newReal(1.0));
    assert(ScrubObject::newStream({}, "a") == ScrubObject::newStream({}, "a"));
    assert(ScrubObject::newStream({}, "a") != ScrubObject::newStream({}, "b"));
    assert(ScrubObject::newReference(ScrubObjGen(2, 0)) != ScrubObject::newReference(ScrubObjGen(2, 1)));
}

static void
test_traversal()
{
    auto obj = ScrubObject::newDictionary(
        {{"/Kids",
          ScrubObject::newArray(
              {ScrubObject::newReference(ScrubObjGen(4)),
               ScrubObject::newReference(ScrubObjGen(5))})},
         {"/Parent", ScrubObject::newReference(ScrubObjGen(2))},
         {"/Inner",
          ScrubObject::newDictionary({{"/R", ScrubObject::newReference(ScrubObjGen(4))}})}});

    std::set<ScrubObjGen> refs;
    obj.collectReferences(refs);
    assert(refs == (std::set<ScrubObjGen>{ScrubObjGen(2), ScrubObjGen(4), ScrubObjGen(5)}));

    size_t visited = obj.rewriteReferences([](ScrubObjGen og) {
        if (og == ScrubObjGen(4)) {
            return ScrubObject::newNull();
        }
        return ScrubObject::newReference(ScrubObjGen(og.getObj() + 10));
    });
    assert(visited == 4);
    assert(obj.getKey("/Parent").getRef() == ScrubObjGen(12));
    assert(obj.getKey("/Kids").getArrayItem(0).isNull());
    assert(obj.getKey("/Kids").getArrayItem(1).getRef() == ScrubObjGen(15));
    assert(obj.getKey("/Inner").getKey("/R").isNull());

    // Callbacks may modify what they are given.
    obj.forEach([](ScrubObject& o) {
        if (o.isNull()) {
            o = ScrubObject::newInteger(0);
        }
    });
    assert(obj.getKey("/Kids").getArrayItem(0).isInteger());

    // Deep nesting does not recurse.
    ScrubObject deep = ScrubObject::newInteger(7);
    for (int i = 0; i < 1000; ++i) {
        deep = ScrubObject::newArray({deep});
    }
    ScrubObject const& cdeep = deep;
    size_t count = 0;
    cdeep.forEach([&count](ScrubObject const&) { ++count; });
    assert(count == 1001);

    auto text = deep.unparse();
    assert(text.size() == 4 * 1000 + 1);
    assert(text.substr(0, 4) == "[ [ ");
    assert(text.substr(1998, 5) == "[ 7 ]");
    ScrubObject other = ScrubObject::newInteger(8);
    for (int i = 0; i < 1000; ++i) {
        other = ScrubObject::newArray({other});
    }
    assert(deep == ScrubObject(deep));
    assert(deep != other);
    assert(deep != ScrubObject::newArray({deep}));
}

static void
test_objgen()
{
    ScrubObjGen a(3, 1);
    assert(a.getObj() == 3 && a.getGen() == 1);
    assert(a.isIndirect());
    assert(!ScrubObjGen().isIndirect());
    assert(a.unparse() == "3,1");
    assert(a.unparse(' ') == "3 1");
    assert(a.toRef() == "3 1 R");
    assert(ScrubObjGen(3, 0) < a);
    assert(a < ScrubObjGen(4, 0));

    ScrubObjGen::set seen;
    assert(seen.add(a));
    assert(!seen.add(a));
    assert(seen.add(ScrubObjGen()));
    assert(seen.size() == 1);
    seen.erase(a);
    assert(seen.empty());
    assert(ScrubObjGen::hash()(a) != ScrubObjGen::hash()(ScrubObjGen(1, 3)));
}

int
main()
{
    test_scalars();
    test_containers();
    test_equality();
    test_traversal();
    test_objgen();
    std::cout << "object tests passed" << std::endl;
    return 0;
}

#include <pdfscrub/assert_test.h>

// Tests for cross-reference rebuilding and the writer

#include <pdfscrub/Pl_Buffer.hh>
#include <pdfscrub/ScrubDocument.hh>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubUtil.hh>
#include <pdfscrub/ScrubWriter.hh>

#include <iostream>
#include <stdexcept>

static ScrubDocument
make_doc()
{
    ScrubDocument doc;
    doc.replaceObject(
        ScrubObjGen(1),
        ScrubObject::newDictionary(
            {{"/Type", ScrubObject::newName("/Catalog")},
             {"/Pages", ScrubObject::newReference(ScrubObjGen(2))}}));
    doc.replaceObject(
        ScrubObjGen(2),
        ScrubObject::newDictionary(
            {{"/Type", ScrubObject::newName("/Pages")},
             {"/Kids", ScrubObject::newArray()},
             {"/Count", ScrubObject::newInteger(0)}}));
    // Object 3 is unused.
    doc.replaceObject(
        ScrubObjGen(4), ScrubObject::newStream({}, std::string("binary\0data\n", 12)));
    doc.setRoot(ScrubObjGen(1));
    return doc;
}

static void
test_offsets()
{
    auto doc = make_doc();
    auto const& table = doc.rebuildXRef();
    assert(table.size() == 3);
    assert(doc.getXRefTables().size() == 1);
    assert(doc.getStructureStats().xref_entries == 3);

    auto out = ScrubWriter::writeToString(doc);
    assert(out.substr(0, 9) == "%PDF-1.7\n");
    for (auto const& [og, entry]: doc.getXRefTables().at(0)) {
        assert(entry.getType() == 1);
        auto header = std::to_string(og.getObj()) + " " + std::to_string(og.getGen()) + " obj\n";
        assert(out.compare(static_cast<size_t>(entry.getOffset()), header.size(), header) == 0);
        // The table in the file carries the same offset.
        auto line = ScrubUtil::int_to_string(entry.getOffset(), 10) + " 00000 n \n";
        assert(out.find(line) != std::string::npos);
    }
    assert(out.find("0 5\n0000000000 65535 f \n") != std::string::npos);
    assert(out.find("trailer << /Root 1 0 R /Size 5 >>\n") != std::string::npos);
    assert(out.substr(out.size() - 6) == "%%EOF\n");

    // startxref points at the table.
    ScrubWriter w(doc);
    w.write();
    auto data = w.getString();
    assert(data == out);
    auto startxref = static_cast<size_t>(w.getStartXRef());
    assert(data.compare(startxref, 5, "xref\n") == 0);
    assert(data.find("startxref\n" + std::to_string(startxref) + "\n") != std::string::npos);
    assert(w.getXRefTable() == doc.getXRefTables().at(0));
}

static void
test_changes()
{
    // Offsets follow changes to the document once rebuilt.
    auto doc = make_doc();
    auto before = doc.rebuildXRef();
    doc.getObject(ScrubObjGen(1)).replaceKey("/Lang", ScrubObject::newString("en-US"));
    auto const& after = doc.rebuildXRef();
    assert(after.at(ScrubObjGen(1)).getOffset() == before.at(ScrubObjGen(1)).getOffset());
    assert(after.at(ScrubObjGen(2)).getOffset() > before.at(ScrubObjGen(2)).getOffset());
    assert(doc.getXRefTables().size() == 1);
}

static void
test_output_pipeline()
{
    auto doc = make_doc();
    Pl_Buffer buf("xref test");
    ScrubWriter w(doc);
    w.setOutputPipeline(&buf);
    w.write();
    assert(buf.getString() == ScrubWriter::writeToString(doc));
    bool thrown = false;
    try {
        w.getString();
    } catch (std::logic_error&) {
        thrown = true;
    }
    assert(thrown);
}

static void
test_duplicate_numbers()
{
    auto doc = make_doc();
    doc.replaceObject(ScrubObjGen(2, 1), ScrubObject::newNull());
    bool thrown = false;
    try {
        doc.rebuildXRef();
    } catch (ScrubExc& e) {
        thrown = true;
        assert(e.getErrorCode() == scrub_e_structure);
    }
    assert(thrown);
}

static void
test_entries()
{
    ScrubXRefEntry free_entry;
    assert(free_entry.getType() == 0);
    ScrubXRefEntry e1(1234);
    assert(e1.getType() == 1 && e1.getOffset() == 1234);
    ScrubXRefEntry e2(2, 7, 3);
    assert(e2.getObjStreamNumber() == 7 && e2.getObjStreamIndex() == 3);
    bool thrown = false;
    try {
        e2.getOffset();
    } catch (std::logic_error&) {
        thrown = true;
    }
    assert(thrown);
}

int
main()
{
    test_offsets();
    test_changes();
    test_output_pipeline();
    test_duplicate_numbers();
    test_entries();
    std::cout << "xref tests passed" << std::endl;
    return 0;
}

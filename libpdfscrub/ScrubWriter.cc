#include <pdfscrub/ScrubWriter.hh>

#include <pdfscrub/Pl_Buffer.hh>
#include <pdfscrub/Pl_Count.hh>
#include <pdfscrub/ScrubDocument.hh>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubUtil.hh>
#include <pdfscrub/Util.hh>

using namespace pdfscrub;

class ScrubWriter::Members
{
    friend class ScrubWriter;

  public:
    Members(ScrubDocument const& doc) :
        doc(doc)
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    ScrubDocument const& doc;
    Pipeline* output{nullptr};
    std::unique_ptr<Pl_Buffer> buffer;
    std::unique_ptr<Pl_Count> pipeline;
    bool written{false};
    ScrubXRefTable xref;
    scrub_offset_t startxref{0};
};

ScrubWriter::ScrubWriter(ScrubDocument const& doc) :
    m(std::make_unique<Members>(doc))
{
}

ScrubWriter::~ScrubWriter() = default;

void
ScrubWriter::setOutputPipeline(Pipeline* p)
{
    util::assertion(
        m->output == nullptr && m->buffer == nullptr,
        "ScrubWriter: output may be set only one time");
    m->output = p;
}

ScrubWriter&
ScrubWriter::write(std::string const& str)
{
    m->pipeline->writeString(str);
    return *this;
}

void
ScrubWriter::write()
{
    util::assertion(!m->written, "ScrubWriter::write called more than once");
    m->written = true;
    if (m->output == nullptr) {
        m->buffer = std::make_unique<Pl_Buffer>("ScrubWriter buffer");
        m->output = m->buffer.get();
    }
    m->pipeline = std::make_unique<Pl_Count>("ScrubWriter count", m->output);

    writeHeader();
    writeObjects();
    m->startxref = m->pipeline->getCount();
    writeXRefTable();
    writeTrailer();
    write("startxref\n")
        .write(std::to_string(m->startxref))
        .write("\n%%EOF\n");
    m->pipeline->finish();
}

std::string
ScrubWriter::getString()
{
    util::assertion(m->buffer != nullptr, "ScrubWriter::getString called without buffer output");
    return m->buffer->getString();
}

ScrubXRefTable const&
ScrubWriter::getXRefTable() const
{
    return m->xref;
}

scrub_offset_t
ScrubWriter::getStartXRef() const
{
    return m->startxref;
}

std::string
ScrubWriter::writeToString(ScrubDocument const& doc)
{
    ScrubWriter w(doc);
    w.write();
    return w.getString();
}

void
ScrubWriter::writeHeader()
{
    write("%PDF-1.7");
    // This string of binary characters would not be valid UTF-8, so it
    // really should be treated as binary.
    write("\n%\xbf\xf7\xa2\xfe\n");
}

void
ScrubWriter::writeObjects()
{
    uint32_t last = 0;
    for (auto const& [og, obj]: m->doc.getObjects()) {
        if (og.getObj() == last) {
            throw ScrubExc(
                scrub_e_structure,
                "write",
                og.toRef(),
                "object number " + std::to_string(last) + " is used more than once");
        }
        last = og.getObj();
        m->xref[og] = ScrubXRefEntry(m->pipeline->getCount());
        write(std::to_string(og.getObj()))
            .write(" ")
            .write(std::to_string(og.getGen()))
            .write(" obj\n")
            .write(obj.unparse())
            .write("\nendobj\n");
    }
}

void
ScrubWriter::writeXRefTable()
{
    uint32_t size = m->doc.getMaxObjGen().getObj() + 1;
    write("xref\n0 ").write(std::to_string(size)).write("\n");
    write("0000000000 65535 f \n");
    auto iter = m->xref.begin();
    for (uint32_t i = 1; i < size; ++i) {
        if (iter != m->xref.end() && iter->first.getObj() == i) {
            write(ScrubUtil::int_to_string(iter->second.getOffset(), 10))
                .write(" ")
                .write(ScrubUtil::int_to_string(iter->first.getGen(), 5))
                .write(" n \n");
            ++iter;
        } else {
            // Unused object number
            write("0000000000 65535 f \n");
        }
    }
}

void
ScrubWriter::writeTrailer()
{
    auto const& trailer = m->doc.getTrailer();
    ScrubObject dict = ScrubObject::newDictionary();
    dict.replaceKey(
        "/Size", ScrubObject::newInteger(m->doc.getMaxObjGen().getObj() + 1LL));
    if (trailer.root.isIndirect()) {
        dict.replaceKey("/Root", ScrubObject::newReference(trailer.root));
    }
    if (trailer.info) {
        dict.replaceKey("/Info", ScrubObject::newReference(*trailer.info));
    }
    if (trailer.encrypt) {
        dict.replaceKey("/Encrypt", *trailer.encrypt);
    }
    write("trailer ").write(dict.unparse()).write("\n");
}

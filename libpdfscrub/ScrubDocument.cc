#include <pdfscrub/ScrubDocument_private.hh>

#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubLogger.hh>
#include <pdfscrub/Util.hh>

#include <stdexcept>

using namespace pdfscrub;

ScrubDocument::ScrubDocument() :
    m(std::make_unique<Members>())
{
}

ScrubDocument::ScrubDocument(ScrubDocument const& other) :
    m(std::make_unique<Members>(*other.m))
{
}

ScrubDocument&
ScrubDocument::operator=(ScrubDocument const& other)
{
    if (this != &other) {
        m = std::make_unique<Members>(*other.m);
    }
    return *this;
}

ScrubDocument::ScrubDocument(ScrubDocument&& other) noexcept = default;

ScrubDocument& ScrubDocument::operator=(ScrubDocument&& other) noexcept = default;

// Must be explicit and not inline -- see PDFSCRUB_DLL_CLASS in DLL.h
ScrubDocument::~ScrubDocument() = default;

void
ScrubDocument::setLogger(std::shared_ptr<ScrubLogger> l)
{
    m->log = l ? l : ScrubLogger::defaultLogger();
}

std::shared_ptr<ScrubLogger>
ScrubDocument::getLogger() const
{
    return m->log;
}

ScrubObjGen
ScrubDocument::addObject(ScrubObject const& obj)
{
    ScrubObjGen og(getMaxObjGen().getObj() + 1, 0);
    m->objects[og] = obj;
    return og;
}

void
ScrubDocument::replaceObject(ScrubObjGen og, ScrubObject const& obj)
{
    util::assertion(og.isIndirect(), "ScrubDocument::replaceObject called with object number 0");
    m->objects[og] = obj;
}

void
ScrubDocument::removeObject(ScrubObjGen og)
{
    m->objects.erase(og);
}

bool
ScrubDocument::hasObject(ScrubObjGen og) const
{
    return m->objects.count(og) > 0;
}

ScrubObject*
ScrubDocument::findObject(ScrubObjGen og)
{
    auto iter = m->objects.find(og);
    return iter == m->objects.end() ? nullptr : &iter->second;
}

ScrubObject const*
ScrubDocument::findObject(ScrubObjGen og) const
{
    auto iter = m->objects.find(og);
    return iter == m->objects.end() ? nullptr : &iter->second;
}

ScrubObject&
ScrubDocument::getObject(ScrubObjGen og)
{
    auto* obj = findObject(og);
    if (obj == nullptr) {
        throw std::logic_error("ScrubDocument::getObject: no object " + og.toRef());
    }
    return *obj;
}

ScrubObject const&
ScrubDocument::getObject(ScrubObjGen og) const
{
    auto const* obj = findObject(og);
    if (obj == nullptr) {
        throw std::logic_error("ScrubDocument::getObject: no object " + og.toRef());
    }
    return *obj;
}

ScrubObject
ScrubDocument::resolve(ScrubObject const& obj) const
{
    if (!obj.isReference()) {
        return obj;
    }
    auto const* target = findObject(obj.getRef());
    return target ? *target : ScrubObject::newNull();
}

ScrubDocument::ObjectMap&
ScrubDocument::getObjects()
{
    return m->objects;
}

ScrubDocument::ObjectMap const&
ScrubDocument::getObjects() const
{
    return m->objects;
}

size_t
ScrubDocument::getObjectCount() const
{
    return m->objects.size();
}

ScrubObjGen
ScrubDocument::getMaxObjGen() const
{
    if (m->objects.empty()) {
        return {};
    }
    return m->objects.rbegin()->first;
}

ScrubDocument::Trailer&
ScrubDocument::getTrailer()
{
    return m->trailer;
}

ScrubDocument::Trailer const&
ScrubDocument::getTrailer() const
{
    return m->trailer;
}

void
ScrubDocument::setRoot(ScrubObjGen og)
{
    m->trailer.root = og;
}

void
ScrubDocument::setInfo(ScrubObjGen og)
{
    m->trailer.info = og;
}

bool
ScrubDocument::hasValidRoot() const
{
    return m->trailer.root.isIndirect() && hasObject(m->trailer.root);
}

std::optional<std::string> const&
ScrubDocument::getMetadata() const
{
    return m->metadata;
}

void
ScrubDocument::setMetadata(std::string const& xmp)
{
    m->metadata = xmp;
}

void
ScrubDocument::clearMetadata()
{
    m->metadata.reset();
}

std::vector<ScrubXRefTable>&
ScrubDocument::getXRefTables()
{
    return m->xref_tables;
}

std::vector<ScrubXRefTable> const&
ScrubDocument::getXRefTables() const
{
    return m->xref_tables;
}

void
ScrubDocument::addIssue(ScrubIssue const& issue)
{
    m->issues.push_back(issue);
}

void
ScrubDocument::warn(
    scrub_error_code_e code, std::optional<ScrubObjGen> og, std::string const& message)
{
    m->issues.emplace_back(ScrubIssue::l_warning, code, og, message);
}

std::vector<ScrubIssue> const&
ScrubDocument::getIssues() const
{
    return m->issues;
}

bool
ScrubDocument::anyIssues() const
{
    return !m->issues.empty();
}

void
ScrubDocument::clearIssues()
{
    m->issues.clear();
}

ScrubDocument::StructureStats const&
ScrubDocument::getStructureStats() const
{
    return m->stats;
}

#include <pdfscrub/ScrubDocument_private.hh>

#include <pdfscrub/ScrubExc.hh>

using namespace pdfscrub;

std::map<ScrubObjGen, ScrubObjGen>
ScrubDocument::compactObjectNumbers()
{
    if (!hasValidRoot()) {
        throw ScrubExc(
            scrub_e_structure,
            "compact",
            m->trailer.root.isIndirect() ? m->trailer.root.toRef() : "trailer",
            "root object is missing; the document cannot be renumbered");
    }

    std::map<ScrubObjGen, ScrubObjGen> renumber;
    uint32_t next = 1;
    for (auto const& iter: m->objects) {
        renumber[iter.first] = ScrubObjGen(next++, 0);
    }

    ObjectMap new_objects;
    for (auto& [og, obj]: m->objects) {
        auto new_og = renumber.at(og);
        obj.rewriteReferences([this, &og, &renumber](ScrubObjGen target) {
            auto iter = renumber.find(target);
            if (iter != renumber.end()) {
                return ScrubObject::newReference(iter->second);
            }
            warn(
                scrub_e_structure,
                og,
                "reference to missing object " + target.toRef() + " replaced with null");
            ++m->stats.dangling_references;
            return ScrubObject::newNull();
        });
        new_objects.emplace(new_og, std::move(obj));
    }

    if (m->trailer.encrypt) {
        m->trailer.encrypt->rewriteReferences([this, &renumber](ScrubObjGen target) {
            auto iter = renumber.find(target);
            if (iter != renumber.end()) {
                return ScrubObject::newReference(iter->second);
            }
            warn(
                scrub_e_structure,
                std::nullopt,
                "encryption dictionary reference to missing object " + target.toRef() +
                    " replaced with null");
            ++m->stats.dangling_references;
            return ScrubObject::newNull();
        });
    }
    m->trailer.root = renumber.at(m->trailer.root);
    if (m->trailer.info) {
        auto iter = renumber.find(*m->trailer.info);
        if (iter != renumber.end()) {
            m->trailer.info = iter->second;
        } else {
            warn(
                scrub_e_structure,
                std::nullopt,
                "trailer /Info refers to missing object " + m->trailer.info->toRef() +
                    "; removed");
            m->trailer.info.reset();
        }
    }

    size_t changed = 0;
    for (auto const& iter: renumber) {
        if (iter.first != iter.second) {
            ++changed;
        }
    }
    m->objects = std::move(new_objects);
    m->stats.objects_renumbered += changed;
    debug(
        m->log,
        "compactObjectNumbers: " + std::to_string(m->objects.size()) + " objects, " +
            std::to_string(changed) + " renumbered");
    return renumber;
}

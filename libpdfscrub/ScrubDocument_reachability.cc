#include <pdfscrub/ScrubDocument_private.hh>

#include <vector>

using namespace pdfscrub;

ScrubDocument::ReferenceMap
ScrubDocument::getReferenceMap() const
{
    ReferenceMap result;
    for (auto const& [og, obj]: m->objects) {
        std::set<ScrubObjGen> refs;
        obj.collectReferences(refs);
        if (!refs.empty()) {
            result[og] = std::move(refs);
        }
    }
    return result;
}

std::set<ScrubObjGen>
ScrubDocument::findReachable() const
{
    return findReachable(getReferenceMap());
}

std::set<ScrubObjGen>
ScrubDocument::findReachable(ReferenceMap const& refs) const
{
    std::vector<ScrubObjGen> queue;
    queue.push_back(m->trailer.root);
    if (m->trailer.info) {
        queue.push_back(*m->trailer.info);
    }
    if (m->trailer.encrypt) {
        std::set<ScrubObjGen> encrypt_refs;
        m->trailer.encrypt->collectReferences(encrypt_refs);
        queue.insert(queue.end(), encrypt_refs.begin(), encrypt_refs.end());
    }

    ScrubObjGen::set visited;
    while (!queue.empty()) {
        auto og = queue.back();
        queue.pop_back();
        if (!og.isIndirect() || !visited.add(og)) {
            continue;
        }
        auto iter = refs.find(og);
        if (iter != refs.end()) {
            queue.insert(queue.end(), iter->second.begin(), iter->second.end());
        }
    }
    return {visited.begin(), visited.end()};
}

size_t
ScrubDocument::removeUnreachable()
{
    return removeUnreachable(getReferenceMap());
}

size_t
ScrubDocument::removeUnreachable(ReferenceMap const& refs)
{
    auto visited = findReachable(refs);
    size_t removed = std::erase_if(
        m->objects, [&visited](auto const& item) { return visited.count(item.first) == 0; });
    m->stats.objects_removed += removed;
    debug(m->log, "removeUnreachable: removed " + std::to_string(removed) + " objects");
    return removed;
}

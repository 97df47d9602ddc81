// Copyright (c) 2005-2022 Jay Berkenbilt
//
// This file is part of pdfscrub.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SCRUBDOCUMENT_HH
#define SCRUBDOCUMENT_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubIssue.hh>
#include <pdfscrub/ScrubObjGen.hh>
#include <pdfscrub/ScrubObject.hh>
#include <pdfscrub/ScrubXRefEntry.hh>

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

class ScrubLogger;

// ScrubDocument is an in-memory PDF object graph: an arena of objects
// keyed by ScrubObjGen, a trailer, optional document-level XMP
// metadata, and the cross-reference tables that describe one
// serialization of it. References between objects are ids, so cycles
// in the graph are harmless and every traversal uses an explicit work
// list.
//
// Objects are added by whatever builds the graph (normally a parser)
// and are then rewritten in place by the restructuring operations
// declared below. Non-fatal problems are recorded as ScrubIssue
// entries rather than thrown. Copying a ScrubDocument produces an
// independent deep copy; ScrubJob uses this to restore the previous
// state when a stage fails.
class ScrubDocument
{
  public:
    typedef std::map<ScrubObjGen, ScrubObject> ObjectMap;
    typedef std::map<ScrubObjGen, std::set<ScrubObjGen>> ReferenceMap;

    struct Trailer
    {
        ScrubObjGen root;
        std::optional<ScrubObjGen> info;
        // The Encrypt dictionary is held directly in the trailer.
        std::optional<ScrubObject> encrypt;
    };

    // Counters updated by the restructuring operations
    struct StructureStats
    {
        size_t objects_removed{0};
        size_t duplicates_removed{0};
        size_t streams_merged{0};
        size_t objects_renumbered{0};
        size_t dangling_references{0};
        size_t xref_entries{0};
    };

    // Only streams whose /Filter value (as returned by
    // ScrubObject::getFilterKey) is listed in allowed_filters are
    // merged. The empty string stands for unfiltered data. Add a
    // filter only if concatenating two of its encoded streams yields a
    // valid encoding of the concatenated data.
    struct StreamMergeConfig
    {
        size_t threshold{1024};
        std::set<std::string> allowed_filters{""};
    };

    PDFSCRUB_DLL
    ScrubDocument();
    PDFSCRUB_DLL
    ScrubDocument(ScrubDocument const&);
    PDFSCRUB_DLL
    ScrubDocument& operator=(ScrubDocument const&);
    PDFSCRUB_DLL
    ScrubDocument(ScrubDocument&&) noexcept;
    PDFSCRUB_DLL
    ScrubDocument& operator=(ScrubDocument&&) noexcept;
    PDFSCRUB_DLL
    ~ScrubDocument();

    PDFSCRUB_DLL
    void setLogger(std::shared_ptr<ScrubLogger>);
    PDFSCRUB_DLL
    std::shared_ptr<ScrubLogger> getLogger() const;

    // Object access

    // Add `obj' as a new indirect object with the next unused object
    // number and generation 0, and return its id.
    PDFSCRUB_DLL
    ScrubObjGen addObject(ScrubObject const& obj);
    // Add or replace the object with the given id. The id must be
    // indirect.
    PDFSCRUB_DLL
    void replaceObject(ScrubObjGen og, ScrubObject const& obj);
    PDFSCRUB_DLL
    void removeObject(ScrubObjGen og);
    PDFSCRUB_DLL
    bool hasObject(ScrubObjGen og) const;
    // Returns nullptr if there is no such object.
    PDFSCRUB_DLL
    ScrubObject* findObject(ScrubObjGen og);
    PDFSCRUB_DLL
    ScrubObject const* findObject(ScrubObjGen og) const;
    // Throws std::logic_error if there is no such object.
    PDFSCRUB_DLL
    ScrubObject& getObject(ScrubObjGen og);
    PDFSCRUB_DLL
    ScrubObject const& getObject(ScrubObjGen og) const;
    // If `obj' is a reference, return the object it refers to, or null
    // if it is dangling. Otherwise return `obj'.
    PDFSCRUB_DLL
    ScrubObject resolve(ScrubObject const& obj) const;
    PDFSCRUB_DLL
    ObjectMap& getObjects();
    PDFSCRUB_DLL
    ObjectMap const& getObjects() const;
    PDFSCRUB_DLL
    size_t getObjectCount() const;
    PDFSCRUB_DLL
    ScrubObjGen getMaxObjGen() const;

    // Trailer and document-level data
    PDFSCRUB_DLL
    Trailer& getTrailer();
    PDFSCRUB_DLL
    Trailer const& getTrailer() const;
    PDFSCRUB_DLL
    void setRoot(ScrubObjGen og);
    PDFSCRUB_DLL
    void setInfo(ScrubObjGen og);
    PDFSCRUB_DLL
    bool hasValidRoot() const;
    PDFSCRUB_DLL
    std::optional<std::string> const& getMetadata() const;
    PDFSCRUB_DLL
    void setMetadata(std::string const& xmp);
    PDFSCRUB_DLL
    void clearMetadata();
    PDFSCRUB_DLL
    std::vector<ScrubXRefTable>& getXRefTables();
    PDFSCRUB_DLL
    std::vector<ScrubXRefTable> const& getXRefTables() const;

    // Issues
    PDFSCRUB_DLL
    void addIssue(ScrubIssue const& issue);
    PDFSCRUB_DLL
    void warn(scrub_error_code_e code, std::optional<ScrubObjGen> og, std::string const& message);
    PDFSCRUB_DLL
    std::vector<ScrubIssue> const& getIssues() const;
    PDFSCRUB_DLL
    bool anyIssues() const;
    PDFSCRUB_DLL
    void clearIssues();

    PDFSCRUB_DLL
    StructureStats const& getStructureStats() const;

    // Graph operations. These are single-threaded and must not run
    // while any other thread is using the document.

    // Return, for every object that references anything, the set of
    // ids it references. Objects without references are omitted.
    PDFSCRUB_DLL
    ReferenceMap getReferenceMap() const;

    // Return the ids reachable from the trailer: the root, the info
    // dictionary, and anything referenced from the Encrypt dictionary.
    // Dangling ids are included in the result.
    PDFSCRUB_DLL
    std::set<ScrubObjGen> findReachable() const;
    PDFSCRUB_DLL
    std::set<ScrubObjGen> findReachable(ReferenceMap const& refs) const;
    // Remove every object that is not reachable and return the number
    // removed. Running this again removes nothing.
    PDFSCRUB_DLL
    size_t removeUnreachable();
    // As above, using a reference map from getReferenceMap that is
    // still current
    PDFSCRUB_DLL
    size_t removeUnreachable(ReferenceMap const& refs);

    // Collapse structurally identical objects into the lowest-numbered
    // copy, rewriting every reference to the removed copies. Returns
    // the number of objects removed.
    PDFSCRUB_DLL
    size_t deduplicateObjects();

    // Merge adjacent small streams. See StreamMergeConfig. Returns the
    // number of streams removed.
    PDFSCRUB_DLL
    size_t mergeSmallStreams();
    PDFSCRUB_DLL
    size_t mergeSmallStreams(StreamMergeConfig const& config);

    // Renumber objects to 1..N, generation 0, in ascending order of
    // their current ids, and rewrite every reference. References to
    // missing objects become null and are reported as issues. Throws
    // ScrubExc with scrub_e_structure, without changing anything, if
    // the root object is missing. Returns the old to new mapping.
    PDFSCRUB_DLL
    std::map<ScrubObjGen, ScrubObjGen> compactObjectNumbers();

    // Serialize the document with ScrubWriter, discarding the output,
    // and replace all cross-reference tables with a single table
    // holding the offset at which each object begins. Writing the
    // unchanged document with ScrubWriter produces exactly these
    // offsets.
    PDFSCRUB_DLL
    ScrubXRefTable const& rebuildXRef();

  private:
    class Members;

    // Keep all member variables inside the Members object, which we
    // dynamically allocate. This makes it possible to add new private
    // members without breaking binary compatibility.
    std::unique_ptr<Members> m;
};

#endif // SCRUBDOCUMENT_HH

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

#ifndef SCRUBCONTENTSANITIZER_HH
#define SCRUBCONTENTSANITIZER_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubIssue.hh>
#include <pdfscrub/ScrubObjGen.hh>
#include <pdfscrub/ScrubTokenizer.hh>

#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

class ScrubDocument;
class ScrubObject;
class ScrubResourceTracker;
class ScrubWorkerPool;

// Rewrites content streams at the operator level. A stream is a
// candidate if its /Subtype is /Form or /Image, if a page's /Contents
// or a Type 3 font's /CharProcs refers to it, or if its data contains
// at least one content stream operator. A candidate is rewritten only
// if its data tokenizes cleanly and every word in it is a known
// operator. An image is rewritten only if it has operators and its
// length is not the sample size its dictionary calls for.
class ScrubContentSanitizer
{
  public:
    struct ProcessingConfig
    {
        // Operators to drop, e.g. "Td", "TD", "T*"
        std::set<std::string> remove_operators;
        bool remove_comments{true};
        // Collapse "q q", "Q Q", and identical consecutive cm and gs
        // operations into one.
        bool remove_redundant_graphics_state{true};
        // Merge consecutive Tj operations that each show one string.
        bool merge_text_operators{true};
        bool track_resources{true};
        // Used by removeUnusedResources
        bool remove_unused_resources{false};
    };

    struct Operand
    {
        ScrubTokenizer::token_type_e type;
        // Decoded string or name value for strings and names; the
        // same as raw otherwise
        std::string value;
        // Source text. Arrays and dictionaries are grouped into one
        // operand.
        std::string raw;
    };

    struct Operation
    {
        enum kind_e { k_operator, k_comment, k_inline_image };

        kind_e kind{k_operator};
        // Operator name or comment text. Empty for trailing operands
        // not followed by an operator.
        std::string op;
        std::vector<Operand> operands;
        // For inline images, the data between ID and EI
        std::string image_data;

        bool
        operator==(Operation const& rhs) const
        {
            if (kind != rhs.kind || op != rhs.op || image_data != rhs.image_data ||
                operands.size() != rhs.operands.size()) {
                return false;
            }
            for (size_t i = 0; i < operands.size(); ++i) {
                if (operands.at(i).raw != rhs.operands.at(i).raw) {
                    return false;
                }
            }
            return true;
        }
    };

    struct Stats
    {
        size_t streams_processed{0};
        // Content streams left unchanged because they could not be
        // decoded or parsed. Their resource usage is unknown.
        size_t streams_skipped{0};
        size_t operators_removed{0};
        size_t operators_merged{0};
        size_t bytes_before{0};
        size_t bytes_after{0};
    };

    // resource type (e.g. "/Font") -> resource names (e.g. "/F1")
    typedef std::map<std::string, std::set<std::string>> ResourceUsage;

    PDFSCRUB_DLL
    ScrubContentSanitizer();
    PDFSCRUB_DLL
    explicit ScrubContentSanitizer(ProcessingConfig const& config);
    PDFSCRUB_DLL
    ~ScrubContentSanitizer();

    // Decoded stream data is charged against `tracker'.
    PDFSCRUB_DLL
    void setResourceTracker(ScrubResourceTracker* tracker);

    PDFSCRUB_DLL
    static bool isContentOperator(std::string const& op);

    // Group tokens into operations. Returns false and sets `error' if
    // the data does not tokenize cleanly or contains a word that is
    // not a known operator.
    PDFSCRUB_DLL
    static bool
    parseOperations(std::string_view data, std::vector<Operation>& result, std::string& error);
    // One operation per line
    PDFSCRUB_DLL
    static std::string encodeOperations(std::vector<Operation> const& ops);

    // Apply the configured policy to `ops'. Counts are added to
    // `stats', and resource names are recorded in `usage' if resource
    // tracking is enabled.
    PDFSCRUB_DLL
    std::vector<Operation>
    applyPolicy(std::vector<Operation> const& ops, Stats& stats, ResourceUsage& usage) const;

    // Sanitize one stream in place. Returns true if the stream was
    // rewritten. Problems are appended to `issues'; nothing is thrown
    // for bad data. `is_content' marks a stream known to be a content
    // stream from where it is used, such as a page's /Contents. This
    // method may be called concurrently for different streams.
    PDFSCRUB_DLL
    bool sanitizeStream(
        ScrubObjGen og,
        ScrubObject& stream,
        Stats& stats,
        ResourceUsage& usage,
        std::vector<ScrubIssue>& issues,
        bool is_content = false) const;

    // Sanitize every candidate stream in the document, using `pool'
    // if given. Issues are added to the document in object order, and
    // statistics and resource usage are accumulated. Returns the
    // number of streams rewritten.
    PDFSCRUB_DLL
    size_t sanitizeDocument(ScrubDocument& doc, ScrubWorkerPool* pool = nullptr);

    // Names in /Font and /XObject resource dictionaries that no
    // processed content stream used, keyed by the object that holds
    // the /Resources entry and then by resource type. Nothing is
    // reported once any content stream has been skipped.
    PDFSCRUB_DLL
    std::map<ScrubObjGen, ResourceUsage> findUnusedResources(ScrubDocument const& doc) const;
    // Delete the entries reported by findUnusedResources if
    // remove_unused_resources is set. Returns the number removed.
    PDFSCRUB_DLL
    size_t removeUnusedResources(ScrubDocument& doc);

    PDFSCRUB_DLL
    std::set<std::string> const& getFontsUsed() const;
    PDFSCRUB_DLL
    std::set<std::string> const& getXObjectsUsed() const;
    PDFSCRUB_DLL
    ResourceUsage const& getResourceUsage() const;
    PDFSCRUB_DLL
    Stats const& getStats() const;
    PDFSCRUB_DLL
    void reset();

  private:
    class Members;

    std::unique_ptr<Members> m;
};

#endif // SCRUBCONTENTSANITIZER_HH

#include <pdfscrub/ScrubContentSanitizer.hh>

#include <pdfscrub/Pl_Flate.hh>
#include <pdfscrub/ScrubDocument.hh>
#include <pdfscrub/ScrubObject.hh>
#include <pdfscrub/ScrubResourceTracker.hh>
#include <pdfscrub/ScrubWorkerPool.hh>

#include <stdexcept>

using tt = ScrubTokenizer::token_type_e;
using Operation = ScrubContentSanitizer::Operation;
using Operand = ScrubContentSanitizer::Operand;

class ScrubContentSanitizer::Members
{
    friend class ScrubContentSanitizer;

  public:
    Members(ProcessingConfig const& config) :
        config(config)
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    ProcessingConfig config;
    ScrubResourceTracker* tracker{nullptr};
    Stats stats;
    ResourceUsage usage;
};

namespace
{
    std::set<std::string> const content_operators{
        "b",  "B",  "b*", "B*", "BDC", "BI",  "BMC", "BT",  "BX",  "c",  "cm", "CS", "cs",
        "d",  "d0", "d1", "Do", "DP",  "EI",  "EMC", "ET",  "EX",  "f",  "F",  "f*", "G",
        "g",  "gs", "h",  "i",  "ID",  "j",   "J",   "K",   "k",   "l",  "m",  "M",  "MP",
        "n",  "q",  "Q",  "re", "RG",  "rg",  "ri",  "s",   "S",   "SC", "sc", "SCN", "scn",
        "sh", "T*", "Tc", "Td", "TD",  "Tf",  "Tj",  "TJ",  "TL",  "Tm", "Tr", "Ts", "Tw",
        "Tz", "v",  "w",  "W",  "W*",  "y",   "'",   "\""};

    std::set<std::string> const graphics_state_operators{"q", "Q", "cm", "gs"};

    // Operators that name a resource, and the resource type
    std::map<std::string, std::string> const op_to_rtype{
        {"CS", "/ColorSpace"},
        {"cs", "/ColorSpace"},
        {"gs", "/ExtGState"},
        {"Tf", "/Font"},
        {"SCN", "/Pattern"},
        {"scn", "/Pattern"},
        {"BDC", "/Properties"},
        {"DP", "/Properties"},
        {"sh", "/Shading"},
        {"Do", "/XObject"},
    };

    // Colour spaces that are not looked up in /Resources
    std::set<std::string> const builtin_color_spaces{
        "/DeviceGray", "/DeviceRGB", "/DeviceCMYK", "/Pattern"};

    // Filters used only for image samples
    std::set<std::string> const image_filters{
        "/DCTDecode", "/JPXDecode", "/JBIG2Decode", "/CCITTFaxDecode"};

    std::string const empty_name;
    std::set<std::string> const empty_set;
} // namespace

static bool
is_single_string_tj(Operation const& op)
{
    return op.kind == Operation::k_operator && op.op == "Tj" && op.operands.size() == 1 &&
        op.operands.at(0).type == tt::tt_string;
}

template <typename Doc, typename Fn>
static void
for_each_resource_dict(Doc& doc, Fn fn)
{
    for (auto& [og, obj]: doc.getObjects()) {
        if (!(obj.isDictionary() || obj.isStream()) || !obj.hasKey("/Resources")) {
            continue;
        }
        auto* resources = &obj.getDict().at("/Resources");
        ScrubObjGen holder = og;
        if (resources->isReference()) {
            holder = resources->getRef();
            resources = doc.findObject(holder);
        }
        if (resources == nullptr || !resources->isDictionary()) {
            continue;
        }
        for (std::string const type: {"/Font", "/XObject"}) {
            auto iter = resources->getDict().find(type);
            if (iter == resources->getDict().end()) {
                continue;
            }
            auto* sub = &iter->second;
            ScrubObjGen sub_holder = holder;
            if (sub->isReference()) {
                sub_holder = sub->getRef();
                sub = doc.findObject(sub_holder);
            }
            if (sub != nullptr && sub->isDictionary()) {
                fn(sub_holder, type, *sub);
            }
        }
    }
}

// True if `data' tokenizes to at least one content stream operator
// before any bad token
static bool
has_content_operator(std::string_view data)
{
    ScrubTokenizer tokenizer(data);
    for (auto token = tokenizer.readToken();
         token.getType() != tt::tt_eof && token.getType() != tt::tt_bad;
         token = tokenizer.readToken()) {
        if (token.isWord() && ScrubContentSanitizer::isContentOperator(token.getValue())) {
            return true;
        }
        if (token.isWord("ID")) {
            tokenizer.expectInlineImage();
        }
    }
    return false;
}

static size_t
color_components(ScrubObject const& cs)
{
    if (cs.isName()) {
        auto const& n = cs.getName();
        if (n == "/DeviceGray" || n == "/CalGray" || n == "/G") {
            return 1;
        }
        if (n == "/DeviceRGB" || n == "/CalRGB" || n == "/RGB" || n == "/Lab") {
            return 3;
        }
        if (n == "/DeviceCMYK" || n == "/CMYK") {
            return 4;
        }
        return 0;
    }
    if (!cs.isArray() || cs.getArrayNItems() == 0 || !cs.getArrayItem(0).isName()) {
        return 0;
    }
    auto const& family = cs.getArrayItem(0).getName();
    if (family == "/Indexed" || family == "/I" || family == "/Separation" ||
        family == "/CalGray") {
        return 1;
    }
    if (family == "/CalRGB" || family == "/Lab") {
        return 3;
    }
    if (family == "/DeviceN" && cs.getArrayNItems() > 1 && cs.getArrayItem(1).isArray()) {
        return cs.getArrayItem(1).getArrayNItems();
    }
    return 0;
}

// Number of sample bytes an image's dictionary calls for, or 0 if that
// cannot be worked out without resolving references
static size_t
image_sample_size(ScrubObject const& image)
{
    auto width = image.getKey("/Width");
    auto height = image.getKey("/Height");
    if (!(width.isInteger() && height.isInteger()) || width.getIntValue() <= 0 ||
        height.getIntValue() <= 0) {
        return 0;
    }
    size_t bpc = 0;
    size_t components = 0;
    if (image.getKey("/ImageMask").isBool() && image.getKey("/ImageMask").getBoolValue()) {
        bpc = 1;
        components = 1;
    } else {
        auto b = image.getKey("/BitsPerComponent");
        if (!b.isInteger() || b.getIntValue() <= 0) {
            return 0;
        }
        bpc = static_cast<size_t>(b.getIntValue());
        components = color_components(image.getKey("/ColorSpace"));
    }
    if (components == 0) {
        return 0;
    }
    size_t row = (static_cast<size_t>(width.getIntValue()) * components * bpc + 7) / 8;
    return row * static_cast<size_t>(height.getIntValue());
}

// Streams that are content streams by where they are used: page
// /Contents and Type 3 glyph procedures
static std::set<ScrubObjGen>
structural_content_streams(ScrubDocument const& doc)
{
    std::set<ScrubObjGen> result;
    auto add = [&result](ScrubObject const& o) {
        if (o.isReference()) {
            result.insert(o.getRef());
        } else if (o.isArray()) {
            for (auto const& item: o.getArray()) {
                if (item.isReference()) {
                    result.insert(item.getRef());
                }
            }
        }
    };
    for (auto const& [og, obj]: doc.getObjects()) {
        if (!obj.isDictionary()) {
            continue;
        }
        if (obj.isDictionaryOfType("/Page")) {
            add(obj.getKey("/Contents"));
        }
        if (obj.isDictionaryOfType("/Font", "/Type3")) {
            auto procs = obj.getKey("/CharProcs");
            if (procs.isReference()) {
                auto const* resolved = doc.findObject(procs.getRef());
                procs = resolved ? *resolved : ScrubObject::newNull();
            }
            if (procs.isDictionary()) {
                for (auto const& [key, value]: procs.getDict()) {
                    add(value);
                }
            }
        }
    }
    return result;
}

ScrubContentSanitizer::ScrubContentSanitizer() :
    m(std::make_unique<Members>(ProcessingConfig()))
{
}

ScrubContentSanitizer::ScrubContentSanitizer(ProcessingConfig const& config) :
    m(std::make_unique<Members>(config))
{
}

ScrubContentSanitizer::~ScrubContentSanitizer() = default;

void
ScrubContentSanitizer::setResourceTracker(ScrubResourceTracker* tracker)
{
    m->tracker = tracker;
}

bool
ScrubContentSanitizer::isContentOperator(std::string const& op)
{
    return content_operators.count(op) > 0;
}

bool
ScrubContentSanitizer::parseOperations(
    std::string_view data, std::vector<Operation>& result, std::string& error)
{
    result.clear();
    auto tokens = ScrubTokenizer::tokenize(data, true);
    if (!tokens.empty() && tokens.back().getType() == tt::tt_bad) {
        error = "bad token: " + tokens.back().getErrorMessage();
        return false;
    }

    std::vector<Operand> operands;
    for (size_t i = 0; i < tokens.size(); ++i) {
        auto const& token = tokens.at(i);
        switch (token.getType()) {
        case tt::tt_space:
            break;

        case tt::tt_comment:
            result.push_back({Operation::k_comment, token.getValue(), {}, {}});
            break;

        case tt::tt_array_open:
        case tt::tt_dict_open:
            {
                // Group everything up to the matching close
                int depth = 0;
                std::string raw;
                size_t j = i;
                for (; j < tokens.size(); ++j) {
                    auto type = tokens.at(j).getType();
                    if (type == tt::tt_space || type == tt::tt_comment) {
                        continue;
                    }
                    if (type == tt::tt_array_open || type == tt::tt_dict_open) {
                        ++depth;
                    } else if (type == tt::tt_array_close || type == tt::tt_dict_close) {
                        --depth;
                    } else if (type == tt::tt_word) {
                        error = "operator " + tokens.at(j).getValue() + " inside array";
                        return false;
                    }
                    if (!raw.empty()) {
                        raw += " ";
                    }
                    raw += tokens.at(j).getRawValue();
                    if (depth == 0) {
                        break;
                    }
                }
                if (depth != 0) {
                    error = "unterminated array or dictionary";
                    return false;
                }
                operands.push_back({token.getType(), raw, raw});
                i = j;
            }
            break;

        case tt::tt_array_close:
        case tt::tt_dict_close:
            error = "unexpected " + token.getValue();
            return false;

        case tt::tt_word:
            if (!isContentOperator(token.getValue())) {
                error = "unknown operator " + token.getValue();
                return false;
            }
            if (token.isWord("BI")) {
                Operation op{Operation::k_inline_image, "BI", std::move(operands), {}};
                operands.clear();
                // Dictionary entries up to ID, then the image data, then EI
                size_t j = i + 1;
                for (; j < tokens.size() && !tokens.at(j).isWord("ID"); ++j) {
                    auto type = tokens.at(j).getType();
                    if (type == tt::tt_word) {
                        error = "operator " + tokens.at(j).getValue() + " in inline image";
                        return false;
                    }
                    if (type != tt::tt_space && type != tt::tt_comment) {
                        op.operands.push_back(
                            {type, tokens.at(j).getValue(), tokens.at(j).getRawValue()});
                    }
                }
                if (j + 2 >= tokens.size() ||
                    tokens.at(j + 1).getType() != tt::tt_inline_image ||
                    !tokens.at(j + 2).isWord("EI")) {
                    error = "incomplete inline image";
                    return false;
                }
                op.image_data = tokens.at(j + 1).getValue();
                result.push_back(std::move(op));
                i = j + 2;
            } else if (token.isWord("ID") || token.isWord("EI")) {
                error = token.getValue() + " outside of inline image";
                return false;
            } else {
                result.push_back(
                    {Operation::k_operator, token.getValue(), std::move(operands), {}});
                operands.clear();
            }
            break;

        default:
            operands.push_back({token.getType(), token.getValue(), token.getRawValue()});
            break;
        }
    }
    if (!operands.empty()) {
        result.push_back({Operation::k_operator, "", std::move(operands), {}});
    }
    return true;
}

std::string
ScrubContentSanitizer::encodeOperations(std::vector<Operation> const& ops)
{
    std::string result;
    for (auto const& op: ops) {
        if (op.kind == Operation::k_comment) {
            result += op.op + "\n";
            continue;
        }
        std::string line;
        for (auto const& operand: op.operands) {
            if (!line.empty()) {
                line += " ";
            }
            line += operand.raw;
        }
        if (op.kind == Operation::k_inline_image) {
            result += "BI";
            if (!line.empty()) {
                result += " " + line;
            }
            // The image data keeps the white space that preceded EI.
            result += "\nID " + op.image_data + "EI\n";
            continue;
        }
        if (!op.op.empty()) {
            if (!line.empty()) {
                line += " ";
            }
            line += op.op;
        }
        result += line + "\n";
    }
    return result;
}

std::vector<Operation>
ScrubContentSanitizer::applyPolicy(
    std::vector<Operation> const& ops, Stats& stats, ResourceUsage& usage) const
{
    auto const& config = m->config;

    // (a) removal
    std::vector<Operation> kept;
    for (auto const& op: ops) {
        if ((op.kind == Operation::k_comment && config.remove_comments) ||
            (op.kind == Operation::k_operator && config.remove_operators.count(op.op))) {
            ++stats.operators_removed;
            continue;
        }
        kept.push_back(op);
    }

    // (b) consecutive identical graphics state operations
    if (config.remove_redundant_graphics_state) {
        std::vector<Operation> collapsed;
        for (auto& op: kept) {
            if (op.kind == Operation::k_operator && graphics_state_operators.count(op.op) &&
                !collapsed.empty() && collapsed.back() == op) {
                ++stats.operators_removed;
                continue;
            }
            collapsed.push_back(std::move(op));
        }
        kept = std::move(collapsed);
    }

    // (c) Tj merging
    if (config.merge_text_operators) {
        std::vector<Operation> merged;
        for (auto& op: kept) {
            if (is_single_string_tj(op) && !merged.empty() && is_single_string_tj(merged.back())) {
                auto& target = merged.back().operands.at(0);
                target.value += op.operands.at(0).value;
                target.raw = ScrubObject::newString(target.value).unparse();
                ++stats.operators_merged;
                continue;
            }
            merged.push_back(std::move(op));
        }
        kept = std::move(merged);
    }

    // (d) resource tracking
    if (config.track_resources) {
        for (auto const& op: kept) {
            if (op.kind != Operation::k_operator) {
                continue;
            }
            auto iter = op_to_rtype.find(op.op);
            if (iter == op_to_rtype.end()) {
                continue;
            }
            std::string const* name = &empty_name;
            for (auto const& operand: op.operands) {
                if (operand.type == tt::tt_name) {
                    name = &operand.value;
                }
            }
            if (name->empty() ||
                (iter->second == "/ColorSpace" && builtin_color_spaces.count(*name))) {
                continue;
            }
            usage[iter->second].insert(*name);
        }
    }
    return kept;
}

bool
ScrubContentSanitizer::sanitizeStream(
    ScrubObjGen og,
    ScrubObject& stream,
    Stats& stats,
    ResourceUsage& usage,
    std::vector<ScrubIssue>& issues,
    bool is_content) const
{
    if (!stream.isStream()) {
        return false;
    }
    bool is_image = stream.isDictionaryOfType("", "/Image");
    bool known = is_content || stream.isDictionaryOfType("", "/Form");
    auto filter = stream.getFilterKey();
    bool flate = (filter == "/FlateDecode");

    if (!(filter.empty() || flate)) {
        if (known || (is_image && !image_filters.count(filter))) {
            issues.emplace_back(
                ScrubIssue::l_warning,
                scrub_e_processing,
                og,
                "content stream uses unsupported filter " + filter + "; left unchanged");
        }
        if (known) {
            ++stats.streams_skipped;
        }
        return false;
    }

    try {
        std::string data =
            flate ? Pl_Flate::inflate(stream.getStreamData(), m->tracker) : stream.getStreamData();

        if (!known && !has_content_operator(data)) {
            return false;
        }
        if (is_image) {
            // Leave sample data alone, and anything that can't be told
            // apart from it.
            auto samples = image_sample_size(stream);
            if (samples == 0 || data.size() == samples) {
                return false;
            }
        }

        std::vector<Operation> ops;
        std::string error;
        if (!parseOperations(data, ops, error)) {
            // Image samples are not expected to parse.
            if (!is_image) {
                issues.emplace_back(
                    ScrubIssue::l_warning,
                    scrub_e_processing,
                    og,
                    "content stream could not be tokenized (" + error + "); left unchanged");
                ++stats.streams_skipped;
            }
            return false;
        }

        auto result = encodeOperations(applyPolicy(ops, stats, usage));
        stats.bytes_before += data.size();
        stats.bytes_after += result.size();
        ++stats.streams_processed;
        stream.replaceStreamData(flate ? Pl_Flate::deflate(result) : result);
        return true;
    } catch (std::runtime_error& e) {
        issues.emplace_back(
            ScrubIssue::l_warning,
            scrub_e_processing,
            og,
            std::string("content stream sanitization failed: ") + e.what());
        if (!is_image) {
            ++stats.streams_skipped;
        }
    }
    return false;
}

size_t
ScrubContentSanitizer::sanitizeDocument(ScrubDocument& doc, ScrubWorkerPool* pool)
{
    struct Slot
    {
        ScrubObjGen og;
        ScrubObject* obj;
        bool is_content{false};
        bool changed{false};
        Stats stats;
        ResourceUsage usage;
        std::vector<ScrubIssue> issues;
    };
    auto content_streams = structural_content_streams(doc);
    std::vector<Slot> slots;
    for (auto& [og, obj]: doc.getObjects()) {
        if (obj.isStream()) {
            slots.push_back({og, &obj, content_streams.count(og) > 0, false, {}, {}, {}});
        }
    }

    ScrubWorkerPool::forEachIndex(pool, slots.size(), [this, &slots](size_t i) {
        auto& slot = slots.at(i);
        slot.changed = sanitizeStream(
            slot.og, *slot.obj, slot.stats, slot.usage, slot.issues, slot.is_content);
    });

    size_t changed = 0;
    for (auto const& slot: slots) {
        if (slot.changed) {
            ++changed;
        }
        m->stats.streams_processed += slot.stats.streams_processed;
        m->stats.streams_skipped += slot.stats.streams_skipped;
        m->stats.operators_removed += slot.stats.operators_removed;
        m->stats.operators_merged += slot.stats.operators_merged;
        m->stats.bytes_before += slot.stats.bytes_before;
        m->stats.bytes_after += slot.stats.bytes_after;
        for (auto const& [type, names]: slot.usage) {
            m->usage[type].insert(names.begin(), names.end());
        }
        for (auto const& issue: slot.issues) {
            doc.addIssue(issue);
        }
    }
    return changed;
}

std::map<ScrubObjGen, ScrubContentSanitizer::ResourceUsage>
ScrubContentSanitizer::findUnusedResources(ScrubDocument const& doc) const
{
    std::map<ScrubObjGen, ResourceUsage> result;
    if (m->stats.streams_skipped > 0) {
        // Usage is only known for content that was read.
        return result;
    }
    for_each_resource_dict(
        doc, [this, &result](ScrubObjGen holder, std::string const& type, ScrubObject const& dict) {
            auto used = m->usage.find(type);
            for (auto const& [name, value]: dict.getDict()) {
                if (used == m->usage.end() || used->second.count(name) == 0) {
                    result[holder][type].insert(name);
                }
            }
        });
    return result;
}

size_t
ScrubContentSanitizer::removeUnusedResources(ScrubDocument& doc)
{
    if (!m->config.remove_unused_resources || m->stats.streams_skipped > 0) {
        return 0;
    }
    size_t removed = 0;
    for_each_resource_dict(
        doc, [this, &removed](ScrubObjGen, std::string const& type, ScrubObject& dict) {
            auto used = m->usage.find(type);
            auto& items = dict.getDict();
            removed += std::erase_if(items, [&used, this](auto const& item) {
                return used == m->usage.end() || used->second.count(item.first) == 0;
            });
        });
    return removed;
}

std::set<std::string> const&
ScrubContentSanitizer::getFontsUsed() const
{
    auto iter = m->usage.find("/Font");
    return iter == m->usage.end() ? empty_set : iter->second;
}

std::set<std::string> const&
ScrubContentSanitizer::getXObjectsUsed() const
{
    auto iter = m->usage.find("/XObject");
    return iter == m->usage.end() ? empty_set : iter->second;
}

ScrubContentSanitizer::ResourceUsage const&
ScrubContentSanitizer::getResourceUsage() const
{
    return m->usage;
}

ScrubContentSanitizer::Stats const&
ScrubContentSanitizer::getStats() const
{
    return m->stats;
}

void
ScrubContentSanitizer::reset()
{
    m->stats = Stats();
    m->usage.clear();
}

#include <pdfscrub/ScrubObject.hh>

#include <pdfscrub/ScrubUtil.hh>
#include <pdfscrub/Util.hh>

#include <cstring>
#include <stdexcept>

using namespace pdfscrub;

namespace
{
    std::string
    normalize_name(std::string const& name)
    {
        if (name.empty()) {
            return name;
        }
        std::string result;
        result += name.at(0);
        for (size_t i = 1; i < name.length(); ++i) {
            char ch = name.at(i);
            auto uch = static_cast<unsigned char>(ch);
            // Don't use locale/ctype here; follow the PDF delimiter rules.
            if (uch < 33 || ch == '#' || ch == '/' || ch == '(' || ch == ')' || ch == '{' ||
                ch == '}' || ch == '<' || ch == '>' || ch == '[' || ch == ']' || ch == '%' ||
                uch > 126) {
                result += util::hex_encode_char(ch);
            } else {
                result += ch;
            }
        }
        return result;
    }

    bool
    use_hex_string(std::string const& val)
    {
        // Use the hexadecimal representation of a string if there are
        // any non-printable characters or if too large of a proportion
        // of the string consists of non-ASCII characters.
        bool nonprintable = false;
        size_t non_ascii = 0;
        for (auto ch: val) {
            auto uch = static_cast<unsigned char>(ch);
            if (!((uch >= 32 && uch < 127) || strchr("\n\r\t\b\f", ch))) {
                if (uch < 24) {
                    nonprintable = true;
                }
                ++non_ascii;
            }
        }
        return (nonprintable || (5 * non_ascii > val.length()));
    }

    std::string
    unparse_string(std::string const& val)
    {
        if (use_hex_string(val)) {
            return "<" + ScrubUtil::hex_encode(val) + ">";
        }
        std::string result = "(";
        for (auto ch: val) {
            switch (ch) {
            case '\n':
                result += "\\n";
                break;

            case '\r':
                result += "\\r";
                break;

            case '\t':
                result += "\\t";
                break;

            case '\b':
                result += "\\b";
                break;

            case '\f':
                result += "\\f";
                break;

            case '(':
                result += "\\(";
                break;

            case ')':
                result += "\\)";
                break;

            case '\\':
                result += "\\\\";
                break;

            default:
                if (static_cast<unsigned char>(ch) < 127) {
                    result += ch;
                } else {
                    auto uch = static_cast<unsigned int>(static_cast<unsigned char>(ch));
                    result += '\\';
                    result += static_cast<char>('0' + ((uch >> 6) & 7));
                    result += static_cast<char>('0' + ((uch >> 3) & 7));
                    result += static_cast<char>('0' + (uch & 7));
                }
                break;
            }
        }
        result += ")";
        return result;
    }
} // namespace

bool
Scrub_Stream::operator==(Scrub_Stream const& rhs) const
{
    return dict == rhs.dict && data == rhs.data;
}

ScrubObject::ScrubObject() :
    value(Scrub_Null())
{
}

ScrubObject
ScrubObject::newNull()
{
    return ScrubObject();
}

ScrubObject
ScrubObject::newBool(bool v)
{
    return ScrubObject(value_t(std::in_place_type<bool>, v));
}

ScrubObject
ScrubObject::newInteger(long long v)
{
    return ScrubObject(value_t(std::in_place_type<long long>, v));
}

ScrubObject
ScrubObject::newReal(double v)
{
    return ScrubObject(value_t(std::in_place_type<double>, v));
}

ScrubObject
ScrubObject::newName(std::string const& name)
{
    if (name.empty() || name.at(0) != '/') {
        throw std::logic_error("ScrubObject::newName called with \"" + name + "\"");
    }
    return ScrubObject(value_t(Scrub_Name{name}));
}

ScrubObject
ScrubObject::newString(std::string const& str)
{
    return ScrubObject(value_t(Scrub_String{str}));
}

ScrubObject
ScrubObject::newArray(Array const& items)
{
    return ScrubObject(value_t(std::in_place_type<Array>, items));
}

ScrubObject
ScrubObject::newDictionary(Dictionary const& items)
{
    return ScrubObject(value_t(std::in_place_type<Dictionary>, items));
}

ScrubObject
ScrubObject::newStream(Dictionary const& dict, std::string const& data)
{
    ScrubObject result(value_t(Scrub_Stream{dict, data}));
    result.replaceKey("/Length", newInteger(static_cast<long long>(data.size())));
    return result;
}

ScrubObject
ScrubObject::newReference(ScrubObjGen og)
{
    return ScrubObject(value_t(og));
}

scrub_object_type_e
ScrubObject::getTypeCode() const
{
    switch (value.index()) {
    case 0:
        return scrub_ot_null;
    case 1:
        return scrub_ot_boolean;
    case 2:
        return scrub_ot_integer;
    case 3:
        return scrub_ot_real;
    case 4:
        return scrub_ot_name;
    case 5:
        return scrub_ot_string;
    case 6:
        return scrub_ot_array;
    case 7:
        return scrub_ot_dictionary;
    case 8:
        return scrub_ot_stream;
    default:
        return scrub_ot_reference;
    }
}

char const*
ScrubObject::getTypeName() const
{
    switch (getTypeCode()) {
    case scrub_ot_null:
        return "null";
    case scrub_ot_boolean:
        return "boolean";
    case scrub_ot_integer:
        return "integer";
    case scrub_ot_real:
        return "real";
    case scrub_ot_name:
        return "name";
    case scrub_ot_string:
        return "string";
    case scrub_ot_array:
        return "array";
    case scrub_ot_dictionary:
        return "dictionary";
    case scrub_ot_stream:
        return "stream";
    case scrub_ot_reference:
        return "reference";
    }
    return "unknown";
}

bool
ScrubObject::isNull() const
{
    return std::holds_alternative<Scrub_Null>(value);
}

bool
ScrubObject::isBool() const
{
    return std::holds_alternative<bool>(value);
}

bool
ScrubObject::isInteger() const
{
    return std::holds_alternative<long long>(value);
}

bool
ScrubObject::isReal() const
{
    return std::holds_alternative<double>(value);
}

bool
ScrubObject::isNumber() const
{
    return isInteger() || isReal();
}

bool
ScrubObject::isName() const
{
    return std::holds_alternative<Scrub_Name>(value);
}

bool
ScrubObject::isString() const
{
    return std::holds_alternative<Scrub_String>(value);
}

bool
ScrubObject::isArray() const
{
    return std::holds_alternative<Array>(value);
}

bool
ScrubObject::isDictionary() const
{
    return std::holds_alternative<Dictionary>(value);
}

bool
ScrubObject::isStream() const
{
    return std::holds_alternative<Scrub_Stream>(value);
}

bool
ScrubObject::isReference() const
{
    return std::holds_alternative<ScrubObjGen>(value);
}

bool
ScrubObject::isScalar() const
{
    return !(isArray() || isDictionary() || isStream());
}

bool
ScrubObject::isNameAndEquals(std::string const& name) const
{
    return isName() && getName() == name;
}

bool
ScrubObject::isDictionaryOfType(std::string const& type, std::string const& subtype) const
{
    if (!(isDictionary() || isStream())) {
        return false;
    }
    if (!type.empty() && !getKey("/Type").isNameAndEquals(type)) {
        return false;
    }
    if (!subtype.empty() && !getKey("/Subtype").isNameAndEquals(subtype)) {
        return false;
    }
    return true;
}

void
ScrubObject::typeError(char const* expected) const
{
    throw std::logic_error(
        std::string("operation for ") + expected + " attempted on object of type " +
        getTypeName());
}

bool
ScrubObject::getBoolValue() const
{
    if (!isBool()) {
        typeError("boolean");
    }
    return std::get<bool>(value);
}

long long
ScrubObject::getIntValue() const
{
    if (!isInteger()) {
        typeError("integer");
    }
    return std::get<long long>(value);
}

double
ScrubObject::getNumericValue() const
{
    if (isInteger()) {
        return static_cast<double>(std::get<long long>(value));
    } else if (isReal()) {
        return std::get<double>(value);
    }
    typeError("number");
    return 0.0;
}

std::string const&
ScrubObject::getName() const
{
    if (!isName()) {
        typeError("name");
    }
    return std::get<Scrub_Name>(value).name;
}

std::string const&
ScrubObject::getStringValue() const
{
    if (!isString()) {
        typeError("string");
    }
    return std::get<Scrub_String>(value).val;
}

void
ScrubObject::setStringValue(std::string const& v)
{
    if (!isString()) {
        typeError("string");
    }
    std::get<Scrub_String>(value).val = v;
}

ScrubObjGen
ScrubObject::getRef() const
{
    if (!isReference()) {
        typeError("reference");
    }
    return std::get<ScrubObjGen>(value);
}

void
ScrubObject::setRef(ScrubObjGen og)
{
    if (!isReference()) {
        typeError("reference");
    }
    std::get<ScrubObjGen>(value) = og;
}

ScrubObject::Array&
ScrubObject::getArray()
{
    if (!isArray()) {
        typeError("array");
    }
    return std::get<Array>(value);
}

ScrubObject::Array const&
ScrubObject::getArray() const
{
    if (!isArray()) {
        typeError("array");
    }
    return std::get<Array>(value);
}

size_t
ScrubObject::getArrayNItems() const
{
    return getArray().size();
}

ScrubObject
ScrubObject::getArrayItem(size_t n) const
{
    auto const& items = getArray();
    if (n < items.size()) {
        return items.at(n);
    }
    return newNull();
}

void
ScrubObject::appendItem(ScrubObject const& item)
{
    getArray().push_back(item);
}

ScrubObject::Dictionary&
ScrubObject::getDict()
{
    if (auto* stream = std::get_if<Scrub_Stream>(&value)) {
        return stream->dict;
    }
    if (!isDictionary()) {
        typeError("dictionary");
    }
    return std::get<Dictionary>(value);
}

ScrubObject::Dictionary const&
ScrubObject::getDict() const
{
    if (auto const* stream = std::get_if<Scrub_Stream>(&value)) {
        return stream->dict;
    }
    if (!isDictionary()) {
        typeError("dictionary");
    }
    return std::get<Dictionary>(value);
}

bool
ScrubObject::hasKey(std::string const& key) const
{
    if (!(isDictionary() || isStream())) {
        return false;
    }
    return getDict().count(key) > 0;
}

ScrubObject
ScrubObject::getKey(std::string const& key) const
{
    if (!(isDictionary() || isStream())) {
        return newNull();
    }
    auto const& dict = getDict();
    auto iter = dict.find(key);
    if (iter == dict.end()) {
        return newNull();
    }
    return iter->second;
}

std::set<std::string>
ScrubObject::getKeys() const
{
    std::set<std::string> result;
    for (auto const& iter: getDict()) {
        result.insert(iter.first);
    }
    return result;
}

void
ScrubObject::replaceKey(std::string const& key, ScrubObject const& v)
{
    getDict()[key] = v;
}

void
ScrubObject::removeKey(std::string const& key)
{
    getDict().erase(key);
}

std::string const&
ScrubObject::getStreamData() const
{
    if (!isStream()) {
        typeError("stream");
    }
    return std::get<Scrub_Stream>(value).data;
}

void
ScrubObject::replaceStreamData(std::string const& data)
{
    if (!isStream()) {
        typeError("stream");
    }
    auto& stream = std::get<Scrub_Stream>(value);
    stream.data = data;
    stream.dict["/Length"] = newInteger(static_cast<long long>(data.size()));
}

std::string
ScrubObject::getFilterKey() const
{
    auto filter = getKey("/Filter");
    if (filter.isNull()) {
        return "";
    }
    if (filter.isName()) {
        return filter.getName();
    }
    if (filter.isArray() && filter.getArrayNItems() == 1 && filter.getArrayItem(0).isName()) {
        return filter.getArrayItem(0).getName();
    }
    return filter.unparse();
}

void
ScrubObject::forEach(std::function<void(ScrubObject&)> const& fn)
{
    std::vector<ScrubObject*> stack{this};
    while (!stack.empty()) {
        auto* obj = stack.back();
        stack.pop_back();
        fn(*obj);
        if (auto* array = std::get_if<Array>(&obj->value)) {
            for (auto iter = array->rbegin(); iter != array->rend(); ++iter) {
                stack.push_back(&*iter);
            }
        } else if (obj->isDictionary() || obj->isStream()) {
            auto& dict = obj->getDict();
            for (auto iter = dict.rbegin(); iter != dict.rend(); ++iter) {
                stack.push_back(&iter->second);
            }
        }
    }
}

void
ScrubObject::forEach(std::function<void(ScrubObject const&)> const& fn) const
{
    std::vector<ScrubObject const*> stack{this};
    while (!stack.empty()) {
        auto const* obj = stack.back();
        stack.pop_back();
        fn(*obj);
        if (auto const* array = std::get_if<Array>(&obj->value)) {
            for (auto iter = array->rbegin(); iter != array->rend(); ++iter) {
                stack.push_back(&*iter);
            }
        } else if (obj->isDictionary() || obj->isStream()) {
            auto const& dict = obj->getDict();
            for (auto iter = dict.rbegin(); iter != dict.rend(); ++iter) {
                stack.push_back(&iter->second);
            }
        }
    }
}

void
ScrubObject::collectReferences(std::set<ScrubObjGen>& result) const
{
    forEach([&result](ScrubObject const& obj) {
        if (obj.isReference()) {
            result.insert(obj.getRef());
        }
    });
}

size_t
ScrubObject::rewriteReferences(std::function<ScrubObject(ScrubObjGen)> const& fn)
{
    size_t count = 0;
    forEach([&fn, &count](ScrubObject& obj) {
        if (obj.isReference()) {
            ++count;
            obj = fn(obj.getRef());
        }
    });
    return count;
}

std::string
ScrubObject::unparse() const
{
    // Nesting depth is unbounded, so containers are expanded onto an
    // explicit stack. A piece is an object still to be unparsed, text
    // owned by the piece, or text owned by an object.
    struct Piece
    {
        ScrubObject const* obj{nullptr};
        std::string text;
        std::string const* raw{nullptr};
    };
    std::string result;
    std::vector<Piece> stack;
    stack.push_back({this, {}, nullptr});
    while (!stack.empty()) {
        auto piece = std::move(stack.back());
        stack.pop_back();
        if (piece.raw) {
            result += *piece.raw;
            continue;
        }
        if (!piece.obj) {
            result += piece.text;
            continue;
        }
        auto const& obj = *piece.obj;
        switch (obj.getTypeCode()) {
        case scrub_ot_null:
            result += "null";
            break;
        case scrub_ot_boolean:
            result += obj.getBoolValue() ? "true" : "false";
            break;
        case scrub_ot_integer:
            result += std::to_string(obj.getIntValue());
            break;
        case scrub_ot_real:
            result += ScrubUtil::double_to_string(obj.getNumericValue());
            break;
        case scrub_ot_name:
            result += normalize_name(obj.getName());
            break;
        case scrub_ot_string:
            result += unparse_string(obj.getStringValue());
            break;
        case scrub_ot_reference:
            result += obj.getRef().toRef();
            break;
        case scrub_ot_array:
            {
                result += "[ ";
                stack.push_back({nullptr, "]", nullptr});
                auto const& items = obj.getArray();
                for (auto iter = items.rbegin(); iter != items.rend(); ++iter) {
                    stack.push_back({nullptr, " ", nullptr});
                    stack.push_back({&*iter, {}, nullptr});
                }
            }
            break;
        case scrub_ot_dictionary:
        case scrub_ot_stream:
            {
                result += "<< ";
                if (obj.isStream()) {
                    stack.push_back({nullptr, "\nendstream", nullptr});
                    stack.push_back({nullptr, {}, &obj.getStreamData()});
                    stack.push_back({nullptr, "\nstream\n", nullptr});
                }
                stack.push_back({nullptr, ">>", nullptr});
                auto const& dict = obj.getDict();
                for (auto iter = dict.rbegin(); iter != dict.rend(); ++iter) {
                    stack.push_back({nullptr, " ", nullptr});
                    stack.push_back({&iter->second, {}, nullptr});
                    stack.push_back({nullptr, normalize_name(iter->first) + " ", nullptr});
                }
            }
            break;
        }
    }
    return result;
}

bool
ScrubObject::operator==(ScrubObject const& rhs) const
{
    // Compared pairwise with an explicit stack, like unparse
    std::vector<std::pair<ScrubObject const*, ScrubObject const*>> stack{{this, &rhs}};
    while (!stack.empty()) {
        auto [a, b] = stack.back();
        stack.pop_back();
        if (a->value.index() != b->value.index()) {
            return false;
        }
        if (auto const* items = std::get_if<Array>(&a->value)) {
            auto const& other = std::get<Array>(b->value);
            if (items->size() != other.size()) {
                return false;
            }
            for (size_t i = 0; i < items->size(); ++i) {
                stack.emplace_back(&items->at(i), &other.at(i));
            }
        } else if (a->isDictionary() || a->isStream()) {
            if (a->isStream() && a->getStreamData() != b->getStreamData()) {
                return false;
            }
            auto const& dict = a->getDict();
            auto const& other = b->getDict();
            if (dict.size() != other.size()) {
                return false;
            }
            for (auto i1 = dict.begin(), i2 = other.begin(); i1 != dict.end(); ++i1, ++i2) {
                if (i1->first != i2->first) {
                    return false;
                }
                stack.emplace_back(&i1->second, &i2->second);
            }
        } else if (!(a->value == b->value)) {
            return false;
        }
    }
    return true;
}

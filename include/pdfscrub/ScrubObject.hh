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

#ifndef SCRUBOBJECT_HH
#define SCRUBOBJECT_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubObjGen.hh>

#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

class ScrubObject;

// Payload types for ScrubObject. Names are stored with their leading
// "/" as in PDF syntax, and dictionary keys are names.
struct Scrub_Null
{
    bool operator==(Scrub_Null const&) const = default;
};
struct Scrub_Name
{
    std::string name;
    bool operator==(Scrub_Name const&) const = default;
};
struct Scrub_String
{
    std::string val;
    bool operator==(Scrub_String const&) const = default;
};
struct Scrub_Stream
{
    std::map<std::string, ScrubObject> dict;
    std::string data;
    PDFSCRUB_DLL
    bool operator==(Scrub_Stream const&) const;
};

// ScrubObject is a PDF object held by value. Objects owned by a
// ScrubDocument live in its object map; a reference is only an object
// id and does not own anything. Copying a ScrubObject copies the whole
// value, including nested arrays, dictionaries, and stream data.
class ScrubObject
{
  public:
    typedef std::vector<ScrubObject> Array;
    typedef std::map<std::string, ScrubObject> Dictionary;

    // Constructs a null object
    PDFSCRUB_DLL
    ScrubObject();

    PDFSCRUB_DLL
    static ScrubObject newNull();
    PDFSCRUB_DLL
    static ScrubObject newBool(bool value);
    PDFSCRUB_DLL
    static ScrubObject newInteger(long long value);
    PDFSCRUB_DLL
    static ScrubObject newReal(double value);
    // The name must start with "/".
    PDFSCRUB_DLL
    static ScrubObject newName(std::string const& name);
    PDFSCRUB_DLL
    static ScrubObject newString(std::string const& str);
    PDFSCRUB_DLL
    static ScrubObject newArray(Array const& items = Array());
    PDFSCRUB_DLL
    static ScrubObject newDictionary(Dictionary const& items = Dictionary());
    // /Length is set from the data.
    PDFSCRUB_DLL
    static ScrubObject newStream(Dictionary const& dict, std::string const& data);
    PDFSCRUB_DLL
    static ScrubObject newReference(ScrubObjGen og);

    // Type queries
    PDFSCRUB_DLL
    scrub_object_type_e getTypeCode() const;
    PDFSCRUB_DLL
    char const* getTypeName() const;
    PDFSCRUB_DLL
    bool isNull() const;
    PDFSCRUB_DLL
    bool isBool() const;
    PDFSCRUB_DLL
    bool isInteger() const;
    PDFSCRUB_DLL
    bool isReal() const;
    PDFSCRUB_DLL
    bool isNumber() const;
    PDFSCRUB_DLL
    bool isName() const;
    PDFSCRUB_DLL
    bool isString() const;
    PDFSCRUB_DLL
    bool isArray() const;
    PDFSCRUB_DLL
    bool isDictionary() const;
    PDFSCRUB_DLL
    bool isStream() const;
    PDFSCRUB_DLL
    bool isReference() const;
    // True for anything that is not an array, dictionary, or stream
    PDFSCRUB_DLL
    bool isScalar() const;
    PDFSCRUB_DLL
    bool isNameAndEquals(std::string const& name) const;
    // True for dictionaries and streams whose /Type (and /Subtype, if
    // given) match. Either may be empty to match anything.
    PDFSCRUB_DLL
    bool isDictionaryOfType(std::string const& type, std::string const& subtype = "") const;

    // Scalar accessors. These throw std::logic_error on a type
    // mismatch.
    PDFSCRUB_DLL
    bool getBoolValue() const;
    PDFSCRUB_DLL
    long long getIntValue() const;
    // Integer or real
    PDFSCRUB_DLL
    double getNumericValue() const;
    PDFSCRUB_DLL
    std::string const& getName() const;
    PDFSCRUB_DLL
    std::string const& getStringValue() const;
    PDFSCRUB_DLL
    void setStringValue(std::string const& value);
    PDFSCRUB_DLL
    ScrubObjGen getRef() const;
    PDFSCRUB_DLL
    void setRef(ScrubObjGen og);

    // Arrays
    PDFSCRUB_DLL
    Array& getArray();
    PDFSCRUB_DLL
    Array const& getArray() const;
    PDFSCRUB_DLL
    size_t getArrayNItems() const;
    // Returns null for out of range
    PDFSCRUB_DLL
    ScrubObject getArrayItem(size_t n) const;
    PDFSCRUB_DLL
    void appendItem(ScrubObject const& item);

    // Dictionaries. For streams, these methods operate on the stream
    // dictionary.
    PDFSCRUB_DLL
    Dictionary& getDict();
    PDFSCRUB_DLL
    Dictionary const& getDict() const;
    PDFSCRUB_DLL
    bool hasKey(std::string const& key) const;
    // Returns null if the key is not present
    PDFSCRUB_DLL
    ScrubObject getKey(std::string const& key) const;
    PDFSCRUB_DLL
    std::set<std::string> getKeys() const;
    PDFSCRUB_DLL
    void replaceKey(std::string const& key, ScrubObject const& value);
    PDFSCRUB_DLL
    void removeKey(std::string const& key);

    // Streams
    PDFSCRUB_DLL
    std::string const& getStreamData() const;
    // Replace the data and set /Length to its size
    PDFSCRUB_DLL
    void replaceStreamData(std::string const& data);
    // The /Filter value as a string: empty if there is no filter, the
    // name for a single filter, otherwise the unparsed value.
    PDFSCRUB_DLL
    std::string getFilterKey() const;

    // Visit this object and every object nested in it, in pre-order.
    // The traversal uses an explicit stack, so arbitrarily deep
    // nesting is safe. A callback may modify the object it is given;
    // children are gathered after the callback returns.
    PDFSCRUB_DLL
    void forEach(std::function<void(ScrubObject&)> const& fn);
    PDFSCRUB_DLL
    void forEach(std::function<void(ScrubObject const&)> const& fn) const;

    // Add every reference target reachable inside this object to
    // `result'.
    PDFSCRUB_DLL
    void collectReferences(std::set<ScrubObjGen>& result) const;
    // Replace every reference inside this object with the result of
    // `fn'. Returns the number of references visited.
    PDFSCRUB_DLL
    size_t rewriteReferences(std::function<ScrubObject(ScrubObjGen)> const& fn);

    // PDF syntax for the object. Streams produce their dictionary
    // followed by the stream keyword, data, and endstream.
    PDFSCRUB_DLL
    std::string unparse() const;

    // Structural equality. Reals compare by value; stream data is
    // compared byte for byte.
    PDFSCRUB_DLL
    bool operator==(ScrubObject const& rhs) const;
    bool
    operator!=(ScrubObject const& rhs) const
    {
        return !(*this == rhs);
    }

  private:
    typedef std::variant<
        Scrub_Null,
        bool,
        long long,
        double,
        Scrub_Name,
        Scrub_String,
        Array,
        Dictionary,
        Scrub_Stream,
        ScrubObjGen>
        value_t;

    ScrubObject(value_t&& v) :
        value(std::move(v))
    {
    }

    PDFSCRUB_DLL_PRIVATE
    void typeError(char const* expected) const;

    value_t value;
};

#endif // SCRUBOBJECT_HH

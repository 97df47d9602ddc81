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

#ifndef SCRUBOBJGEN_HH
#define SCRUBOBJGEN_HH

#include <pdfscrub/DLL.h>

#include <cstdint>
#include <functional>
#include <iostream>
#include <set>
#include <string>

// This class represents an object number and generation pair. It is
// suitable to use as a key in a map or set and is ordered by object
// number and then by generation.

class ScrubObjGen
{
  public:
    ScrubObjGen() = default;
    ScrubObjGen(uint32_t obj, uint16_t gen = 0) :
        obj(obj),
        gen(gen)
    {
    }
    bool
    operator<(ScrubObjGen const& rhs) const
    {
        return (obj < rhs.obj) || (obj == rhs.obj && gen < rhs.gen);
    }
    bool
    operator==(ScrubObjGen const& rhs) const
    {
        return obj == rhs.obj && gen == rhs.gen;
    }
    bool
    operator!=(ScrubObjGen const& rhs) const
    {
        return !(*this == rhs);
    }
    uint32_t
    getObj() const
    {
        return obj;
    }
    uint16_t
    getGen() const
    {
        return gen;
    }
    bool
    isIndirect() const
    {
        return obj != 0;
    }
    std::string
    unparse(char separator = ',') const
    {
        return std::to_string(obj) + separator + std::to_string(gen);
    }
    // The "N G R" form used in messages and in serialized output
    std::string
    toRef() const
    {
        return std::to_string(obj) + " " + std::to_string(gen) + " R";
    }
    friend std::ostream&
    operator<<(std::ostream& os, ScrubObjGen og)
    {
        os << og.obj << "," << og.gen;
        return os;
    }

    struct hash
    {
        size_t
        operator()(ScrubObjGen const& og) const noexcept
        {
            return std::hash<uint64_t>()((uint64_t(og.obj) << 16) | og.gen);
        }
    };

    // Convenience class for loop detection when traversing objects.
    //
    // The 'add' method tests whether an ScrubObjGen is present in the
    // set and inserts it in a single operation. Attempts to insert
    // ScrubObjGen(0, 0) are ignored.
    //
    // Usage example:
    //
    // while (!queue.empty()) {
    //     auto og = pop(queue);
    //     if (seen.add(og)) {
    //         // handle first encounter of og
    //     }
    // }
    class set: public std::set<ScrubObjGen>
    {
      public:
        bool
        add(ScrubObjGen og)
        {
            if (og.isIndirect()) {
                return emplace(og).second;
            }
            return true;
        }

        void
        erase(ScrubObjGen og)
        {
            if (og.isIndirect()) {
                std::set<ScrubObjGen>::erase(og);
            }
        }
    };

  private:
    // This class does not use the Members pattern to avoid a memory
    // allocation for every one of these. A lot of these get created
    // and destroyed.
    uint32_t obj{0};
    uint16_t gen{0};
};

#endif // SCRUBOBJGEN_HH

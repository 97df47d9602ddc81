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

#ifndef SCRUBRESOURCETRACKER_HH
#define SCRUBRESOURCETRACKER_HH

#include <pdfscrub/DLL.h>

#include <atomic>
#include <cstddef>

// Explicit accounting of decode buffers. A tracker is created by the
// caller (normally ScrubJob) and passed by reference to the components
// that allocate large buffers. It is safe to use from several threads.
class ScrubResourceTracker
{
  public:
    // A limit of 0 means unlimited.
    PDFSCRUB_DLL
    explicit ScrubResourceTracker(size_t limit = 0);

    // Record `bytes' as in use. Throws ScrubExc with
    // scrub_e_processing, leaving the counters unchanged, if the limit
    // would be exceeded.
    PDFSCRUB_DLL
    void allocate(size_t bytes);
    PDFSCRUB_DLL
    void release(size_t bytes);

    PDFSCRUB_DLL
    size_t getCurrent() const;
    PDFSCRUB_DLL
    size_t getPeak() const;
    PDFSCRUB_DLL
    size_t getLimit() const;
    PDFSCRUB_DLL
    void setLimit(size_t limit);

    // RAII holder that releases whatever it allocated on destruction.
    class Reservation
    {
      public:
        Reservation(ScrubResourceTracker* tracker) :
            tracker(tracker)
        {
        }
        ~Reservation()
        {
            if (tracker && bytes) {
                tracker->release(bytes);
            }
        }
        Reservation(Reservation const&) = delete;
        Reservation& operator=(Reservation const&) = delete;

        void
        add(size_t n)
        {
            if (tracker) {
                tracker->allocate(n);
            }
            bytes += n;
        }

        size_t
        size() const
        {
            return bytes;
        }

      private:
        ScrubResourceTracker* tracker;
        size_t bytes{0};
    };

  private:
    ScrubResourceTracker(ScrubResourceTracker const&) = delete;
    ScrubResourceTracker& operator=(ScrubResourceTracker const&) = delete;

    std::atomic<size_t> current{0};
    std::atomic<size_t> peak{0};
    std::atomic<size_t> limit;
};

#endif // SCRUBRESOURCETRACKER_HH

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

#ifndef SCRUBWORKERPOOL_HH
#define SCRUBWORKERPOOL_HH

#include <pdfscrub/DLL.h>

#include <functional>
#include <memory>

// A fixed set of worker threads that run submitted tasks in FIFO
// order. ScrubJob uses a pool to run per-object work across distinct
// objects; each task must touch only its own object and its own result
// slot.
//
// A pool created with zero threads runs each task synchronously in
// submit().
//
// If a task throws, the first exception is kept and rethrown by the
// next call to waitAll(). Later exceptions from the same batch are
// dropped after being counted; see getFailedTaskCount().
class ScrubWorkerPool
{
  public:
    PDFSCRUB_DLL
    explicit ScrubWorkerPool(size_t threads);
    // Stops accepting tasks, finishes the queued ones, and joins the
    // threads.
    PDFSCRUB_DLL
    ~ScrubWorkerPool();

    PDFSCRUB_DLL
    void submit(std::function<void()> task);

    // Block until every submitted task has finished. This is the
    // barrier between stages.
    PDFSCRUB_DLL
    void waitAll();

    // Call fn(0) ... fn(n - 1), on `pool' if it is not null and
    // otherwise in the calling thread, and wait for all of them.
    PDFSCRUB_DLL
    static void forEachIndex(ScrubWorkerPool* pool, size_t n, std::function<void(size_t)> const& fn);

    PDFSCRUB_DLL
    size_t getThreadCount() const;
    PDFSCRUB_DLL
    size_t getFailedTaskCount() const;

  private:
    ScrubWorkerPool(ScrubWorkerPool const&) = delete;
    ScrubWorkerPool& operator=(ScrubWorkerPool const&) = delete;

    void workerThread();
    void runTask(std::function<void()> const& task);

    class Members;

    std::unique_ptr<Members> m;
};

#endif // SCRUBWORKERPOOL_HH

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

#ifndef SCRUBSTEGODETECTOR_HH
#define SCRUBSTEGODETECTOR_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubFinding.hh>
#include <pdfscrub/ScrubIssue.hh>
#include <pdfscrub/ScrubObjGen.hh>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class ScrubDocument;
class ScrubObject;
class ScrubResourceTracker;
class ScrubWorkerPool;

// ScrubStegoDetector looks for statistical traces of hidden data.
//
// Image streams (/Subtype /Image) are decoded (DCT through libjpeg,
// Flate, or unfiltered) and, when they have 8 bits per component, their
// samples are analyzed in two ways:
//
//   LSB: for each of the first three channels, the ratio of pixels
//   whose low bit is set and the ratio of adjacent pixels whose low
//   bits differ. Both are 0.5 for random low bits. Each channel scores
//   1 - (|ones - 0.5| + |flips - 0.5|), clamped to [0, 1], and the
//   confidence is the weighted mean of the channel scores.
//
//   Histogram: the luma histogram's mean and standard deviation, and a
//   pairs-of-values statistic measuring how evenly each pair of bins
//   (2k, 2k+1) is balanced, damped for images with little spread.
//
// A finding is reported when a confidence exceeds
// statistical_threshold. Findings only say that hiding is suspected.
//
// Strings in the Info dictionary with high byte entropy and content
// streams that select invisible text (3 Tr) are also reported.
class ScrubStegoDetector
{
  public:
    struct DetectionConfig
    {
        double statistical_threshold{0.8};
        bool analyze_images{true};
        bool analyze_metadata{true};
        bool analyze_content{true};
        // Bits per byte
        double entropy_threshold{4.5};
        size_t entropy_min_length{64};
        // Images with fewer pixels are not analyzed.
        size_t min_pixels{64};
    };

    struct ImageFeatures
    {
        size_t pixels{0};
        size_t components{0};
        std::vector<double> lsb_ratios;
        std::vector<double> transition_ratios;
        double lsb_confidence{0.0};
        double luma_mean{0.0};
        double luma_stddev{0.0};
        double histogram_confidence{0.0};
    };

    struct Stats
    {
        size_t objects_analyzed{0};
        size_t patterns_detected{0};
        size_t suspicious_objects{0};
        size_t images_analyzed{0};
        size_t images_skipped{0};
        std::chrono::microseconds duration{0};
    };

    PDFSCRUB_DLL
    ScrubStegoDetector();
    PDFSCRUB_DLL
    explicit ScrubStegoDetector(DetectionConfig const& config);
    PDFSCRUB_DLL
    ~ScrubStegoDetector();

    PDFSCRUB_DLL
    DetectionConfig const& getConfig() const;
    PDFSCRUB_DLL
    void setResourceTracker(ScrubResourceTracker* tracker);

    // Number of components for a /ColorSpace value, resolving
    // references through `doc'. Returns 0 if it can't be determined.
    PDFSCRUB_DLL
    static int getComponents(ScrubObject const& color_space, ScrubDocument const& doc);

    // Compute features for interleaved 8-bit samples.
    PDFSCRUB_DLL
    static ImageFeatures analyzeSamples(std::string const& samples, size_t components);

    // Decode an image stream to 8-bit samples. Returns nullopt, setting
    // `reason', if the image can't be analyzed. `components' is set
    // from the decoder or the color space.
    PDFSCRUB_DLL
    std::optional<std::string> decodeImage(
        ScrubObject const& stream,
        ScrubDocument const& doc,
        size_t& components,
        std::string& reason) const;

    // Analyze one object. `is_info' marks the trailer's /Info object.
    PDFSCRUB_DLL
    std::vector<ScrubFinding> analyzeObject(
        ScrubObjGen og,
        ScrubObject const& obj,
        ScrubDocument const& doc,
        bool is_info,
        std::vector<ScrubIssue>& issues,
        Stats& stats) const;

    // Analyze every object, on `pool' if given. Findings are returned
    // in ascending object order; issues are recorded on the document.
    PDFSCRUB_DLL
    std::vector<ScrubFinding> analyzeDocument(ScrubDocument& doc, ScrubWorkerPool* pool = nullptr);

    PDFSCRUB_DLL
    Stats const& getStats() const;
    PDFSCRUB_DLL
    void reset();

  private:
    ScrubStegoDetector(ScrubStegoDetector const&) = delete;
    ScrubStegoDetector& operator=(ScrubStegoDetector const&) = delete;

    void analyzeImage(
        ScrubObjGen og,
        ScrubObject const& obj,
        ScrubDocument const& doc,
        std::vector<ScrubFinding>& result,
        std::vector<ScrubIssue>& issues,
        Stats& stats) const;
    void analyzeContent(
        ScrubObjGen og,
        ScrubObject const& obj,
        std::vector<ScrubFinding>& result,
        std::vector<ScrubIssue>& issues) const;

    class Members;

    std::unique_ptr<Members> m;
};

#endif // SCRUBSTEGODETECTOR_HH

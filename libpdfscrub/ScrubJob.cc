#include <pdfscrub/ScrubJob.hh>

#include <pdfscrub/ScrubDocument_private.hh>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubLogger.hh>
#include <pdfscrub/ScrubResourceTracker.hh>
#include <pdfscrub/ScrubWorkerPool.hh>

#include <atomic>
#include <stdexcept>

using namespace pdfscrub;

class ScrubJob::Members
{
    friend class ScrubJob;

  public:
    Members(Config const& config) :
        config(config),
        tracker(config.memory_limit),
        scanner(config.scanning),
        detector(config.detection)
    {
        scanner.setResourceTracker(&tracker);
        detector.setResourceTracker(&tracker);
    }
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    Config config;
    std::shared_ptr<ScrubLogger> log{ScrubLogger::defaultLogger()};
    ScrubResourceTracker tracker;
    ScrubForensicScanner scanner;
    ScrubStegoDetector detector;
    std::unique_ptr<ScrubWorkerPool> pool;
    std::unique_ptr<ScrubEncryptor> encryptor;
    std::atomic<bool> cancelled{false};
};

namespace
{
    std::vector<std::string> const stage_names{
        "Reference-Map",
        "Reachability",
        "Dedup",
        "Stream-Merge",
        "Compact",
        "XRef-Rebuild",
        "Content-Sanitize",
        "Binary-Sanitize",
        "Metadata-Strip",
        "Final-Cleanup",
        "Encrypt",
    };

    void
    check_fraction(double value, char const* what)
    {
        if (!(value >= 0.0 && value <= 1.0)) {
            throw ScrubExc(
                scrub_e_config, "configure", "", std::string(what) + " must be between 0 and 1");
        }
    }
} // namespace

ScrubJob::ScrubJob() :
    ScrubJob(Config())
{
}

ScrubJob::ScrubJob(Config const& config)
{
    validateConfig(config);
    m = std::make_unique<Members>(config);
    if (config.worker_threads > 0) {
        m->pool = std::make_unique<ScrubWorkerPool>(config.worker_threads);
    }
    if (config.encryption) {
        m->encryptor = std::make_unique<ScrubEncryptor>(*config.encryption);
    } else {
        m->encryptor = std::make_unique<ScrubEncryptor>();
    }
}

// Must be explicit and not inline -- see PDFSCRUB_DLL_CLASS in DLL.h
ScrubJob::~ScrubJob() = default;

void
ScrubJob::validateConfig(Config const& config)
{
    check_fraction(config.scanning.confidence_threshold, "scanning confidence threshold");
    check_fraction(config.detection.statistical_threshold, "statistical threshold");
    if (config.detection.entropy_threshold < 0.0 || config.detection.entropy_threshold > 8.0) {
        throw ScrubExc(
            scrub_e_config, "configure", "", "entropy threshold must be between 0 and 8");
    }
    if (config.stream_merge.allowed_filters.empty()) {
        throw ScrubExc(
            scrub_e_config, "configure", "", "stream merge must allow at least one filter");
    }
    if (config.encryption) {
        ScrubEncryptor::validateConfig(*config.encryption);
    }
}

ScrubJob::Config const&
ScrubJob::getConfig() const
{
    return m->config;
}

void
ScrubJob::setLogger(std::shared_ptr<ScrubLogger> l)
{
    m->log = l;
}

std::shared_ptr<ScrubLogger>
ScrubJob::getLogger() const
{
    return m->log;
}

ScrubEncryptor&
ScrubJob::getEncryptor()
{
    return *m->encryptor;
}

void
ScrubJob::cancel()
{
    m->cancelled = true;
}

bool
ScrubJob::isCancelled() const
{
    return m->cancelled;
}

std::vector<std::string> const&
ScrubJob::getStageNames()
{
    return stage_names;
}

void
ScrubJob::echoIssues(ScrubDocument const& doc, size_t from)
{
    if (!m->config.verbose) {
        return;
    }
    auto const& issues = doc.getIssues();
    for (size_t i = from; i < issues.size(); ++i) {
        m->log->warn(issues.at(i).unparse() + "\n");
    }
}

bool
ScrubJob::runStage(
    std::string const& name,
    ScrubDocument& doc,
    Result& result,
    std::function<size_t(ScrubDocument&)> const& fn)
{
    auto start = std::chrono::steady_clock::now();
    size_t issues_before = doc.getIssues().size();
    StageResult stage;
    stage.name = name;
    debug(m->log, "starting " + name);

    ScrubDocument backup = doc;
    try {
        stage.changes = fn(doc);
    } catch (ScrubExc& e) {
        if (e.getErrorCode() == scrub_e_structure || e.getErrorCode() == scrub_e_config ||
            e.getErrorCode() == scrub_e_invalid_encryption_config) {
            throw;
        }
        doc = std::move(backup);
        doc.addIssue(ScrubIssue(
            ScrubIssue::l_error, e.getErrorCode(), std::nullopt, name + " failed: " + e.what()));
        stage.succeeded = false;
    } catch (std::runtime_error& e) {
        doc = std::move(backup);
        doc.addIssue(ScrubIssue(
            ScrubIssue::l_error, scrub_e_processing, std::nullopt, name + " failed: " + e.what()));
        stage.succeeded = false;
    }

    stage.duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    debug(
        m->log,
        name + (stage.succeeded ? " finished" : " failed") + " with " +
            std::to_string(stage.changes) + " changes");
    echoIssues(doc, issues_before);
    result.stages.push_back(stage);
    return stage.succeeded;
}

std::vector<ScrubFinding>
ScrubJob::scan(ScrubDocument& doc)
{
    size_t issues_before = doc.getIssues().size();
    auto findings = m->scanner.scanDocument(doc, m->pool.get());
    auto more = m->detector.analyzeDocument(doc, m->pool.get());
    findings.insert(findings.end(), more.begin(), more.end());
    echoIssues(doc, issues_before);
    debug(m->log, "scan found " + std::to_string(findings.size()) + " findings");
    return findings;
}

void
ScrubJob::encrypt(ScrubDocument& doc)
{
    if (!m->config.encryption) {
        throw std::logic_error("ScrubJob::encrypt called without an encryption configuration");
    }
    m->encryptor->encryptDocument(doc, m->pool.get());
}

ScrubJob::Result
ScrubJob::run(ScrubDocument doc)
{
    auto start = std::chrono::steady_clock::now();
    auto const& config = m->config;
    auto const& cleaning = config.cleaning;
    doc.setLogger(m->log);

    if (!doc.hasValidRoot()) {
        throw ScrubExc(scrub_e_structure, "run", "", "document root does not resolve");
    }

    Result result;
    auto processing = config.processing;
    if (cleaning.remove_hidden) {
        processing.remove_comments = true;
        processing.remove_unused_resources = !cleaning.preserve_functionality;
    }
    if (cleaning.preserve_functionality) {
        processing.remove_unused_resources = false;
    }
    ScrubContentSanitizer content(processing);
    ScrubBinarySanitizer binary;
    ScrubMetadataSanitizer metadata;
    content.setResourceTracker(&m->tracker);
    binary.setResourceTracker(&m->tracker);
    auto* pool = m->pool.get();

    auto stopped = [this, &result]() {
        if (m->cancelled) {
            result.cancelled = true;
            debug(m->log, "job cancelled");
        }
        return result.cancelled;
    };

    if (config.scan_before && !stopped()) {
        result.findings_before = scan(doc);
    }

    ScrubDocument::ReferenceMap refs;
    struct Stage
    {
        char const* name;
        bool enabled;
        std::function<size_t(ScrubDocument&)> fn;
    };
    std::vector<Stage> stages{
        {"Reference-Map",
         cleaning.clean_structure,
         [&refs](ScrubDocument& d) {
             refs = d.getReferenceMap();
             return size_t(0);
         }},
        {"Reachability",
         cleaning.clean_structure,
         [&refs](ScrubDocument& d) { return d.removeUnreachable(refs); }},
        {"Dedup",
         cleaning.clean_structure,
         [](ScrubDocument& d) { return d.deduplicateObjects(); }},
        {"Stream-Merge",
         cleaning.clean_streams,
         [&config](ScrubDocument& d) { return d.mergeSmallStreams(config.stream_merge); }},
        {"Compact",
         cleaning.clean_structure,
         [](ScrubDocument& d) {
             size_t changed = 0;
             for (auto const& [from, to]: d.compactObjectNumbers()) {
                 if (from != to) {
                     ++changed;
                 }
             }
             return changed;
         }},
        {"XRef-Rebuild",
         cleaning.clean_structure,
         [](ScrubDocument& d) { return d.rebuildXRef().size(); }},
        {"Content-Sanitize",
         cleaning.clean_content,
         [&content, pool](ScrubDocument& d) {
             return content.sanitizeDocument(d, pool) + content.removeUnusedResources(d);
         }},
        {"Binary-Sanitize",
         cleaning.clean_binary,
         [&binary, pool](ScrubDocument& d) { return binary.sanitizeDocument(d, pool); }},
        {"Metadata-Strip",
         cleaning.remove_metadata,
         [&metadata](ScrubDocument& d) { return metadata.sanitizeDocument(d); }},
    };

    bool changed_after_xref = false;
    bool xref_built = false;
    for (auto const& stage: stages) {
        if (stopped()) {
            break;
        }
        if (!stage.enabled) {
            continue;
        }
        std::string name = stage.name;
        bool ok = runStage(name, doc, result, stage.fn);
        if (name == "XRef-Rebuild") {
            xref_built = ok;
        } else if (xref_built && ok && result.stages.back().changes > 0) {
            changed_after_xref = true;
        }
    }

    if (changed_after_xref && !stopped()) {
        runStage("Final-Cleanup", doc, result, [](ScrubDocument& d) {
            size_t changes = d.removeUnreachable();
            d.compactObjectNumbers();
            d.rebuildXRef();
            return changes;
        });
    }

    if (config.scan_after && !stopped()) {
        result.findings_after = scan(doc);
    }

    if (config.encryption && !stopped()) {
        runStage("Encrypt", doc, result, [this, pool](ScrubDocument& d) {
            m->encryptor->encryptDocument(d, pool);
            return m->encryptor->getStats().objects_encrypted;
        });
    }

    result.issues = doc.getIssues();
    result.structure = doc.getStructureStats();
    result.content = content.getStats();
    result.binary = binary.getStats();
    result.metadata = metadata.getStats();
    result.encryption = m->encryptor->getStats();
    result.scanning = m->scanner.getStats();
    result.detection = m->detector.getStats();
    result.peak_memory = m->tracker.getPeak();
    result.duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    result.document = std::move(doc);
    return result;
}

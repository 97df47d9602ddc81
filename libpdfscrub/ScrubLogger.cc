#include <pdfscrub/ScrubLogger.hh>

#include <pdfscrub/Pl_Discard.hh>
#include <pdfscrub/Pl_OStream.hh>

#include <iostream>
#include <stdexcept>

ScrubLogger::Members::Members() :
    p_discard(new Pl_Discard()),
    p_stdout(new Pl_OStream("standard output", std::cout)),
    p_stderr(new Pl_OStream("standard error", std::cerr)),
    p_info(p_stdout),
    p_warn(nullptr),
    p_error(p_stderr)
{
}

ScrubLogger::Members::~Members()
{
    p_stdout->finish();
    p_stderr->finish();
}

ScrubLogger::ScrubLogger() :
    m(new Members())
{
}

std::shared_ptr<ScrubLogger>
ScrubLogger::create()
{
    return std::shared_ptr<ScrubLogger>(new ScrubLogger);
}

std::shared_ptr<ScrubLogger>
ScrubLogger::defaultLogger()
{
    static auto l = create();
    return l;
}

void
ScrubLogger::info(char const* s)
{
    getInfo(false)->writeCStr(s);
}

void
ScrubLogger::info(std::string const& s)
{
    getInfo(false)->writeString(s);
}

std::shared_ptr<Pipeline>
ScrubLogger::getInfo(bool null_okay)
{
    return throwIfNull(m->p_info, null_okay);
}

void
ScrubLogger::warn(char const* s)
{
    getWarn(false)->writeCStr(s);
}

void
ScrubLogger::warn(std::string const& s)
{
    getWarn(false)->writeString(s);
}

std::shared_ptr<Pipeline>
ScrubLogger::getWarn(bool null_okay)
{
    if (m->p_warn) {
        return m->p_warn;
    }
    return getError(null_okay);
}

void
ScrubLogger::error(char const* s)
{
    getError(false)->writeCStr(s);
}

void
ScrubLogger::error(std::string const& s)
{
    getError(false)->writeString(s);
}

std::shared_ptr<Pipeline>
ScrubLogger::getError(bool null_okay)
{
    return throwIfNull(m->p_error, null_okay);
}

std::shared_ptr<Pipeline>
ScrubLogger::standardOutput()
{
    return m->p_stdout;
}

std::shared_ptr<Pipeline>
ScrubLogger::standardError()
{
    return m->p_stderr;
}

std::shared_ptr<Pipeline>
ScrubLogger::discard()
{
    return m->p_discard;
}

void
ScrubLogger::setInfo(std::shared_ptr<Pipeline> p)
{
    if (p == nullptr) {
        p = m->p_stdout;
    }
    m->p_info = p;
}

void
ScrubLogger::setWarn(std::shared_ptr<Pipeline> p)
{
    m->p_warn = p;
}

void
ScrubLogger::setError(std::shared_ptr<Pipeline> p)
{
    if (p == nullptr) {
        p = m->p_stderr;
    }
    m->p_error = p;
}

void
ScrubLogger::setOutputStreams(std::ostream* out_stream, std::ostream* err_stream)
{
    if (out_stream == &std::cout) {
        out_stream = nullptr;
    }
    if (err_stream == &std::cerr) {
        err_stream = nullptr;
    }
    std::shared_ptr<Pipeline> new_out;
    std::shared_ptr<Pipeline> new_err;

    if (out_stream == nullptr) {
        new_out = m->p_stdout;
    } else {
        new_out = std::make_shared<Pl_OStream>("output", *out_stream);
    }
    if (err_stream == nullptr) {
        new_err = m->p_stderr;
    } else {
        new_err = std::make_shared<Pl_OStream>("error output", *err_stream);
    }
    m->p_info = new_out;
    m->p_warn = nullptr;
    m->p_error = new_err;
}

std::shared_ptr<Pipeline>
ScrubLogger::throwIfNull(std::shared_ptr<Pipeline> p, bool null_okay)
{
    if (!(null_okay || p)) {
        throw std::logic_error("ScrubLogger: requested a null pipeline without null_okay == true");
    }
    return p;
}

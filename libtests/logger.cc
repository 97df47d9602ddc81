#include <pdfscrub/assert_test.h>

#include <pdfscrub/Pl_String.hh>
#include <pdfscrub/ScrubLogger.hh>

#include <iostream>
#include <sstream>
#include <stdexcept>

static void
test_default()
{
    auto logger = ScrubLogger::defaultLogger();
    assert(logger == ScrubLogger::defaultLogger());

    logger->info("info to stdout\n");
    logger->warn("warn to stderr\n");
    logger->error("error to stderr\n");
    assert(logger->getInfo() == logger->standardOutput());
    assert(logger->getWarn() == logger->standardError());
    *(logger->getInfo()) << "stage " << 3 << " of " << 13 << "\n";

    logger->setWarn(logger->discard());
    logger->warn("warning not seen\n");
    logger->setWarn(nullptr);
    logger->warn("restored warning to stderr\n");
}

static void
test_error_warning()
{
    auto l = ScrubLogger::create();

    // Warning follows error when error is set explicitly.
    std::string errors;
    auto pl_error = std::make_shared<Pl_String>("errors", nullptr, errors);
    l->setError(pl_error);
    l->warn("warn follows error\n");
    assert(errors == "warn follows error\n");
    l->error("error too\n");
    assert(errors == "warn follows error\nerror too\n");

    // Set warnings -- now they're separate
    std::string warnings;
    auto pl_warn = std::make_shared<Pl_String>("warnings", nullptr, warnings);
    l->setWarn(pl_warn);
    l->warn(std::string("warning now separate\n"));
    l->error(std::string("new error\n"));
    assert(warnings == "warning now separate\n");
    assert(errors == "warn follows error\nerror too\nnew error\n");
    std::string errors2;
    pl_error = std::make_shared<Pl_String>("errors", nullptr, errors2);
    l->setError(pl_error);
    l->warn("new warning\n");
    l->error("another new error\n");
    assert(warnings == "warning now separate\nnew warning\n");
    assert(errors == "warn follows error\nerror too\nnew error\n");
    assert(errors2 == "another new error\n");

    // Restore warnings to default -- follows error again
    l->setWarn(nullptr);
    l->warn("warning 3\n");
    l->error("error 3\n");
    assert(warnings == "warning now separate\nnew warning\n");
    assert(errors2 == "another new error\nwarning 3\nerror 3\n");

    l->setInfo(nullptr);
    l->setWarn(nullptr);
    l->setError(nullptr);
    assert(l->getInfo() == l->standardOutput());
    assert(l->getError() == l->standardError());
}

static void
test_output_streams()
{
    auto l = ScrubLogger::create();
    std::ostringstream out;
    std::ostringstream err;
    std::string warnings;
    l->setWarn(std::make_shared<Pl_String>("warnings", nullptr, warnings));

    // Warnings are cleared so they follow the new error stream.
    l->setOutputStreams(&out, &err);
    l->info("progress\n");
    l->warn("issue\n");
    l->error("failure\n");
    assert(out.str() == "progress\n");
    assert(err.str() == "issue\nfailure\n");
    assert(warnings.empty());

    l->setOutputStreams(nullptr, nullptr);
    assert(l->getInfo() == l->standardOutput());
    assert(l->getWarn() == l->standardError());
}

static void
test_discard()
{
    auto l = ScrubLogger::create();
    l->setInfo(l->discard());
    l->setError(l->discard());
    l->info("not seen\n");
    l->warn("not seen\n");
    l->error("not seen\n");
    assert(l->getWarn(true) == l->discard());
}

int
main()
{
    test_default();
    test_error_warning();
    test_output_streams();
    test_discard();
    std::cout << "logger tests passed" << std::endl;
    return 0;
}

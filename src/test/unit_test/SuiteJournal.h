#ifndef TIERLEND_TEST_UNIT_TEST_SUITE_JOURNAL_H
#define TIERLEND_TEST_UNIT_TEST_SUITE_JOURNAL_H

#include <xrpl/basics/Log.h>
#include <xrpl/beast/unit_test.h>
#include <xrpl/beast/utility/Journal.h>

#include <memory>
#include <string>

namespace tierlend {
namespace test {

// A Journal::Sink intended for use with the beast unit test framework.
class SuiteJournalSink : public beast::Journal::Sink
{
    std::string partition_;
    beast::unit_test::suite& suite_;

public:
    SuiteJournalSink(
        std::string const& partition,
        beast::severities::Severity threshold,
        beast::unit_test::suite& suite)
        : Sink(threshold, false), partition_(partition + " "), suite_(suite)
    {
    }

    // For unit testing, always generate logging text.
    inline bool
    active(beast::severities::Severity level) const override
    {
        return true;
    }

    void
    write(beast::severities::Severity level, std::string const& text) override
    {
        if (level < threshold())
            return;
        writeAlways(level, text);
    }

    void
    writeAlways(beast::severities::Severity level, std::string const& text)
        override
    {
        using namespace beast::severities;

        char const* const s = [level]() {
            switch (level)
            {
                case kTrace:
                    return "TRC:";
                case kDebug:
                    return "DBG:";
                case kInfo:
                    return "INF:";
                case kWarning:
                    return "WRN:";
                case kError:
                    return "ERR:";
                default:
                    break;
                case kFatal:
                    break;
            }
            return "FTL:";
        }();

        // Only write the string if the level at least equals the threshold.
        if (level >= threshold())
            suite_.log << s << partition_ << text << std::endl;
    }
};

/** Logs whose journals write to the running suite's log. */
class SuiteLogs : public ripple::Logs
{
    beast::unit_test::suite& suite_;

public:
    explicit SuiteLogs(
        beast::unit_test::suite& suite,
        beast::severities::Severity level = beast::severities::kError)
        : Logs(level), suite_(suite)
    {
    }

    ~SuiteLogs() override = default;

    std::unique_ptr<beast::Journal::Sink>
    makeSink(
        std::string const& partition,
        beast::severities::Severity threshold) override
    {
        return std::make_unique<SuiteJournalSink>(partition, threshold, suite_);
    }
};

}  // namespace test
}  // namespace tierlend

#endif

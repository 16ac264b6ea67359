#include <libumbra/basics/Errors.h>
#include <libumbra/basics/Journal.h>
#include <test/support/CaptureSink.h>

#include <gtest/gtest.h>

#include <atomic>
#include <sstream>
#include <thread>
#include <vector>

namespace umbra {
namespace {

TEST(Journal, WritesOneMessagePerStatement)
{
    test::CaptureSink sink(Journal::Severity::debug);
    Journal j(sink);

    JLOG(j.info()) << "appended leaf " << 7 << " of " << 16;
    JLOG(j.warn()) << "second";

    auto const messages = sink.messages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].first, Journal::Severity::info);
    EXPECT_EQ(messages[0].second, "appended leaf 7 of 16");
    EXPECT_EQ(messages[1].first, Journal::Severity::warning);
}

TEST(Journal, SkipsFormattingBelowThreshold)
{
    test::CaptureSink sink(Journal::Severity::warning);
    Journal j(sink);

    int evaluated = 0;
    auto expensive = [&] {
        ++evaluated;
        return "value";
    };
    JLOG(j.debug()) << expensive();
    JLOG(j.error()) << expensive();

    EXPECT_EQ(evaluated, 1);
    EXPECT_EQ(sink.messages().size(), 1u);
}

TEST(Journal, NullSinkIsInactive)
{
    Journal j(Journal::nullSink());
    EXPECT_FALSE(j.fatal());
    EXPECT_FALSE(j.trace());
}

TEST(Journal, StreamSinkTagsSeverity)
{
    std::ostringstream out;
    StreamSink sink(out, Journal::Severity::info);
    Journal j(sink);

    JLOG(j.error()) << "circuit missing";
    JLOG(j.debug()) << "hidden";

    auto const text = out.str();
    EXPECT_NE(text.find("circuit missing"), std::string::npos);
    EXPECT_NE(text.find(to_string(Journal::Severity::error)), std::string::npos);
    EXPECT_EQ(text.find("hidden"), std::string::npos);
}

TEST(Journal, ThresholdChangesWhileLogging)
{
    test::CaptureSink sink(Journal::Severity::error);
    Journal j(sink);

    std::atomic<bool> stop{false};
    std::vector<std::thread> writers;
    for (int i = 0; i < 4; ++i)
        writers.emplace_back([&] {
            while (!stop)
                JLOG(j.info()) << "tick";
        });

    for (int i = 0; i < 1000; ++i)
        sink.threshold(i % 2 ? Journal::Severity::trace : Journal::Severity::error);
    sink.threshold(Journal::Severity::fatal);
    stop = true;
    for (auto& t : writers)
        t.join();

    EXPECT_EQ(sink.threshold(), Journal::Severity::fatal);
    EXPECT_FALSE(j.info());
    for (auto const& m : sink.messages())
        EXPECT_EQ(m.first, Journal::Severity::info);
}

TEST(Journal, SeverityNames)
{
    for (auto const level :
         {Journal::Severity::trace,
          Journal::Severity::debug,
          Journal::Severity::info,
          Journal::Severity::warning,
          Journal::Severity::error,
          Journal::Severity::fatal})
        EXPECT_EQ(severityFromString(to_string(level)), level);

    EXPECT_THROW(severityFromString("loud"), InputValidationError);
}

}  // namespace
}  // namespace umbra

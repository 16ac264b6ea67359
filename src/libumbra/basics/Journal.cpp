#include <libumbra/basics/Journal.h>
#include <libumbra/basics/Errors.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace umbra {

Journal::Sink::Sink(Severity threshold) : threshold_(threshold)
{
}

bool
Journal::Sink::active(Severity level) const
{
    return level != Severity::disabled && level >= threshold_.load();
}

Journal::Severity
Journal::Sink::threshold() const
{
    return threshold_.load();
}

void
Journal::Sink::threshold(Severity level)
{
    threshold_.store(level);
}

Journal::ScopedStream::ScopedStream(Sink& sink, Severity level)
    : sink_(sink), level_(level)
{
}

Journal::ScopedStream::~ScopedStream()
{
    std::string const text = ss_.str();
    if (!text.empty())
        sink_.write(level_, text);
}

Journal::ScopedStream&
Journal::ScopedStream::operator<<(std::ostream& (*manip)(std::ostream&))
{
    ss_ << manip;
    return *this;
}

namespace {

class NullSink : public Journal::Sink
{
public:
    NullSink() : Sink(Journal::Severity::disabled)
    {
    }

    bool
    active(Journal::Severity) const override
    {
        return false;
    }

    void
    write(Journal::Severity, std::string const&) override
    {
    }
};

}  // namespace

Journal::Sink&
Journal::nullSink()
{
    static NullSink sink;
    return sink;
}

//------------------------------------------------------------------------------

StreamSink::StreamSink(std::ostream& out, Journal::Severity threshold)
    : Sink(threshold), out_(out)
{
}

void
StreamSink::write(Journal::Severity level, std::string const& text)
{
    using namespace std::chrono;
    auto const now = system_clock::now();
    auto const t = system_clock::to_time_t(now);
    auto const ms =
        duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
         << std::setfill('0') << ms << std::setfill(' ') << "Z "
         << to_string(level) << ": " << text << '\n';
    out_.flush();
}

std::string
to_string(Journal::Severity level)
{
    switch (level)
    {
        case Journal::Severity::trace:
            return "TRC";
        case Journal::Severity::debug:
            return "DBG";
        case Journal::Severity::info:
            return "NFO";
        case Journal::Severity::warning:
            return "WRN";
        case Journal::Severity::error:
            return "ERR";
        case Journal::Severity::fatal:
            return "FTL";
        case Journal::Severity::disabled:
            break;
    }
    return "---";
}

Journal::Severity
severityFromString(std::string const& name)
{
    std::string s(name);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (s == "trace" || s == "trc")
        return Journal::Severity::trace;
    if (s == "debug" || s == "dbg")
        return Journal::Severity::debug;
    if (s == "info" || s == "nfo")
        return Journal::Severity::info;
    if (s == "warning" || s == "warn" || s == "wrn")
        return Journal::Severity::warning;
    if (s == "error" || s == "err")
        return Journal::Severity::error;
    if (s == "fatal" || s == "ftl")
        return Journal::Severity::fatal;
    if (s == "disabled")
        return Journal::Severity::disabled;
    throw InputValidationError("unknown log severity: " + name);
}

}  // namespace umbra

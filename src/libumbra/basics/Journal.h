#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace umbra {

/**
 * Severity-filtered logging handle.
 *
 * A Journal is a cheap value wrapping a reference to a Sink. Components
 * take a Journal by value at construction and log through the streams:
 *
 *     JLOG(j_.info()) << "appended leaf " << index;
 *
 * JLOG skips formatting entirely when the stream is below the sink's
 * threshold.
 */
class Journal
{
public:
    enum class Severity { trace = 0, debug, info, warning, error, fatal, disabled };

    class Sink
    {
    public:
        explicit Sink(Severity threshold = Severity::warning);
        virtual ~Sink() = default;

        Sink(Sink const&) = delete;
        Sink& operator=(Sink const&) = delete;

        virtual bool active(Severity level) const;

        Severity threshold() const;
        void threshold(Severity level);

        virtual void write(Severity level, std::string const& text) = 0;

    private:
        std::atomic<Severity> threshold_;
    };

    class Stream;

    /** Accumulates one message and hands it to the sink on destruction. */
    class ScopedStream
    {
    public:
        ScopedStream(Sink& sink, Severity level);

        template <typename T>
        ScopedStream(Sink& sink, Severity level, T const& t)
            : ScopedStream(sink, level)
        {
            ss_ << t;
        }

        ScopedStream(ScopedStream const&) = delete;
        ScopedStream& operator=(ScopedStream const&) = delete;
        ~ScopedStream();

        template <typename T>
        ScopedStream& operator<<(T const& t)
        {
            ss_ << t;
            return *this;
        }

        ScopedStream& operator<<(std::ostream& (*manip)(std::ostream&));

    private:
        Sink& sink_;
        Severity level_;
        std::ostringstream ss_;
    };

    class Stream
    {
    public:
        Stream(Sink& sink, Severity level) : sink_(&sink), level_(level)
        {
        }

        bool active() const
        {
            return sink_->active(level_);
        }

        explicit operator bool() const
        {
            return active();
        }

        template <typename T>
        ScopedStream operator<<(T const& t) const
        {
            return ScopedStream(*sink_, level_, t);
        }

    private:
        Sink* sink_;
        Severity level_;
    };

    explicit Journal(Sink& sink) : sink_(&sink)
    {
    }

    Sink& sink() const
    {
        return *sink_;
    }

    Stream stream(Severity level) const
    {
        return Stream(*sink_, level);
    }

    Stream trace() const { return stream(Severity::trace); }
    Stream debug() const { return stream(Severity::debug); }
    Stream info() const { return stream(Severity::info); }
    Stream warn() const { return stream(Severity::warning); }
    Stream error() const { return stream(Severity::error); }
    Stream fatal() const { return stream(Severity::fatal); }

    /** A sink that discards everything. Shared, process lifetime. */
    static Sink& nullSink();

private:
    Sink* sink_;
};

/** Writes timestamped, severity-tagged lines to an ostream. */
class StreamSink : public Journal::Sink
{
public:
    StreamSink(std::ostream& out, Journal::Severity threshold);

    void write(Journal::Severity level, std::string const& text) override;

private:
    std::mutex mutex_;
    std::ostream& out_;
};

std::string to_string(Journal::Severity level);

/** Parses a severity name or its three-letter tag, case-insensitively. */
Journal::Severity severityFromString(std::string const& name);

}  // namespace umbra

#ifndef JLOG
#define JLOG(x) \
    if (!(x))   \
    {           \
    }           \
    else        \
        x
#endif

#pragma once

#include <libumbra/basics/Journal.h>

#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace umbra {
namespace test {

/** Keeps every message it is given, for assertions on logging. */
class CaptureSink : public Journal::Sink
{
public:
    explicit CaptureSink(Journal::Severity threshold = Journal::Severity::trace)
        : Sink(threshold)
    {
    }

    void write(Journal::Severity level, std::string const& text) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.emplace_back(level, text);
    }

    std::vector<std::pair<Journal::Severity, std::string>> messages() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    bool contains(std::string const& fragment) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto const& m : messages_)
            if (m.second.find(fragment) != std::string::npos)
                return true;
        return false;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<Journal::Severity, std::string>> messages_;
};

}  // namespace test
}  // namespace umbra

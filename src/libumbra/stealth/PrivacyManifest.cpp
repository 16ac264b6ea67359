#include <libumbra/stealth/PrivacyManifest.h>
#include <libumbra/basics/Errors.h>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace umbra {
namespace stealth {

namespace {

Json::Value const&
requireMember(Json::Value const& v, char const* field, std::string const& path)
{
    if (!v.isObject() || !v.isMember(field))
        throw MissingFieldError(path + field);
    return v[field];
}

std::string
requireString(Json::Value const& v, char const* field, std::string const& path)
{
    auto const& m = requireMember(v, field, path);
    if (!m.isString())
        throw InputValidationError(path + field + " must be a string");
    return m.asString();
}

/** Longest span, in milliseconds, that Clock::duration can hold. */
std::chrono::milliseconds
clockSpan()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::max());
}

}  // namespace

std::string
formatTimestamp(Clock::time_point t)
{
    auto const ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch());
    auto const seconds = static_cast<std::time_t>(ms.count() / 1000);
    auto const millis = static_cast<int>(ms.count() % 1000);

    std::tm tm{};
    gmtime_r(&seconds, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
        << std::setfill('0') << millis << 'Z';
    return out.str();
}

std::optional<Clock::time_point>
parseTimestamp(std::string const& text)
{
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail())
        return std::nullopt;

    int millis = 0;
    if (in.peek() == '.')
    {
        in.get();
        std::string digits;
        while (std::isdigit(in.peek()))
            digits.push_back(static_cast<char>(in.get()));
        if (digits.empty() || digits.size() > 9)
            return std::nullopt;
        digits.resize(3, '0');
        millis = std::stoi(digits.substr(0, 3));
    }
    if (in.get() != 'Z' || in.peek() != std::char_traits<char>::eof())
        return std::nullopt;

    auto const seconds = timegm(&tm);
    if (seconds == static_cast<std::time_t>(-1) ||
        std::chrono::seconds(seconds) >= clockSpan())
        return std::nullopt;

    return Clock::time_point(
        std::chrono::duration_cast<Clock::duration>(
            std::chrono::seconds(seconds) + std::chrono::milliseconds(millis)));
}

//------------------------------------------------------------------------------

Clock::time_point
PrivacyManifest::expiresAt() const
{
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    // Saturates at the end of the clock's range.
    auto headroom = clockSpan();
    if (updated.time_since_epoch() > Clock::duration::zero())
        headroom = duration_cast<milliseconds>(Clock::time_point::max() - updated);
    if (ttl >= headroom)
        return Clock::time_point::max();
    return updated + duration_cast<Clock::duration>(ttl);
}

void
PrivacyManifest::requireFresh(Clock::time_point now) const
{
    if (isExpired(now))
        throw ManifestExpiredError(
            "privacy manifest expired at " + formatTimestamp(expiresAt()));
}

Json::Value
PrivacyManifest::toJson() const
{
    Json::Value v(Json::objectValue);
    v["version"] = version;

    Json::Value& receiving = v["receiving"];
    receiving["subdomain"] = subdomain;
    Json::Value& generator = receiving["stealth_generator"];
    generator["curve"] = curve;
    generator["base_point"] = basePoint.toHex();
    generator["scheme"] = scheme;

    v["updated"] = formatTimestamp(updated);
    v["ttl"] = Json::Int64(ttl.count());
    return v;
}

PrivacyManifest
PrivacyManifest::fromJson(Json::Value const& v)
{
    if (!v.isObject())
        throw InputValidationError("privacy manifest must be a JSON object");

    PrivacyManifest m;

    auto const& version = requireMember(v, "version", "");
    m.version = version.isString() ? version.asString()
        : version.isInt64()        ? std::to_string(version.asInt64())
                                   : std::string();
    if (m.version != supportedVersion)
        throw InputValidationError("unsupported privacy manifest version '" + m.version + "'");

    auto const& receiving = requireMember(v, "receiving", "");
    if (!receiving.isObject())
        throw InputValidationError("receiving must be an object");
    if (receiving.isMember("subdomain") && !receiving["subdomain"].isNull())
        m.subdomain = requireString(receiving, "subdomain", "receiving.");

    auto const& generator = requireMember(receiving, "stealth_generator", "receiving.");
    std::string const path = "receiving.stealth_generator.";
    m.curve = requireString(generator, "curve", path);
    if (m.curve != supportedCurve)
        throw InputValidationError("unsupported stealth curve '" + m.curve + "'");
    m.scheme = requireString(generator, "scheme", path);
    if (m.scheme != supportedScheme)
        throw InputValidationError("unsupported stealth scheme '" + m.scheme + "'");
    auto const basePoint = PublicKey::fromHex(requireString(generator, "base_point", path));
    if (!basePoint)
        throw InputValidationError("stealth base_point is not a compressed secp256k1 point");
    m.basePoint = *basePoint;

    auto const& updated = requireMember(v, "updated", "");
    if (updated.isString())
    {
        auto const t = parseTimestamp(updated.asString());
        if (!t)
            throw InputValidationError("updated is not an ISO-8601 UTC timestamp");
        m.updated = *t;
    }
    else if (
        updated.isIntegral() && updated.isInt64() && updated.asInt64() >= 0 &&
        std::chrono::milliseconds(updated.asInt64()) < clockSpan())
    {
        m.updated = Clock::time_point(std::chrono::duration_cast<Clock::duration>(
            std::chrono::milliseconds(updated.asInt64())));
    }
    else
    {
        throw InputValidationError("updated must be a timestamp or epoch milliseconds");
    }

    auto const& ttl = requireMember(v, "ttl", "");
    if (!ttl.isIntegral() || (ttl.isInt64() && ttl.asInt64() <= 0))
        throw InputValidationError("ttl must be a positive number of milliseconds");
    // An integral ttl that is not an Int64 is above INT64_MAX.
    m.ttl = ttl.isInt64() ? std::chrono::milliseconds(ttl.asInt64())
                          : std::chrono::milliseconds::max();

    return m;
}

//------------------------------------------------------------------------------

ManifestResolver::ManifestResolver(ManifestSource& source, Journal j)
    : source_(source), j_(j)
{
}

PrivacyManifest
ManifestResolver::fetch(std::string const& name, Clock::time_point now)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto const it = cache_.find(name);
        if (it != cache_.end())
        {
            if (!it->second.isExpired(now))
                return it->second;
            JLOG(j_.debug()) << "cached manifest for " << name << " expired";
            cache_.erase(it);
        }
    }

    auto const json = source_.lookup(name);
    if (!json)
        throw InputValidationError("no privacy manifest published for " + name);

    auto manifest = PrivacyManifest::fromJson(*json);
    manifest.requireFresh(now);

    JLOG(j_.debug()) << "fetched manifest for " << name << ", valid until "
                     << formatTimestamp(manifest.expiresAt());

    std::lock_guard<std::mutex> lock(mutex_);
    cache_[name] = manifest;
    return manifest;
}

PrivacyManifest
ManifestResolver::resolve(std::string const& name, Clock::time_point now)
{
    auto manifest = fetch(name, now);
    if (manifest.subdomain.empty() || manifest.subdomain == name)
        return manifest;

    JLOG(j_.trace()) << name << " rotates to " << manifest.subdomain;
    auto const ephemeral = fetch(manifest.subdomain, now);

    manifest.curve = ephemeral.curve;
    manifest.scheme = ephemeral.scheme;
    manifest.basePoint = ephemeral.basePoint;
    manifest.updated = ephemeral.updated;
    manifest.requireFresh(now);
    return manifest;
}

void
ManifestResolver::invalidate(std::string const& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.erase(name);
}

std::size_t
ManifestResolver::cached() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

}  // namespace stealth
}  // namespace umbra

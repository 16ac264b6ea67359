#pragma once

#include <libumbra/basics/Journal.h>
#include <libumbra/stealth/Secp256k1.h>

#include <json/value.h>

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace umbra {
namespace stealth {

using Clock = std::chrono::system_clock;

/**
 * Versioned receiving descriptor a recipient publishes under a name.
 *
 *   {
 *     "version": "1",
 *     "receiving": {
 *       "subdomain": "r7.alice.eth",
 *       "stealth_generator": {
 *         "curve": "secp256k1",
 *         "base_point": "02...",
 *         "scheme": "ecdh+sha256"
 *       }
 *     },
 *     "updated": "2024-05-01T12:00:00.000Z",
 *     "ttl": 3600000
 *   }
 *
 * `updated` may also be milliseconds since the epoch. `ttl` is milliseconds;
 * a ttl reaching past the clock's range means the manifest never expires.
 */
struct PrivacyManifest
{
    static constexpr char const* supportedVersion = "1";
    static constexpr char const* supportedCurve = "secp256k1";
    static constexpr char const* supportedScheme = "ecdh+sha256";

    std::string version = supportedVersion;
    std::string subdomain;
    std::string curve = supportedCurve;
    std::string scheme = supportedScheme;
    PublicKey basePoint;
    Clock::time_point updated;
    std::chrono::milliseconds ttl{0};

    /** updated + ttl, or Clock::time_point::max() if that does not fit. */
    Clock::time_point expiresAt() const;

    bool isExpired(Clock::time_point now) const
    {
        return now >= expiresAt();
    }

    /** @throws ManifestExpiredError if the manifest has expired at now */
    void requireFresh(Clock::time_point now) const;

    Json::Value toJson() const;

    /**
     * @throws MissingFieldError for absent fields
     * @throws InputValidationError for unsupported versions, curves or
     *         schemes, invalid base points, timestamps or ttl
     */
    static PrivacyManifest fromJson(Json::Value const& v);
};

/** "2024-05-01T12:00:00.000Z" */
std::string formatTimestamp(Clock::time_point t);

/** ISO-8601 UTC with optional milliseconds. */
std::optional<Clock::time_point> parseTimestamp(std::string const& text);

/** Name lookup the resolver is given; the transport is up to the caller. */
class ManifestSource
{
public:
    virtual ~ManifestSource() = default;

    /** @return the manifest JSON published under name, if any */
    virtual std::optional<Json::Value> lookup(std::string const& name) = 0;
};

/**
 * Resolves names to manifests through a ManifestSource.
 *
 * A manifest that points at an ephemeral subdomain takes its receiving
 * block and `updated` time from the subdomain's manifest; only one level
 * is followed. Fetched manifests are cached until they expire.
 */
class ManifestResolver
{
public:
    ManifestResolver(ManifestSource& source, Journal j);

    /**
     * @throws InputValidationError if a name has no manifest or it is invalid
     * @throws ManifestExpiredError if the result is expired at now
     */
    PrivacyManifest resolve(std::string const& name, Clock::time_point now);

    /** Drops the cached manifest for name, e.g. after a subdomain rotation. */
    void invalidate(std::string const& name);

    std::size_t cached() const;

private:
    PrivacyManifest fetch(std::string const& name, Clock::time_point now);

    ManifestSource& source_;
    Journal j_;

    mutable std::mutex mutex_;
    std::map<std::string, PrivacyManifest> cache_;
};

}  // namespace stealth
}  // namespace umbra

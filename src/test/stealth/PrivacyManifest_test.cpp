#include <libumbra/basics/Errors.h>
#include <libumbra/stealth/PrivacyManifest.h>
#include <test/support/CaptureSink.h>
#include <test/support/TestRandom.h>

#include <gtest/gtest.h>

#include <map>

namespace umbra {
namespace stealth {
namespace {

using namespace std::chrono_literals;

Clock::time_point
at(std::string const& iso)
{
    return *parseTimestamp(iso);
}

Json::Value
manifestJson(
    PublicKey const& basePoint,
    std::string const& updated,
    Json::Int64 ttl,
    std::string const& subdomain = "")
{
    Json::Value v(Json::objectValue);
    v["version"] = "1";
    v["receiving"]["subdomain"] = subdomain;
    v["receiving"]["stealth_generator"]["curve"] = "secp256k1";
    v["receiving"]["stealth_generator"]["base_point"] = basePoint.toHex();
    v["receiving"]["stealth_generator"]["scheme"] = "ecdh+sha256";
    v["updated"] = updated;
    v["ttl"] = ttl;
    return v;
}

class MapSource : public ManifestSource
{
public:
    std::optional<Json::Value> lookup(std::string const& name) override
    {
        ++lookups[name];
        auto const it = published.find(name);
        if (it == published.end())
            return std::nullopt;
        return it->second;
    }

    std::map<std::string, Json::Value> published;
    std::map<std::string, int> lookups;
};

class PrivacyManifestTest : public ::testing::Test
{
protected:
    test::DeterministicRandom rng_{31};
    PublicKey const parentPoint_ = derivePublicKey(SecretKey::random(rng_));
    PublicKey const rotatedPoint_ = derivePublicKey(SecretKey::random(rng_));
};

TEST_F(PrivacyManifestTest, Timestamps)
{
    auto const t = at("2024-05-01T12:00:00.250Z");
    EXPECT_EQ(formatTimestamp(t), "2024-05-01T12:00:00.250Z");
    EXPECT_EQ(
        std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count(),
        1714564800250);
    EXPECT_EQ(at("2024-05-01T12:00:00Z"), t - 250ms);
    EXPECT_EQ(formatTimestamp(at("1970-01-01T00:00:00Z")), "1970-01-01T00:00:00.000Z");

    EXPECT_FALSE(parseTimestamp("2024-05-01 12:00:00Z"));
    EXPECT_FALSE(parseTimestamp("2024-05-01T12:00:00"));
    EXPECT_FALSE(parseTimestamp("2024-05-01T12:00:00.Z"));
    EXPECT_FALSE(parseTimestamp("2024-05-01T12:00:00Zjunk"));
    EXPECT_FALSE(parseTimestamp("yesterday"));
}

TEST_F(PrivacyManifestTest, ParsesAndExpires)
{
    auto const m = PrivacyManifest::fromJson(
        manifestJson(parentPoint_, "2024-05-01T12:00:00.000Z", 3600000, "r7.alice.eth"));
    EXPECT_EQ(m.version, "1");
    EXPECT_EQ(m.subdomain, "r7.alice.eth");
    EXPECT_EQ(m.basePoint, parentPoint_);
    EXPECT_EQ(m.ttl, 1h);
    EXPECT_EQ(m.expiresAt(), at("2024-05-01T13:00:00Z"));

    EXPECT_FALSE(m.isExpired(at("2024-05-01T12:59:59.999Z")));
    EXPECT_TRUE(m.isExpired(at("2024-05-01T13:00:00Z")));
    EXPECT_NO_THROW(m.requireFresh(at("2024-05-01T12:30:00Z")));
    EXPECT_THROW(m.requireFresh(at("2024-05-02T00:00:00Z")), ManifestExpiredError);

    auto const again = PrivacyManifest::fromJson(m.toJson());
    EXPECT_EQ(again.basePoint, m.basePoint);
    EXPECT_EQ(again.updated, m.updated);
    EXPECT_EQ(again.ttl, m.ttl);
    EXPECT_EQ(again.subdomain, m.subdomain);
}

TEST_F(PrivacyManifestTest, AlternateFieldForms)
{
    auto v = manifestJson(parentPoint_, "", 1000);
    v["version"] = 1;
    v["updated"] = Json::Int64(1714564800000);
    v["receiving"].removeMember("subdomain");

    auto const m = PrivacyManifest::fromJson(v);
    EXPECT_EQ(m.version, "1");
    EXPECT_TRUE(m.subdomain.empty());
    EXPECT_EQ(m.updated, at("2024-05-01T12:00:00Z"));
}

TEST_F(PrivacyManifestTest, RejectsInvalidManifests)
{
    auto const good = manifestJson(parentPoint_, "2024-05-01T12:00:00Z", 1000);

    auto v = good;
    v["receiving"]["stealth_generator"].removeMember("base_point");
    try
    {
        PrivacyManifest::fromJson(v);
        FAIL() << "missing base point accepted";
    }
    catch (MissingFieldError const& e)
    {
        EXPECT_EQ(e.field(), "receiving.stealth_generator.base_point");
    }

    v = good;
    v.removeMember("ttl");
    EXPECT_THROW(PrivacyManifest::fromJson(v), MissingFieldError);

    v = good;
    v["version"] = "2";
    EXPECT_THROW(PrivacyManifest::fromJson(v), InputValidationError);

    v = good;
    v["receiving"]["stealth_generator"]["curve"] = "ed25519";
    EXPECT_THROW(PrivacyManifest::fromJson(v), InputValidationError);

    v = good;
    v["receiving"]["stealth_generator"]["scheme"] = "dual-key";
    EXPECT_THROW(PrivacyManifest::fromJson(v), InputValidationError);

    v = good;
    v["receiving"]["stealth_generator"]["base_point"] = "02" + std::string(64, 'f');
    EXPECT_THROW(PrivacyManifest::fromJson(v), InputValidationError);

    v = good;
    v["ttl"] = 0;
    EXPECT_THROW(PrivacyManifest::fromJson(v), InputValidationError);

    v = good;
    v["updated"] = "last tuesday";
    EXPECT_THROW(PrivacyManifest::fromJson(v), InputValidationError);

    v = good;
    v["receiving"] = "alice";
    EXPECT_THROW(PrivacyManifest::fromJson(v), InputValidationError);

    EXPECT_THROW(PrivacyManifest::fromJson(Json::Value("manifest")), InputValidationError);
}

TEST_F(PrivacyManifestTest, LongTtlSaturates)
{
    auto const farFuture = at("2200-01-01T00:00:00Z");

    // 2^53 - 1 ms is past the end of the clock.
    auto const safe = PrivacyManifest::fromJson(
        manifestJson(parentPoint_, "2024-05-01T12:00:00Z", 9007199254740991));
    EXPECT_EQ(safe.ttl.count(), 9007199254740991);
    EXPECT_EQ(safe.expiresAt(), Clock::time_point::max());
    EXPECT_FALSE(safe.isExpired(farFuture));
    EXPECT_NO_THROW(safe.requireFresh(farFuture));

    auto v = manifestJson(parentPoint_, "2024-05-01T12:00:00Z", 1);
    v["ttl"] = Json::UInt64(18446744073709551615ull);
    auto const huge = PrivacyManifest::fromJson(v);
    EXPECT_EQ(huge.ttl, std::chrono::milliseconds::max());
    EXPECT_FALSE(huge.isExpired(farFuture));

    PrivacyManifest direct;
    direct.updated = at("2024-05-01T12:00:00Z");
    direct.ttl = std::chrono::milliseconds::max();
    EXPECT_EQ(direct.expiresAt(), Clock::time_point::max());
    direct.ttl = 1h;
    EXPECT_EQ(direct.expiresAt(), at("2024-05-01T13:00:00Z"));
}

TEST_F(PrivacyManifestTest, RejectsOutOfRangeNumbers)
{
    auto const good = manifestJson(parentPoint_, "2024-05-01T12:00:00Z", 1000);

    auto v = good;
    v["ttl"] = -5;
    EXPECT_THROW(PrivacyManifest::fromJson(v), InputValidationError);

    v = good;
    v["ttl"] = 1e30;
    EXPECT_THROW(PrivacyManifest::fromJson(v), InputValidationError);

    v = good;
    v["updated"] = Json::UInt64(18446744073709551615ull);
    EXPECT_THROW(PrivacyManifest::fromJson(v), InputValidationError);

    v = good;
    v["updated"] = Json::Int64(9007199254740991);
    EXPECT_THROW(PrivacyManifest::fromJson(v), InputValidationError);

    v = good;
    v["updated"] = "9999-01-01T00:00:00Z";
    EXPECT_THROW(PrivacyManifest::fromJson(v), InputValidationError);

    v = good;
    v["version"] = Json::UInt64(18446744073709551615ull);
    EXPECT_THROW(PrivacyManifest::fromJson(v), InputValidationError);
}

//------------------------------------------------------------------------------

TEST_F(PrivacyManifestTest, ResolverCachesUntilExpiry)
{
    MapSource source;
    source.published["alice.eth"] =
        manifestJson(parentPoint_, "2024-05-01T12:00:00Z", 60000);

    ManifestResolver resolver(source, Journal(Journal::nullSink()));
    auto const now = at("2024-05-01T12:00:10Z");

    EXPECT_EQ(resolver.resolve("alice.eth", now).basePoint, parentPoint_);
    EXPECT_EQ(resolver.resolve("alice.eth", now + 10s).basePoint, parentPoint_);
    EXPECT_EQ(source.lookups["alice.eth"], 1);
    EXPECT_EQ(resolver.cached(), 1u);

    // Past the ttl the cached copy is dropped and the stale one refetched.
    EXPECT_THROW(resolver.resolve("alice.eth", now + 1min), ManifestExpiredError);
    EXPECT_EQ(source.lookups["alice.eth"], 2);
    EXPECT_EQ(resolver.cached(), 0u);

    source.published["alice.eth"] =
        manifestJson(rotatedPoint_, "2024-05-01T12:01:00Z", 60000);
    EXPECT_EQ(resolver.resolve("alice.eth", now + 1min).basePoint, rotatedPoint_);

    EXPECT_THROW(resolver.resolve("nobody.eth", now), InputValidationError);
}

TEST_F(PrivacyManifestTest, ResolverFollowsSubdomain)
{
    MapSource source;
    source.published["alice.eth"] =
        manifestJson(parentPoint_, "2024-05-01T12:00:00Z", 3600000, "r7.alice.eth");
    source.published["r7.alice.eth"] =
        manifestJson(rotatedPoint_, "2024-05-01T12:30:00Z", 3600000);

    test::CaptureSink sink;
    Journal j(sink);
    ManifestResolver resolver(source, j);
    auto const now = at("2024-05-01T12:45:00Z");

    auto const m = resolver.resolve("alice.eth", now);
    EXPECT_EQ(m.basePoint, rotatedPoint_);
    EXPECT_EQ(m.subdomain, "r7.alice.eth");
    EXPECT_EQ(m.updated, at("2024-05-01T12:30:00Z"));
    EXPECT_EQ(m.ttl, 1h);
    EXPECT_EQ(resolver.cached(), 2u);
    EXPECT_TRUE(sink.contains("rotates to r7.alice.eth"));

    // The parent's ttl counts from the subdomain's update time.
    EXPECT_NO_THROW(resolver.resolve("alice.eth", at("2024-05-01T12:59:00Z")));

    // Rotation: the subdomain now points somewhere else.
    source.published["r7.alice.eth"] =
        manifestJson(parentPoint_, "2024-05-01T12:50:00Z", 3600000);
    EXPECT_EQ(resolver.resolve("alice.eth", now).basePoint, rotatedPoint_);
    resolver.invalidate("r7.alice.eth");
    EXPECT_EQ(resolver.resolve("alice.eth", at("2024-05-01T12:55:00Z")).basePoint, parentPoint_);
}

TEST_F(PrivacyManifestTest, SubdomainFailuresPropagate)
{
    MapSource source;
    source.published["alice.eth"] =
        manifestJson(parentPoint_, "2024-05-01T12:00:00Z", 3600000, "r9.alice.eth");

    ManifestResolver resolver(source, Journal(Journal::nullSink()));
    auto const now = at("2024-05-01T12:10:00Z");
    EXPECT_THROW(resolver.resolve("alice.eth", now), InputValidationError);

    source.published["r9.alice.eth"] =
        manifestJson(rotatedPoint_, "2024-05-01T11:00:00Z", 60000);
    EXPECT_THROW(resolver.resolve("alice.eth", now), ManifestExpiredError);
}

}  // namespace
}  // namespace stealth
}  // namespace umbra

#include <libumbra/zkp/PoolConfig.h>
#include <libumbra/basics/Errors.h>
#include <libumbra/zkp/MerkleTreeManager.h>

#include <json/reader.h>

#include <fstream>

namespace umbra {
namespace zkp {

namespace {

Json::Value const&
section(Json::Value const& root, char const* name)
{
    static Json::Value const empty(Json::objectValue);
    if (!root.isMember(name))
        return empty;
    auto const& s = root[name];
    if (!s.isObject())
        throw InputValidationError(std::string("config section ") + name + " must be an object");
    return s;
}

std::optional<std::uint64_t>
count(Json::Value const& s, char const* where, char const* key)
{
    if (!s.isMember(key))
        return std::nullopt;
    if (!s[key].isUInt64())
        throw InputValidationError(
            std::string(where) + "." + key + " must be a non-negative integer");
    return s[key].asUInt64();
}

std::optional<std::string>
text(Json::Value const& s, char const* where, char const* key)
{
    if (!s.isMember(key))
        return std::nullopt;
    if (!s[key].isString())
        throw InputValidationError(std::string(where) + "." + key + " must be a string");
    return s[key].asString();
}

}  // namespace

PoolConfig
PoolConfig::fromJson(Json::Value const& v)
{
    if (!v.isObject())
        throw InputValidationError("config must be a JSON object");

    PoolConfig c;

    auto const& tree = section(v, "tree");
    if (auto const depth = count(tree, "tree", "depth"))
    {
        if (*depth < 1 || *depth > MerkleTreeManager::maxDepth)
            throw RangeError(
                "tree.depth must be between 1 and " +
                std::to_string(MerkleTreeManager::maxDepth));
        c.treeDepth = static_cast<std::size_t>(*depth);
    }
    if (auto const history = count(tree, "tree", "root_history"))
    {
        if (*history < 1)
            throw RangeError("tree.root_history must be at least 1");
        c.rootHistory = static_cast<std::size_t>(*history);
    }
    if (auto const store = text(tree, "tree", "store"))
        c.storeDirectory = *store;

    auto const& prover = section(v, "prover");
    if (auto const workers = count(prover, "prover", "workers"))
    {
        if (*workers < 1 || *workers > 256)
            throw RangeError("prover.workers must be between 1 and 256");
        c.proverWorkers = static_cast<std::size_t>(*workers);
    }
    if (auto const artifacts = text(prover, "prover", "artifacts"))
        c.artifactDirectory = *artifacts;
    if (auto const ms = count(prover, "prover", "load_timeout_ms"))
        c.loadTimeout = std::chrono::milliseconds(*ms);
    if (auto const ms = count(prover, "prover", "prove_timeout_ms"))
        c.proveTimeout = std::chrono::milliseconds(*ms);
    if (prover.isMember("bootstrap"))
    {
        if (!prover["bootstrap"].isBool())
            throw InputValidationError("prover.bootstrap must be true or false");
        c.bootstrap = prover["bootstrap"].asBool();
    }

    auto const& log = section(v, "log");
    if (auto const severity = text(log, "log", "severity"))
        c.logSeverity = severityFromString(*severity);

    return c;
}

PoolConfig
PoolConfig::load(std::string const& path)
{
    std::ifstream in(path);
    if (!in.good())
        throw InputValidationError("cannot open config file " + path);

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors))
        throw InputValidationError("cannot parse " + path + ": " + errors);
    return fromJson(root);
}

Json::Value
PoolConfig::toJson() const
{
    Json::Value v(Json::objectValue);
    v["tree"]["depth"] = Json::UInt64(treeDepth);
    v["tree"]["root_history"] = Json::UInt64(rootHistory);
    v["tree"]["store"] = storeDirectory;
    v["prover"]["workers"] = Json::UInt64(proverWorkers);
    v["prover"]["artifacts"] = artifactDirectory;
    if (loadTimeout)
        v["prover"]["load_timeout_ms"] = Json::UInt64(loadTimeout->count());
    if (proveTimeout)
        v["prover"]["prove_timeout_ms"] = Json::UInt64(proveTimeout->count());
    v["prover"]["bootstrap"] = bootstrap;
    v["log"]["severity"] = to_string(logSeverity);
    return v;
}

}  // namespace zkp
}  // namespace umbra

#pragma once

#include <libumbra/basics/Journal.h>

#include <json/value.h>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace umbra {
namespace zkp {

/**
 * Engine settings, read from a JSON document:
 *
 *   {
 *     "tree":   { "depth": 20, "root_history": 100, "store": "/var/lib/umbra" },
 *     "prover": { "workers": 2, "artifacts": "/etc/umbra/circuits",
 *                 "load_timeout_ms": 60000, "prove_timeout_ms": 120000,
 *                 "bootstrap": false },
 *     "log":    { "severity": "info" }
 *   }
 *
 * Every key is optional. An empty store keeps the pool in memory.
 */
struct PoolConfig
{
    std::size_t treeDepth = 20;
    std::size_t rootHistory = 100;
    std::string storeDirectory;

    std::size_t proverWorkers = 2;
    std::string artifactDirectory;
    std::optional<std::chrono::milliseconds> loadTimeout;
    std::optional<std::chrono::milliseconds> proveTimeout;
    bool bootstrap = false;

    Journal::Severity logSeverity = Journal::Severity::info;

    /** @throws InputValidationError for wrong types or out of range values */
    static PoolConfig fromJson(Json::Value const& v);

    /** @throws InputValidationError if the file cannot be read or parsed */
    static PoolConfig load(std::string const& path);

    Json::Value toJson() const;
};

}  // namespace zkp
}  // namespace umbra

#pragma once

#include <libumbra/basics/Journal.h>
#include <libumbra/zkp/FieldElement.h>
#include <libumbra/zkp/PoolStore.h>

#include <memory>
#include <mutex>
#include <set>

namespace umbra {
namespace zkp {

/**
 * Set of spent nullifier hashes. Entries are never removed.
 *
 * markSpent is an atomic check-and-insert: of any number of concurrent
 * calls with the same hash exactly one returns, the rest throw
 * NullifierReplayError.
 */
class NullifierRegistry
{
public:
    explicit NullifierRegistry(Journal j, std::shared_ptr<PoolStore> store = {});

    NullifierRegistry(NullifierRegistry const&) = delete;
    NullifierRegistry& operator=(NullifierRegistry const&) = delete;

    bool isSpent(FieldT const& nullifierHash) const;

    void markSpent(FieldT const& nullifierHash);

    std::size_t size() const;

private:
    std::shared_ptr<PoolStore> store_;
    Journal j_;

    mutable std::mutex mutex_;
    std::set<FieldBytes> spent_;
};

}  // namespace zkp
}  // namespace umbra

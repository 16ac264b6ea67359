#include <libumbra/zkp/NullifierRegistry.h>

namespace umbra {
namespace zkp {

NullifierRegistry::NullifierRegistry(Journal j, std::shared_ptr<PoolStore> store)
    : store_(std::move(store)), j_(j)
{
    if (store_)
    {
        for (auto const& h : store_->loadNullifiers())
            spent_.insert(fieldToBytes(h));
        JLOG(j_.info()) << "restored " << spent_.size() << " spent nullifiers";
    }
}

bool
NullifierRegistry::isSpent(FieldT const& nullifierHash) const
{
    auto const key = fieldToBytes(nullifierHash);
    std::lock_guard<std::mutex> lock(mutex_);
    return spent_.count(key) != 0;
}

void
NullifierRegistry::markSpent(FieldT const& nullifierHash)
{
    auto const key = fieldToBytes(nullifierHash);
    std::lock_guard<std::mutex> lock(mutex_);
    if (spent_.count(key) != 0)
    {
        JLOG(j_.warn()) << "nullifier replay " << fieldToHex(nullifierHash);
        throw NullifierReplayError(
            "nullifier hash already spent: " + fieldToHex(nullifierHash));
    }

    if (store_)
        store_->recordNullifier(nullifierHash);
    spent_.insert(key);

    JLOG(j_.debug()) << "nullifier spent " << fieldToHex(nullifierHash);
}

std::size_t
NullifierRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return spent_.size();
}

}  // namespace zkp
}  // namespace umbra

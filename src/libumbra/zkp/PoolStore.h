#pragma once

#include <libumbra/zkp/FieldElement.h>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace umbra {
namespace zkp {

/**
 * Durable backing for tree leaves and spent nullifier hashes.
 *
 * Writers call through before touching memory, so a throwing store leaves
 * the in-memory state unchanged. Implementations must be thread-safe.
 */
class PoolStore
{
public:
    virtual ~PoolStore() = default;

    virtual void appendLeaf(std::uint64_t index, FieldT const& commitment) = 0;
    virtual std::vector<FieldT> loadLeaves() const = 0;

    virtual void recordNullifier(FieldT const& nullifierHash) = 0;
    virtual std::vector<FieldT> loadNullifiers() const = 0;
};

class MemoryPoolStore : public PoolStore
{
public:
    void appendLeaf(std::uint64_t index, FieldT const& commitment) override;
    std::vector<FieldT> loadLeaves() const override;

    void recordNullifier(FieldT const& nullifierHash) override;
    std::vector<FieldT> loadNullifiers() const override;

private:
    mutable std::mutex mutex_;
    std::vector<FieldT> leaves_;
    std::vector<FieldT> nullifiers_;
};

/**
 * Append-only text files under one directory:
 *   leaves.txt      one hex commitment per line, line number = leaf index
 *   nullifiers.txt  one hex nullifier hash per line
 */
class FilePoolStore : public PoolStore
{
public:
    explicit FilePoolStore(std::string const& directory);

    void appendLeaf(std::uint64_t index, FieldT const& commitment) override;
    std::vector<FieldT> loadLeaves() const override;

    void recordNullifier(FieldT const& nullifierHash) override;
    std::vector<FieldT> loadNullifiers() const override;

private:
    void appendLine(std::string const& path, std::string const& line);
    std::vector<FieldT> readLines(std::string const& path) const;

    mutable std::mutex mutex_;
    std::string leavesPath_;
    std::string nullifiersPath_;
    std::uint64_t nextLeaf_ = 0;
};

}  // namespace zkp
}  // namespace umbra

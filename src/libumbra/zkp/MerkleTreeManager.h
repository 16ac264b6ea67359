#pragma once

#include <libumbra/basics/Journal.h>
#include <libumbra/zkp/FieldElement.h>
#include <libumbra/zkp/PoolStore.h>

#include <json/value.h>

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace umbra {
namespace zkp {

/**
 * Sibling path for one leaf.
 *
 * pathIndices[i] is false when the running node is the left child at
 * level i and true when it is the right child. PoolCircuit uses the same
 * convention: parent = Poseidon(left, right).
 */
struct MerkleProof
{
    FieldT leaf;
    std::vector<FieldT> pathElements;
    std::vector<bool> pathIndices;
    FieldT root;
    std::uint64_t leafIndex = 0;

    /** Replays the sibling chain from leaf. */
    FieldT computeRoot() const;

    bool verify() const
    {
        return computeRoot() == root;
    }

    std::size_t depth() const
    {
        return pathElements.size();
    }

    Json::Value toJson() const;

    bool operator==(MerkleProof const& other) const
    {
        return leafIndex == other.leafIndex && leaf == other.leaf &&
            root == other.root && pathIndices == other.pathIndices &&
            pathElements == other.pathElements;
    }
};

struct AppendResult
{
    std::uint64_t leafIndex;
    FieldT newRoot;
};

/**
 * Append-only, fixed-depth Poseidon commitment tree.
 *
 * Every level is cached so inclusion proofs are O(depth) lookups. Appends
 * are serialized by an exclusive lock and readers take a shared lock, so a
 * reader never sees a half-applied append. A bounded history of roots is
 * kept because a withdrawal may be proven against any recent root.
 */
class MerkleTreeManager
{
public:
    static constexpr std::size_t defaultDepth = 20;
    static constexpr std::size_t maxDepth = 32;
    static constexpr std::size_t defaultRootHistory = 100;

    struct Setup
    {
        std::size_t depth = defaultDepth;
        std::size_t rootHistory = defaultRootHistory;
        std::shared_ptr<PoolStore> store;
    };

    MerkleTreeManager(Setup const& setup, Journal j);

    MerkleTreeManager(MerkleTreeManager const&) = delete;
    MerkleTreeManager& operator=(MerkleTreeManager const&) = delete;

    /** Throws TreeFullError once 2^depth leaves are present. */
    AppendResult append(FieldT const& commitment);

    /**
     * Appends only while the tree still has expectedIndex leaves.
     * Returns nothing, and changes nothing, when the tree has moved on.
     */
    std::optional<AppendResult> appendAt(
        std::uint64_t expectedIndex, FieldT const& commitment);

    /**
     * The inclusion proof the next append of commitment would yield,
     * against the root it would produce. Does not modify the tree.
     */
    MerkleProof previewAppend(FieldT const& commitment) const;

    /** Throws UnknownLeafError when leafIndex >= size(). */
    MerkleProof proveInclusion(std::uint64_t leafIndex) const;

    FieldT currentRoot() const;

    /** Most recent first; includes the current root. */
    std::vector<FieldT> historicalRoots() const;

    bool isKnownRoot(FieldT const& root) const;

    std::uint64_t size() const;

    std::size_t depth() const
    {
        return depth_;
    }

    std::uint64_t capacity() const
    {
        return std::uint64_t(1) << depth_;
    }

    /** Root of an empty subtree of the given height. */
    FieldT const& zeroValue(std::size_t level) const
    {
        return zeros_.at(level);
    }

    static FieldT zeroLeaf();

private:
    // Nodes on the path of a new leaf, levels 0 (the leaf) to depth (root).
    struct Update
    {
        std::uint64_t index;
        std::vector<FieldT> nodes;
    };

    Update computeUpdate(FieldT const& leaf) const;
    void commit(Update const& update);
    AppendResult appendLocked(FieldT const& commitment);
    FieldT sibling(std::size_t level, std::uint64_t index) const;
    void fillPath(MerkleProof& proof) const;
    FieldT rootLocked() const;

    std::size_t const depth_;
    std::size_t const rootHistorySize_;
    std::shared_ptr<PoolStore> store_;
    Journal j_;

    std::vector<FieldT> zeros_;

    mutable std::shared_mutex mutex_;
    std::vector<std::vector<FieldT>> levels_;
    std::deque<FieldT> rootHistory_;
};

}  // namespace zkp
}  // namespace umbra

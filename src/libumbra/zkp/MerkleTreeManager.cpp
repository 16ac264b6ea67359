#include <libumbra/zkp/MerkleTreeManager.h>
#include <libumbra/zkp/PoseidonHasher.h>

#include <algorithm>
#include <mutex>

namespace umbra {
namespace zkp {

FieldT
MerkleProof::computeRoot() const
{
    if (pathElements.size() != pathIndices.size())
        throw InputValidationError("merkle proof path length mismatch");

    FieldT current = leaf;
    for (std::size_t i = 0; i < pathElements.size(); ++i)
    {
        if (pathIndices[i])
            current = PoseidonHasher::hash2(pathElements[i], current);
        else
            current = PoseidonHasher::hash2(current, pathElements[i]);
    }
    return current;
}

Json::Value
MerkleProof::toJson() const
{
    Json::Value v(Json::objectValue);
    v["leaf"] = fieldToHex(leaf);
    v["root"] = fieldToHex(root);
    v["leafIndex"] = Json::UInt64(leafIndex);
    Json::Value& elements = v["pathElements"] = Json::Value(Json::arrayValue);
    Json::Value& indices = v["pathIndices"] = Json::Value(Json::arrayValue);
    for (std::size_t i = 0; i < pathElements.size(); ++i)
    {
        elements.append(fieldToHex(pathElements[i]));
        indices.append(pathIndices[i] ? 1 : 0);
    }
    return v;
}

//------------------------------------------------------------------------------

FieldT
MerkleTreeManager::zeroLeaf()
{
    static FieldT const zero = hashToField("umbra.merkle.zero");
    return zero;
}

MerkleTreeManager::MerkleTreeManager(Setup const& setup, Journal j)
    : depth_(setup.depth)
    , rootHistorySize_(std::max<std::size_t>(setup.rootHistory, 1))
    , store_(setup.store)
    , j_(j)
{
    if (depth_ == 0 || depth_ > maxDepth)
        throw InputValidationError(
            "tree depth must be between 1 and " + std::to_string(maxDepth));

    initCurveParameters();

    zeros_.resize(depth_ + 1);
    zeros_[0] = zeroLeaf();
    for (std::size_t i = 1; i <= depth_; ++i)
        zeros_[i] = PoseidonHasher::hash2(zeros_[i - 1], zeros_[i - 1]);

    levels_.resize(depth_ + 1);
    rootHistory_.push_front(zeros_[depth_]);

    if (store_)
    {
        auto const leaves = store_->loadLeaves();
        if (leaves.size() > capacity())
            throw TreeFullError(
                "stored tree holds " + std::to_string(leaves.size()) +
                " leaves, capacity is " + std::to_string(capacity()));
        for (auto const& leaf : leaves)
            commit(computeUpdate(leaf));
        JLOG(j_.info()) << "restored commitment tree with " << leaves.size()
                        << " leaves, root " << fieldToHex(rootLocked());
    }
}

FieldT
MerkleTreeManager::sibling(std::size_t level, std::uint64_t index) const
{
    std::uint64_t const s = index ^ 1;
    if (s < levels_[level].size())
        return levels_[level][s];
    return zeros_[level];
}

void
MerkleTreeManager::fillPath(MerkleProof& proof) const
{
    proof.pathElements.clear();
    proof.pathIndices.clear();
    proof.pathElements.reserve(depth_);
    proof.pathIndices.reserve(depth_);

    std::uint64_t index = proof.leafIndex;
    for (std::size_t level = 0; level < depth_; ++level)
    {
        proof.pathElements.push_back(sibling(level, index));
        proof.pathIndices.push_back(index & 1);
        index >>= 1;
    }
}

FieldT
MerkleTreeManager::rootLocked() const
{
    if (levels_[depth_].empty())
        return zeros_[depth_];
    return levels_[depth_][0];
}

MerkleTreeManager::Update
MerkleTreeManager::computeUpdate(FieldT const& leaf) const
{
    std::uint64_t const n = levels_[0].size();
    if (n >= capacity())
        throw TreeFullError(
            "commitment tree is full (" + std::to_string(capacity()) + " leaves)");

    Update update{n, {}};
    update.nodes.reserve(depth_ + 1);
    update.nodes.push_back(leaf);

    FieldT current = leaf;
    std::uint64_t index = n;
    for (std::size_t level = 0; level < depth_; ++level)
    {
        // The new node is always the last one on its level, so a right
        // sibling can only be an empty subtree.
        if (index & 1)
            current = PoseidonHasher::hash2(levels_[level][index - 1], current);
        else
            current = PoseidonHasher::hash2(current, zeros_[level]);
        index >>= 1;
        update.nodes.push_back(current);
    }
    return update;
}

void
MerkleTreeManager::commit(Update const& update)
{
    for (std::size_t level = 0; level <= depth_; ++level)
    {
        std::uint64_t const index = update.index >> level;
        auto& nodes = levels_[level];
        if (index < nodes.size())
            nodes[index] = update.nodes[level];
        else
            nodes.push_back(update.nodes[level]);
    }

    rootHistory_.push_front(update.nodes[depth_]);
    while (rootHistory_.size() > rootHistorySize_)
        rootHistory_.pop_back();
}

AppendResult
MerkleTreeManager::appendLocked(FieldT const& commitment)
{
    auto update = computeUpdate(commitment);
    if (store_)
        store_->appendLeaf(update.index, commitment);
    commit(update);

    JLOG(j_.debug()) << "appended leaf " << update.index << ", root "
                     << fieldToHex(update.nodes[depth_]);
    return {update.index, update.nodes[depth_]};
}

AppendResult
MerkleTreeManager::append(FieldT const& commitment)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return appendLocked(commitment);
}

std::optional<AppendResult>
MerkleTreeManager::appendAt(std::uint64_t expectedIndex, FieldT const& commitment)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (levels_[0].size() != expectedIndex)
    {
        JLOG(j_.debug()) << "tree advanced to " << levels_[0].size()
                         << " leaves, expected " << expectedIndex;
        return std::nullopt;
    }
    return appendLocked(commitment);
}

MerkleProof
MerkleTreeManager::previewAppend(FieldT const& commitment) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto const update = computeUpdate(commitment);

    MerkleProof proof;
    proof.leaf = commitment;
    proof.leafIndex = update.index;
    proof.root = update.nodes[depth_];
    fillPath(proof);
    return proof;
}

MerkleProof
MerkleTreeManager::proveInclusion(std::uint64_t leafIndex) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (leafIndex >= levels_[0].size())
        throw UnknownLeafError(
            "leaf " + std::to_string(leafIndex) + " not in tree of " +
            std::to_string(levels_[0].size()) + " leaves");

    MerkleProof proof;
    proof.leaf = levels_[0][leafIndex];
    proof.leafIndex = leafIndex;
    proof.root = rootLocked();
    fillPath(proof);
    return proof;
}

FieldT
MerkleTreeManager::currentRoot() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rootLocked();
}

std::vector<FieldT>
MerkleTreeManager::historicalRoots() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return {rootHistory_.begin(), rootHistory_.end()};
}

bool
MerkleTreeManager::isKnownRoot(FieldT const& root) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::find(rootHistory_.begin(), rootHistory_.end(), root) !=
        rootHistory_.end();
}

std::uint64_t
MerkleTreeManager::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return levels_[0].size();
}

}  // namespace zkp
}  // namespace umbra

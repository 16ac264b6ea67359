#include <libumbra/zkp/PoolStore.h>

#include <filesystem>
#include <fstream>

namespace umbra {
namespace zkp {

void
MemoryPoolStore::appendLeaf(std::uint64_t index, FieldT const& commitment)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (index != leaves_.size())
        throw StateInvariantError(
            "leaf " + std::to_string(index) + " appended out of order");
    leaves_.push_back(commitment);
}

std::vector<FieldT>
MemoryPoolStore::loadLeaves() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return leaves_;
}

void
MemoryPoolStore::recordNullifier(FieldT const& nullifierHash)
{
    std::lock_guard<std::mutex> lock(mutex_);
    nullifiers_.push_back(nullifierHash);
}

std::vector<FieldT>
MemoryPoolStore::loadNullifiers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return nullifiers_;
}

//------------------------------------------------------------------------------

FilePoolStore::FilePoolStore(std::string const& directory)
{
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec)
        throw StateInvariantError(
            "cannot create store directory " + directory + ": " + ec.message());

    leavesPath_ = (std::filesystem::path(directory) / "leaves.txt").string();
    nullifiersPath_ = (std::filesystem::path(directory) / "nullifiers.txt").string();
    nextLeaf_ = readLines(leavesPath_).size();
}

void
FilePoolStore::appendLine(std::string const& path, std::string const& line)
{
    std::ofstream file(path, std::ios::app);
    file << line << '\n';
    file.flush();
    if (!file)
        throw StateInvariantError("write to " + path + " failed");
}

std::vector<FieldT>
FilePoolStore::readLines(std::string const& path) const
{
    std::vector<FieldT> out;
    std::ifstream file(path);
    if (!file.good())
        return out;

    std::string line;
    std::size_t number = 0;
    while (std::getline(file, line))
    {
        ++number;
        if (line.empty())
            continue;
        try
        {
            out.push_back(fieldFromHex(line));
        }
        catch (InputValidationError const& e)
        {
            throw StateInvariantError(
                path + ":" + std::to_string(number) + ": " + e.what());
        }
    }
    return out;
}

void
FilePoolStore::appendLeaf(std::uint64_t index, FieldT const& commitment)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (index != nextLeaf_)
        throw StateInvariantError(
            "leaf " + std::to_string(index) + " appended out of order");
    appendLine(leavesPath_, fieldToHex(commitment));
    ++nextLeaf_;
}

std::vector<FieldT>
FilePoolStore::loadLeaves() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return readLines(leavesPath_);
}

void
FilePoolStore::recordNullifier(FieldT const& nullifierHash)
{
    std::lock_guard<std::mutex> lock(mutex_);
    appendLine(nullifiersPath_, fieldToHex(nullifierHash));
}

std::vector<FieldT>
FilePoolStore::loadNullifiers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return readLines(nullifiersPath_);
}

}  // namespace zkp
}  // namespace umbra

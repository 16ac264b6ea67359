#include <libumbra/basics/Errors.h>
#include <libumbra/basics/Journal.h>
#include <libumbra/zkp/MerkleTreeManager.h>
#include <libumbra/zkp/ProofService.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void
usage(char const* argv0)
{
    std::cerr << "usage: " << argv0 << " <artifact-dir> [depth]\n"
              << "\n"
              << "Generates deposit and withdraw circuit artifacts with a local,\n"
              << "single-party key generation. The keys are NOT safe for real funds.\n";
}

}  // namespace

int
main(int argc, char** argv)
{
    if (argc < 2 || argc > 3)
    {
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    std::string const directory = argv[1];
    std::size_t depth = umbra::zkp::MerkleTreeManager::defaultDepth;
    if (argc == 3)
    {
        try
        {
            std::size_t used = 0;
            depth = std::stoul(argv[2], &used);
            if (used != std::string(argv[2]).size())
                throw std::invalid_argument(argv[2]);
        }
        catch (std::logic_error const&)
        {
            std::cerr << "depth must be a number\n";
            return EXIT_FAILURE;
        }
        if (depth < 1 || depth > umbra::zkp::MerkleTreeManager::maxDepth)
        {
            std::cerr << "depth must be between 1 and "
                      << umbra::zkp::MerkleTreeManager::maxDepth << "\n";
            return EXIT_FAILURE;
        }
    }

    umbra::StreamSink sink(std::cerr, umbra::Journal::Severity::info);
    umbra::Journal j(sink);

    try
    {
        for (auto const id : {umbra::zkp::CircuitId::deposit, umbra::zkp::CircuitId::withdraw})
        {
            auto const paths =
                umbra::zkp::ProofService::bootstrapCircuit(id, depth, directory, j);
            std::cout << umbra::zkp::to_string(id) << ": " << paths.provingKey << "\n";
        }
    }
    catch (umbra::Error const& e)
    {
        JLOG(j.fatal()) << to_string(e.category()) << ": " << e.what();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

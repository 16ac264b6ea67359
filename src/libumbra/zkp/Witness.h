#pragma once

#include <libumbra/zkp/MerkleTreeManager.h>
#include <libumbra/zkp/Note.h>

#include <optional>
#include <string>
#include <vector>

namespace umbra {
namespace zkp {

enum class CircuitId { deposit, withdraw };

char const* to_string(CircuitId id);

/** Accepts "deposit" and "withdraw"; anything else throws InputValidationError. */
CircuitId circuitIdFromString(std::string const& name);

std::optional<CircuitId> parseCircuitId(std::string const& name);

/** Public input layout of the deposit circuit. */
namespace deposit_signal {
constexpr std::size_t merkleRoot = 0;
constexpr std::size_t commitment = 1;
constexpr std::size_t amount = 2;
constexpr std::size_t count = 3;
}  // namespace deposit_signal

/** Public input layout of the withdraw circuit. */
namespace withdraw_signal {
constexpr std::size_t merkleRoot = 0;
constexpr std::size_t nullifierHash = 1;
constexpr std::size_t recipient = 2;
constexpr std::size_t relayer = 3;
constexpr std::size_t fee = 4;
constexpr std::size_t refund = 5;
constexpr std::size_t count = 6;
}  // namespace withdraw_signal

std::size_t publicInputCount(CircuitId id);

/** Bit widths enforced by the circuits. */
constexpr std::size_t amountBits = 128;
constexpr std::size_t feeBits = 128;
constexpr std::size_t addressBits = 160;

/**
 * Everything a circuit needs to assign its protoboard.
 *
 * Built by WitnessBuilder, immutable afterwards. publicSignals is in the
 * exact order the circuit declares its primary inputs.
 */
struct WitnessVector
{
    CircuitId circuit = CircuitId::deposit;
    Note note;
    FieldT commitment;
    FieldT nullifierHash;
    MerkleProof path;
    std::vector<FieldT> publicSignals;

    bool complete() const
    {
        return publicSignals.size() == publicInputCount(circuit) &&
            path.pathElements.size() == path.pathIndices.size() &&
            !path.pathElements.empty();
    }
};

}  // namespace zkp
}  // namespace umbra

#include <libumbra/zkp/Witness.h>

namespace umbra {
namespace zkp {

char const*
to_string(CircuitId id)
{
    switch (id)
    {
        case CircuitId::deposit:
            return "deposit";
        case CircuitId::withdraw:
            return "withdraw";
    }
    return "unknown";
}

std::optional<CircuitId>
parseCircuitId(std::string const& name)
{
    if (name == "deposit")
        return CircuitId::deposit;
    if (name == "withdraw")
        return CircuitId::withdraw;
    return std::nullopt;
}

CircuitId
circuitIdFromString(std::string const& name)
{
    if (auto id = parseCircuitId(name))
        return *id;
    throw InputValidationError("unknown circuit: " + name);
}

std::size_t
publicInputCount(CircuitId id)
{
    return id == CircuitId::deposit ? deposit_signal::count : withdraw_signal::count;
}

}  // namespace zkp
}  // namespace umbra

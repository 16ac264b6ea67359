#include <libumbra/basics/Errors.h>

namespace umbra {

char const*
to_string(ErrorCategory category)
{
    switch (category)
    {
        case ErrorCategory::inputValidation:
            return "input validation";
        case ErrorCategory::stateInvariant:
            return "state invariant";
        case ErrorCategory::cryptoArtifact:
            return "crypto artifact";
        case ErrorCategory::timeout:
            return "timeout";
        case ErrorCategory::rngFailure:
            return "rng failure";
        case ErrorCategory::manifestExpired:
            return "manifest expired";
    }
    return "unknown";
}

}  // namespace umbra

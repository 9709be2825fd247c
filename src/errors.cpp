#include "mpam/errors.hpp"

namespace mpam {

const char* to_string(DiagnosticKind kind)
{
    switch (kind) {
        case DiagnosticKind::RootFindNotConverged:  return "RootFindNotConverged";
        case DiagnosticKind::BerToleranceExceeded:  return "BERToleranceExceeded";
        case DiagnosticKind::IterationLimitReached: return "IterationLimitReached";
    }
    return "Unknown";
}

} // namespace mpam

#include "seatledger/ledger_options.hpp"
#include "seatledger/errors.hpp"
#include <cstdlib>

namespace seatledger {

const char* to_string(CancellationPolicy policy) {
    switch (policy) {
        case CancellationPolicy::Lenient: return "lenient";
        case CancellationPolicy::ExactMatch: return "exact";
        case CancellationPolicy::Pooled: return "pooled";
    }
    return "lenient";
}

CancellationPolicy parse_cancellation_policy(const std::string& name) {
    if (name == "lenient") return CancellationPolicy::Lenient;
    if (name == "exact") return CancellationPolicy::ExactMatch;
    if (name == "pooled") return CancellationPolicy::Pooled;
    throw InvalidArgumentError("Unknown cancellation policy: " + name);
}

LedgerOptions LedgerOptions::from_env() {
    LedgerOptions options;
    const char* policy_env = std::getenv("SEATLEDGER_CANCELLATION_POLICY");
    if (policy_env && *policy_env) {
        options.cancellation_policy = parse_cancellation_policy(policy_env);
    }
    return options;
}

} // namespace seatledger

#include "vb9/core/errors.hpp"

namespace vb9::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Conflict: return "Conflict";
            case StatusCode::Busy: return "Busy";
            case StatusCode::Corrupt: return "Corrupt";
            case StatusCode::Io: return "Io";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::Unavailable: return "Unavailable";
            case StatusCode::OutOfMemory: return "OutOfMemory";
            case StatusCode::Parse: return "Parse";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Sexp: return "Sexp";
            case StatusDomain::Namespace: return "Namespace";
            case StatusDomain::Logic: return "Logic";
            case StatusDomain::Compiler: return "Compiler";
            case StatusDomain::Runtime: return "Runtime";
            case StatusDomain::Seed: return "Seed";
            case StatusDomain::Cli: return "Cli";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }
} // namespace vb9::core

#include "resolver/diagnostics.hpp"
#include <spdlog/spdlog.h>

namespace updown {

void Diagnostics::enter(ResolutionState state) {
    states_.push_back(state);
    spdlog::debug("Resolver state -> {}", state_to_string(state));
}

void Diagnostics::record_tried(const std::string& candidate) {
    tried_.push_back(candidate);
}

void Diagnostics::record_error(ErrorKind kind, const std::string& message) {
    last_error_ = ResolutionError{kind, message};
    if (kind == ErrorKind::UPSTREAM_TRANSIENT) {
        spdlog::warn("{}: {}", error_kind_to_string(kind), message);
    } else {
        spdlog::debug("{}: {}", error_kind_to_string(kind), message);
    }
}

void Diagnostics::warn(const std::string& message) {
    warnings_.push_back(message);
    spdlog::warn("{}", message);
}

void Diagnostics::export_to(ResolutionResult& result) {
    result.states = std::move(states_);
    result.tried_identifiers = std::move(tried_);
    result.last_error = std::move(last_error_);
    result.warnings = std::move(warnings_);
}

} // namespace updown

#pragma once

#include <string>
#include <vector>
#include <optional>
#include "common/types.hpp"

namespace updown {

/**
 * Per-call diagnostics collector.
 * Created by the resolver for each resolve() call and moved into the result.
 */
class Diagnostics {
public:
    void enter(ResolutionState state);
    void record_tried(const std::string& candidate);
    void record_error(ErrorKind kind, const std::string& message);
    void warn(const std::string& message);

    const std::vector<ResolutionState>& states() const { return states_; }
    const std::vector<std::string>& tried() const { return tried_; }
    const std::optional<ResolutionError>& last_error() const { return last_error_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

    // Move the trail into the result
    void export_to(ResolutionResult& result);

private:
    std::vector<ResolutionState> states_;
    std::vector<std::string> tried_;
    std::optional<ResolutionError> last_error_;
    std::vector<std::string> warnings_;
};

} // namespace updown

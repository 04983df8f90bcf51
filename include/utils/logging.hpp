#pragma once

#include "config/config.hpp"

namespace updown {

/**
 * Install the process-wide "updown" logger: a color stderr sink and,
 * when enabled, a rotating file sink (JSON lines when json_format is set).
 * Throws ConfigurationError when the log directory or file cannot be
 * created; the previous default logger stays in place.
 */
void setup_logging(const LoggingConfig& config);

} // namespace updown

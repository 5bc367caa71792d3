#ifndef TURNLOOP_LOG_H
#define TURNLOOP_LOG_H

#include <string>

namespace turnloop {

/**
 * Install the process-wide file logger.
 *
 * The log is rotated once per start: turnloop.log becomes turnloop.0.log,
 * older files shift up by one and the file past max_files is removed.
 *
 * @param log_path  log file (empty: ~/.config/turnloop/log/turnloop.log)
 * @param max_files rotated files kept
 * @param level     trace, debug, info, warn, err, critical or off
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info");

}  // namespace turnloop

#endif  // TURNLOOP_LOG_H

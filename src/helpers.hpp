#pragma once

#include <string>
#include <vector>

#include "util/path.hpp"

/*
 * Runs command with stdin from /dev/null and collects its stdout.
 * Child is killed if it does not finish within timeout_ms (0 - no limit)
 * or if output grows over max_output bytes.
 */
TError RunCommand(const std::vector<std::string> &command,
                  std::string &output,
                  uint64_t timeout_ms = 0,
                  size_t max_output = 16 << 20);

#pragma once

#include "util/error.hpp"

#define __STDC_LIMIT_MACROS
#include <cstdint>
#undef __STDC_LIMIT_MACROS

#ifndef LSACCOUNTS_VERSION
# define LSACCOUNTS_VERSION "1.0.0"
#endif

constexpr const char *LSACCOUNTS_CONFIG = "/etc/lsaccounts.conf";
constexpr const char *LSACCOUNTS_CONFIG_DIR = "/etc/lsaccounts.conf.d";

constexpr const char *DEFAULT_PASSWD_FILE = "/etc/passwd";
constexpr const char *DEFAULT_GROUP_FILE = "/etc/group";
constexpr const char *DEFAULT_SUDOERS_FILE = "/etc/sudoers";
constexpr const char *DEFAULT_DEFS_FILE = "/etc/login.defs";
constexpr const char *DEFAULT_WTMP_FILE = "/var/log/wtmp";

constexpr uint64_t DEFAULT_HISTORY_TIMEOUT_MS = 10000;
constexpr uint64_t DEFAULT_HISTORY_MAX_OUTPUT = 64 << 20; /* 64Mb */

constexpr const char *LAST_LOGIN_NOT_FOUND = "None found";
constexpr const char *COMMENT_EMPTY = "None";

constexpr size_t COMMENT_MAX_LENGTH = 18;
constexpr size_t COMMENT_CUT_LENGTH = 16;

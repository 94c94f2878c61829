#include "config.hpp"
#include "util/log.hpp"
#include "util/path.hpp"
#include "util/string.hpp"

#include <google/protobuf/text_format.h>
#include <google/protobuf/io/tokenizer.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>

#include <algorithm>

class TProtobufLogger : public google::protobuf::io::ErrorCollector {
public:
    std::string Path;
    TProtobufLogger(const std::string &path) : Path(path) {}
    ~TProtobufLogger() {}

    void AddError(int line, int column, const std::string& message) {
        L_WRN("Config {} at line {} column {} {}", Path, line + 1, column + 1, message);
    }

    void AddWarning(int line, int column, const std::string& message) {
        L_WRN("Config {} at line {} column {} {}", Path, line + 1, column + 1, message);
    }
};

static cfg::TConfig Config;

cfg::TConfig &config() {
    return Config;
}

static void DefaultConfig() {
    config().mutable_sources()->set_passwd_file(DEFAULT_PASSWD_FILE);
    config().mutable_sources()->set_group_file(DEFAULT_GROUP_FILE);
    config().mutable_sources()->set_sudoers_file(DEFAULT_SUDOERS_FILE);
    config().mutable_sources()->set_defs_file(DEFAULT_DEFS_FILE);
    config().mutable_sources()->set_wtmp_file(DEFAULT_WTMP_FILE);
    config().mutable_sources()->set_use_passwd_file(false);

    config().mutable_login_history()->set_timeout_ms(DEFAULT_HISTORY_TIMEOUT_MS);
    config().mutable_login_history()->set_max_output(DEFAULT_HISTORY_MAX_OUTPUT);

    config().mutable_report()->set_color(true);

    config().mutable_log()->set_verbose(false);
    config().mutable_log()->set_debug(false);
}

/* Repeated fields are appended by Merge, defaults go in only when unset */
static void DefaultLists() {
    if (!config().login_history().command_size()) {
        for (auto arg: {"last", "-w", "-i", "-f"})
            config().mutable_login_history()->add_command(arg);
    }

    if (!config().privilege().group_size()) {
        for (auto group: {"wheel", "admin", "sudo"})
            config().mutable_privilege()->add_group(group);
    }
}

static TError ReadConfig(const TPath &path, bool silent) {
    TError error;
    TFile file;

    error = file.OpenRead(path);
    if (error) {
        if (!silent && error.Errno != ENOENT)
            L_WRN("Cannot read config {} {}", path, error);
        return error;
    }

    google::protobuf::io::FileInputStream stream(file.Fd);
    google::protobuf::TextFormat::Parser parser;
    TProtobufLogger logger(path.ToString());

    if (!silent) {
        L_VERBOSE("Read config {}", path);
        parser.RecordErrorsTo(&logger);
    }

    bool ok = parser.Merge(&stream, &Config);
    if (!ok && !silent)
        L_WRN("Cannot parse config {} the rest is skipped", path);

    return OK;
}

void ReadConfigs(const std::string &path, bool silent) {
    Config.Clear();
    DefaultConfig();

    if (!path.empty()) {
        TError error = ReadConfig(path, silent);
        if (error && error.Errno == ENOENT && !silent)
            L_WRN("Config {} not found, using defaults", path);
    } else {
        (void)ReadConfig(LSACCOUNTS_CONFIG, silent);

        TPath config_dir = LSACCOUNTS_CONFIG_DIR;
        std::vector<std::string> config_names;
        (void)config_dir.ReadDirectory(config_names);
        std::sort(config_names.begin(), config_names.end());
        for (auto &name: config_names) {
            if (StringEndsWith(name, ".conf"))
                (void)ReadConfig(config_dir / name, silent);
        }
    }

    DefaultLists();

    Debug |= config().log().debug();
    Verbose |= Debug | config().log().verbose();
}

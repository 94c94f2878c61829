#include <cstdio>
#include <cstdlib>
#include <vector>

#include "cli.hpp"
#include "config.hpp"
#include "sources.hpp"
#include "table.hpp"
#include "util/log.hpp"

#include "fmt/color.h"

extern "C" {
#include <getopt.h>
#include <unistd.h>
}

EAccountScope TOptions::Scope(bool &implicit) const {
    implicit = false;
    if (ShowSystem)
        return EAccountScope::System;
    if (ShowUsers)
        return EAccountScope::Regular;
    if (ShowAll)
        return EAccountScope::All;
    implicit = true;
    return EAccountScope::Regular;
}

TError ParseOptions(int argc, char *argv[], TOptions &options) {
    enum {
        OPT_COLOR = 256,
        OPT_NO_COLOR,
    };

    static struct option long_options[] = {
        {"help",         no_argument,       0,  'h' },
        {"version",      no_argument,       0,  'v' },
        {"system-users", no_argument,       0,  's' },
        {"users",        no_argument,       0,  'u' },
        {"all-users",    no_argument,       0,  'a' },
        {"show-full",    no_argument,       0,  'F' },
        {"config",       required_argument, 0,  'c' },
        {"verbose",      no_argument,       0,  'V' },
        {"color",        no_argument,       0,  OPT_COLOR },
        {"no-color",     no_argument,       0,  OPT_NO_COLOR },
        {0,              0,                 0,   0   }
    };

    int opt, long_index = 0;

    optind = 0;
    while ((opt = getopt_long(argc, argv, "hvsuaFc:V", long_options, &long_index)) != -1) {
        switch (opt) {
            case 'h':
                options.ShowHelp = true;
                break;
            case 'v':
                options.ShowVersion = true;
                break;
            case 's':
                options.ShowSystem = true;
                break;
            case 'u':
                options.ShowUsers = true;
                break;
            case 'a':
                options.ShowAll = true;
                break;
            case 'F':
                options.ShowFull = true;
                break;
            case 'c':
                options.ConfigPath = optarg;
                break;
            case 'V':
                options.Verbose = true;
                break;
            case OPT_COLOR:
                options.UseColor = 1;
                break;
            case OPT_NO_COLOR:
                options.UseColor = 0;
                break;
            default:
                return TError(EError::InvalidValue, "Invalid option {}", argv[optind - 1]);
        }
    }

    if (optind < argc)
        return TError(EError::InvalidValue, "Unexpected argument: {}", argv[optind]);

    return OK;
}

static void Usage(FILE *out) {
    fmt::print(out,
               "Usage: {} [option]...\n"
               "\n"
               "Options:\n"
               "  -s, --system-users    show system users on the device\n"
               "  -u, --users           show users on this device (default)\n"
               "  -a, --all-users       show all users on this device\n"
               "  -F, --show-full       show the full user information\n"
               "  -v, --version         show version\n"
               "  -c, --config=<file>   read configuration from file\n"
               "      --color           force colored output\n"
               "      --no-color        disable colored output\n"
               "  -V, --verbose         verbose logging\n"
               "  -h, --help\n",
               program_invocation_short_name);
}

static void PrintLine(const std::string &line, fmt::terminal_color color, bool colored) {
    if (colored)
        fmt::print(fmt::fg(color) | fmt::emphasis::bold, "{}", line);
    else
        fmt::print("{}", line);
    fmt::print("\n");
}

static int ShowReport(const TOptions &options) {
    bool implicit;
    EAccountScope scope = options.Scope(implicit);

    auto &history = config().login_history();
    TLastCommand last(std::vector<std::string>(history.command().begin(), history.command().end()),
                      history.timeout_ms(), history.max_output());
    std::vector<std::string> groups(config().privilege().group().begin(),
                                    config().privilege().group().end());

    TSources sources;
    TError error = sources.Load(TSourcePaths::FromConfig(), last, groups);
    if (error) {
        L_VERBOSE("Cannot load sources: {}", error);
        fmt::print(stderr, "{}\n", error.Message());
        return EXIT_FAILURE;
    }

    TReport report = BuildReport(sources, scope, options.Detail());

    bool colored = options.UseColor >= 0 ? options.UseColor : config().report().color();
    colored = colored && isatty(STDOUT_FILENO);

    PrintLine(ScopeLabel(scope, implicit), fmt::terminal_color::magenta, colored);
    fmt::print("\n");

    auto lines = RenderTable(report.Header, report.Rows);
    for (size_t i = 0; i < lines.size(); i++)
        PrintLine(lines[i], i ? fmt::terminal_color::cyan : fmt::terminal_color::green, colored);

    std::fflush(stdout);

    return EXIT_SUCCESS;
}

int RunCli(int argc, char *argv[]) {
    TOptions options;

    TError error = ParseOptions(argc, argv, options);
    if (error) {
        fmt::print(stderr, "{}\n", error.Message());
        Usage(stderr);
        return EXIT_USAGE;
    }

    if (options.ShowHelp) {
        Usage(stdout);
        return EXIT_SUCCESS;
    }

    Verbose |= options.Verbose;

    if (options.ShowVersion) {
        fmt::print("Version: {}\n", LSACCOUNTS_VERSION);
        return EXIT_SUCCESS;
    }

    ReadConfigs(options.ConfigPath);

    return ShowReport(options);
}

#include "cli.hpp"
#include "util/log.hpp"

int main(int argc, char *argv[]) {
    OpenLog();
    return RunCli(argc, argv);
}

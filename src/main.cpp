// cmd-runner main: run a script or executable with console classification
#include <cmd-runner/cli/cli.hpp>

int main(int argc, char* argv[]) {
    return cmdrun::run_cli(argc, argv);
}

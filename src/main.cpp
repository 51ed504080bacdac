#include "presentation/cli.h"

int main(int argc, char* argv[]) {
    ip6gen::presentation::CLIManager cli;
    return cli.run(argc, argv);
}

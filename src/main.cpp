#include "cosign/cli.hpp"

int main(int argc, char *argv[])
{
    return cosign::cli::run(argc, argv);
}

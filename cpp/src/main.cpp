#include "covenant/cli.hpp"

int main(int argc, char *argv[])
{
    return covenant::cli::run(argc, argv);
}

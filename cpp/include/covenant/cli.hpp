#pragma once

namespace covenant::cli
{
    /**
     * Entry point for the covenant command line tool.
     * Returns 0 on success, 2 when a license is rejected, 1 on any other error.
     */
    int run(int argc, char *argv[]);
}

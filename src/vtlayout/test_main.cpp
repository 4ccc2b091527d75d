// SPDX-License-Identifier: Apache-2.0
#include <crispy/logstore.h>

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <cstdlib>

int main(int argc, char const* argv[])
{
    if (char const* logFilterString = std::getenv("LOG"); logFilterString)
    {
        logstore::configure(logFilterString);
        logstore::enable_console_output();
    }

    return Catch::Session().run(argc, argv);
}

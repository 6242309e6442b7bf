// the only translation unit that defines DOCTEST_CONFIG_IMPLEMENT
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include <cstdlib>
#include <cstring>

namespace
{
    bool envTruthy(const char *v)
    {
        return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
    }
}

int main(int argc, char **argv)
{
    doctest::Context context;

    // defaults, command line flags override them
    context.setOption("order-by", "name");
    context.setOption("duration", true);

    if (envTruthy(std::getenv("CI")))
    {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    context.applyCommandLine(argc, argv);

    const int res = context.run();
    if (context.shouldExit())
        return res;
    return res;
}

// lcg_runner: prints the draw sequence of the LCG for a seed
//
// Produces reference sequences so another implementation of the generator can
// be checked value by value against this one.
//
// Usage:
//   lcg_runner [options]
//     --seed <hex|dec|now>          Seed (default: 0xC0FFEE)
//     --count <n>                   Number of draws, or permutation size (default: 10)
//     --mode <mode>                 int|float|range|perm|path (default: int)
//     --range <n>                   Exclusive bound for range mode (default: 10)
//     --radius <r>                  Cardioid radius for path mode (default: 1)
//     --config <file.json>          Load settings; later flags override them
//     --json                        Output as JSON instead of plain text
//     --quiet                       Only output the values
//     -h, --help                    Print usage
//
// Exit codes: 0 success, 1 usage or config error, 2 generator error.

#include <cstdio>
#include <string>
#include <vector>

#include "core/CrashHandler.hpp"
#include "core/Log.hpp"
#include "tools/Runner.hpp"

int main(int argc, char* argv[]) {
    CrashHandler::Init();

    const std::vector<std::string> args(argv, argv + argc);
    std::string out;
    const int rc = RunRunner(args, out);
    std::fputs(out.c_str(), stdout);

    Log::Shutdown();
    return rc;
}

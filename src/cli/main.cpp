#include <scrub/cli.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace scrub;

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto parsed = parse_args(args);
    if (parsed.is_err()) {
        log::report(parsed.error());
        return 1;
    }

    return run(parsed.value(), std::cin, std::cerr);
}

#include "Monitor.hpp"
#include "Options.hpp"
#include "Errors.hpp"

#include <print>
#include <cstdio>

int main(int argc, char* argv[]) {
    try {
        auto options = parse_options(argc, argv);
        if (!options) return 0;

        Monitor m(std::move(*options));
        return m.run();
    }

    catch (const UsageError& ex) {
        std::println(stderr, "{}\n\n{}", ex.what(), usage_text());
        return 1;
    }

    catch (const ConfigError& ex) {
        std::println(stderr, "configuration error: {}", ex.what());
        return 1;
    }

    catch (const std::exception& ex) {
        std::println(stderr, "{}", ex.what());
        return 1;
    }
}

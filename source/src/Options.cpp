#include "Options.hpp"
#include "Utils.hpp"

#include <print>
#include <format>
#include <vector>
#include <sstream>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace {
    po::options_description describe() {
        po::options_description desc("fleetprobe options");

        desc.add_options()
            ("help,h", "show this help")
            ("config,c", po::value<std::string>()->default_value("model_servers.yaml"), "server list (YAML)")
            ("console", po::bool_switch(), "plain console report instead of the live display")
            ("delay,d", po::value<long long>()->default_value(0), "seconds between rounds, 0 runs once")
            ("timeout,t", po::value<long long>()->default_value(30000), "per-probe timeout in milliseconds")
            ("only", po::value<std::vector<std::string>>()->composing(), "probe only these ids (repeatable, comma separated)")
            ("skip-openai", po::bool_switch(), "leave out servers hosted on api.openai.com")
            ("log-level", po::value<std::string>()->default_value("info"), "debug, info, warn, error or off")
            ("log-file", po::value<std::string>(), "write diagnostics here instead of stderr")
            ("refresh-ms", po::value<long long>()->default_value(250), "live display refresh interval in milliseconds");

        return desc;
    }
}

std::string usage_text() {
    std::ostringstream os;
    os << "usage: fleetprobe [options]\n\n" << describe();
    return os.str();
}

std::optional<MonitorOptions> parse_options(int argc, const char* const argv[]) {
    auto desc = describe();
    po::variables_map vm;

    try {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);
    }
    catch (const po::error& e) {
        throw UsageError(e.what());
    }

    if (vm.count("help")) {
        std::print("{}", usage_text());
        return std::nullopt;
    }

    MonitorOptions opts;

    opts.config_path = vm["config"].as<std::string>();
    opts.console = vm["console"].as<bool>();
    opts.filter.skip_openai = vm["skip-openai"].as<bool>();

    auto delay = vm["delay"].as<long long>();
    if (delay < 0) throw UsageError(std::format("--delay must not be negative, got {}", delay));
    opts.delay = std::chrono::seconds(delay);

    auto timeout = vm["timeout"].as<long long>();
    if (timeout <= 0) throw UsageError(std::format("--timeout must be positive, got {}", timeout));
    opts.timeout = std::chrono::milliseconds(timeout);

    auto refresh = vm["refresh-ms"].as<long long>();
    if (refresh < 10) throw UsageError(std::format("--refresh-ms must be at least 10, got {}", refresh));
    opts.refresh = std::chrono::milliseconds(refresh);

    if (vm.count("only")) {
        for (const auto& arg: vm["only"].as<std::vector<std::string>>()) {
            for (auto& id: split_list(arg)) opts.filter.only.push_back(std::move(id));
        }
    }

    auto level_name = vm["log-level"].as<std::string>();
    auto level = parse_log_level(level_name);
    if (!level) throw UsageError(std::format("unknown log level '{}'", level_name));
    opts.log_level = *level;

    if (vm.count("log-file")) opts.log_file = vm["log-file"].as<std::string>();

    return opts;
}

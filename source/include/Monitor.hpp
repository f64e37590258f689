#pragma once

#include "Options.hpp"
#include "Renderer.hpp"
#include "HttpProbe.hpp"
#include "StatusStore.hpp"
#include "ShutdownSignal.hpp"
#include "PollingScheduler.hpp"
#include "RoundCoordinator.hpp"

#include <cstdio>
#include <memory>
#include <vector>

#include <boost/asio.hpp>

// Owns the event loop and every component, wires them together and turns the run into an exit code.
class Monitor {
public:
    // loads and filters the server list, throws ConfigError / UsageError
    explicit Monitor(MonitorOptions options);
    ~Monitor();

    Monitor(const Monitor&) = delete;
    Monitor& operator=(const Monitor&) = delete;

    int run();

    // 1 when the run itself broke, 2 when a one-shot round had no successes, else 0
    static int exit_code(const SchedulerResult& result, bool failed);

private:
    struct FileCloser {
        void operator()(std::FILE* f) const { if (f) std::fclose(f); }
    };

    static std::unique_ptr<std::FILE, FileCloser> open_log(const MonitorOptions& options);
    static std::vector<ServerDescriptor> load_servers(const MonitorOptions& options);

    boost::asio::awaitable<void> supervise();
    void watch_signals();

    MonitorOptions _options;
    std::unique_ptr<std::FILE, FileCloser> _log_file;

    boost::asio::io_context _ioc;
    boost::asio::signal_set _signals;
    ShutdownSignal _shutdown;

    StatusStore _store;
    std::shared_ptr<HttpProbe> _probe;
    RoundCoordinator _coordinator;
    std::unique_ptr<Renderer> _renderer;
    std::unique_ptr<PollingScheduler> _scheduler;

    SchedulerResult _result;
    bool _failed = false;
};

#include "Monitor.hpp"
#include "RendererFactory.hpp"
#include "ServerConfig.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <csignal>
#include <cstring>
#include <cerrno>
#include <format>

std::unique_ptr<std::FILE, Monitor::FileCloser> Monitor::open_log(const MonitorOptions& options) {
    std::unique_ptr<std::FILE, FileCloser> file;

    if (options.log_file) {
        file.reset(std::fopen(options.log_file->c_str(), "a"));
        if (!file) throw UsageError(std::format("cannot open log file {}: {}", *options.log_file, std::strerror(errno)));
    }

    Log::configure(options.log_level, file ? file.get() : stderr);

    return file;
}

std::vector<ServerDescriptor> Monitor::load_servers(const MonitorOptions& options) {
    auto all = load_server_config(options.config_path);
    auto servers = filter_servers(all, options.filter);

    Log::info("loaded {} server(s) from {}, probing {}", all.size(), options.config_path, servers.size());

    return servers;
}

Monitor::Monitor(MonitorOptions options):
    _options(std::move(options)),
    _log_file(open_log(_options)),
    _signals(_ioc, SIGINT, SIGTERM),
    _shutdown(_ioc.get_executor()),
    _store(load_servers(_options)),
    _probe(std::make_shared<HttpProbe>()),
    _coordinator(_ioc.get_executor(), _probe)
    {
        auto kind = _options.console ? RendererKind::Console : RendererKind::Interactive;
        _renderer = make_renderer(kind, _ioc.get_executor(), _store, _shutdown, _options.delay, _options.refresh);

        // anything written to the terminal would tear the live display
        if (_renderer->is_interactive() && !_log_file) Log::configure(LogLevel::Off, stderr);

        SchedulerOptions so;
        so.probe_timeout = _options.timeout;
        so.delay = _options.delay;

        _scheduler = std::make_unique<PollingScheduler>(_ioc.get_executor(), _coordinator, _store, *_renderer, _shutdown, so);
    }

Monitor::~Monitor() {
    // the file goes away with us
    if (_log_file) Log::configure(Log::level(), stderr);
}

void Monitor::watch_signals() {
    _signals.async_wait([this](boost::system::error_code ec, int signo) {
        if (ec) return;

        if (_shutdown.requested()) {
            Log::warn("signal {} received again, stopping now", signo);
            _ioc.stop();
            return;
        }

        Log::info("signal {} received, finishing the current round", signo);
        _shutdown.request();

        watch_signals();
    });
}

boost::asio::awaitable<void> Monitor::supervise() {
    _renderer->start();

    _result = co_await _scheduler->run();

    // one-shot live display stays up until the user quits
    if (_renderer->is_interactive() && _result.final_state == SchedulerState::Idle) co_await _shutdown.async_wait();

    _renderer->stop();

    boost::system::error_code ec;
    _signals.cancel(ec);
}

int Monitor::run() {
    watch_signals();

    boost::asio::co_spawn(_ioc, supervise(), [this](std::exception_ptr ep) {
        if (!ep) return;

        try {
            std::rethrow_exception(ep);
        }
        catch (const std::exception& e) {
            Log::error("monitor stopped: {}", e.what());
        }

        _failed = true;
        _renderer->stop();
        _ioc.stop();
    });

    _ioc.run();

    // a forced stop leaves the terminal to us
    _renderer->stop();

    return exit_code(_result, _failed);
}

int Monitor::exit_code(const SchedulerResult& result, bool failed) {
    if (failed) return 1;
    if (result.rounds == 1 && result.final_state == SchedulerState::Idle && result.last_round_all_failed) return 2;

    return 0;
}

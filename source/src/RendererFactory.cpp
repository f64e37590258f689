#include "RendererFactory.hpp"
#include "ConsoleRenderer.hpp"
#include "InteractiveRenderer.hpp"
#include "Log.hpp"

#include <iostream>

#include <unistd.h>

std::unique_ptr<Renderer> make_renderer(RendererKind kind,
                                        boost::asio::any_io_executor exec,
                                        const StatusStore& store,
                                        ShutdownSignal& shutdown,
                                        std::chrono::seconds delay,
                                        std::chrono::milliseconds refresh) {
    const bool tty = ::isatty(STDOUT_FILENO) == 1;

    if (kind == RendererKind::Interactive) {
        if (tty) return std::make_unique<InteractiveRenderer>(exec, store, shutdown, std::cout, STDIN_FILENO, refresh);

        Log::warn("stdout is not a terminal, using the console renderer");
    }

    return std::make_unique<ConsoleRenderer>(std::cout, tty, delay);
}

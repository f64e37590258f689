#include "InteractiveRenderer.hpp"
#include "Errors.hpp"
#include "Utils.hpp"
#include "Log.hpp"

#include <format>
#include <utility>
#include <algorithm>

#include <poll.h>
#include <unistd.h>
#include <sys/ioctl.h>

namespace {
    constexpr std::string_view GREEN  = "\x1B[32m";
    constexpr std::string_view RED    = "\x1B[31m";
    constexpr std::string_view CYAN   = "\x1B[36m";
    constexpr std::string_view YELLOW = "\x1B[33m";
    constexpr std::string_view BLUE   = "\x1B[34m";
    constexpr std::string_view DIM    = "\x1B[2m";
    constexpr std::string_view BOLD   = "\x1B[1m";
    constexpr std::string_view RESET  = "\x1B[0m";

    constexpr int HEADER_HEIGHT = 3;
    constexpr int FOOTER_HEIGHT = 3;

    constexpr std::string_view HELP_TEXT = "Press 'q' to quit, 'r' to refresh";

    // pads or cuts to `width` columns, one column per code point
    std::string fit(std::string_view s, size_t width) {
        auto len = utf8_length(s);

        if (len <= width) return std::string(s) + std::string(width - len, ' ');
        if (width <= 3) return std::string(utf8_prefix(s, width));
        return std::string(utf8_prefix(s, width - 3)) + "...";
    }

    std::string boxed(std::string_view text, std::string_view colour, size_t width) {
        if (width < 2) return std::string(width, ' ');

        auto inner = fit(text, width - 2);
        if (colour.empty()) return "|" + inner + "|";

        return std::format("|{}{}{}|", colour, inner, RESET);
    }

    std::string border(size_t width, std::string_view title = {}) {
        if (width < 2) return std::string(width, ' ');

        std::string line = "+" + std::string(width - 2, '-') + "+";

        if (!title.empty() && title.size() + 4 <= width) {
            auto at = (width - title.size()) / 2;
            line.replace(at, title.size(), title);
        }

        return line;
    }

    // same grid rules the curses version used
    std::pair<int, int> grid_for(size_t n) {
        if (n <= 2) return { 1, static_cast<int>(std::max<size_t>(n, 1)) };
        if (n <= 4) return { 2, 2 };
        if (n <= 6) return { 2, 3 };
        if (n <= 9) return { 3, 3 };
        return { static_cast<int>((n + 2) / 3), 3 };
    }
}

InteractiveRenderer::InteractiveRenderer(boost::asio::any_io_executor exec,
                                         const StatusStore& store,
                                         ShutdownSignal& shutdown,
                                         std::ostream& out,
                                         int input_fd,
                                         std::chrono::milliseconds tick):
    _exec(exec),
    _store(store),
    _shutdown(shutdown),
    _out(out),
    _input_fd(input_fd),
    _tick(tick),
    _wake(exec)
    {
        _footer = { "Ready to start tests...", Tone::Normal, std::chrono::system_clock::now() };
    }

InteractiveRenderer::~InteractiveRenderer() {
    restore_terminal();
}

void InteractiveRenderer::enter_terminal() {
    if (::isatty(_input_fd) == 1) {
        termios current{};

        if (::tcgetattr(_input_fd, &current) == 0) {
            _saved_termios = current;

            termios raw = current;
            raw.c_lflag &= ~(ICANON | ECHO);
            raw.c_cc[VMIN] = 0;
            raw.c_cc[VTIME] = 0;

            if (::tcsetattr(_input_fd, TCSANOW, &raw) != 0) Log::warn("could not switch terminal to raw mode");
        }
    }

    // alternate screen, hidden cursor
    _out << "\x1B[?1049h\x1B[?25l";
    _out.flush();
    _alt_screen = true;
}

void InteractiveRenderer::restore_terminal() {
    if (_alt_screen) {
        _out << "\x1B[0m\x1B[?25h\x1B[?1049l";
        _out.flush();
        _alt_screen = false;
    }

    if (_saved_termios) {
        ::tcsetattr(_input_fd, TCSANOW, &*_saved_termios);
        _saved_termios.reset();
    }
}

void InteractiveRenderer::start() {
    if (_started) return;
    _started = true;

    enter_terminal();

    _shutdown.on_request([this] {
        set_footer("Exiting test runner...", Tone::Normal);
        _wake.cancel();
    });

    boost::asio::co_spawn(_exec, refresh_loop(), boost::asio::detached);
}

void InteractiveRenderer::stop() {
    if (_stopped) return;
    _stopped = true;

    _wake.cancel();

    if (_started) {
        // last frame carries the exit message
        try {
            draw();
        }
        catch (const RenderError& e) {
            Log::warn("final redraw failed: {}", e.what());
        }
    }

    restore_terminal();
}

void InteractiveRenderer::set_footer(std::string message, Tone tone) {
    _footer = { std::move(message), tone, std::chrono::system_clock::now() };
}

void InteractiveRenderer::round_started(uint64_t round) {
    _round = round;
    _round_running = true;

    set_footer("Starting tests on all servers...", Tone::Normal);
    _wake.cancel();
}

void InteractiveRenderer::render_round(const RoundSnapshot& snapshot, const StatusView& status) {
    _round = snapshot.round;
    _round_running = false;

    if (snapshot.all_succeeded()) set_footer("All tests completed successfully!", Tone::Good);
    else set_footer(std::format("Some tests failed. ({}/{} ok)", snapshot.successes(), snapshot.outcomes.size()), Tone::Bad);

    // the refresh loop reads the store itself; waking it is the notification
    _wake.cancel();
}

void InteractiveRenderer::render_waiting(std::chrono::seconds remaining, std::chrono::seconds total) {
    if (total.count() <= 0) return;

    auto percent = static_cast<int>((total.count() - remaining.count()) * 100 / total.count());
    auto filled = static_cast<size_t>(20 * percent / 100);

    auto bar = "[" + std::string(filled, '=') + std::string(20 - std::min<size_t>(filled, 20), ' ') + "]";

    set_footer(std::format("NEXT TEST: {}s remaining {} {}%", remaining.count(), bar, percent), Tone::Countdown);
}

void InteractiveRenderer::handle_key(char key) {
    switch (key) {
        case 'q':
        case 'Q':
            _shutdown.request();
            break;

        case 'r':
        case 'R':
            _clear_next = true;
            _wake.cancel();
            break;

        default:
            break;
    }
}

void InteractiveRenderer::poll_keys() {
    if (!_input_open) return;

    pollfd pfd{ _input_fd, POLLIN, 0 };

    while (::poll(&pfd, 1, 0) > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
        char buf[32];
        auto n = ::read(_input_fd, buf, sizeof(buf));

        if (n <= 0) {
            // closed or unreadable stdin, keys are simply unavailable from here on
            _input_open = false;
            return;
        }

        for (ssize_t i = 0; i < n; ++i) handle_key(buf[i]);
    }
}

std::pair<int, int> InteractiveRenderer::terminal_size() const {
    winsize ws{};

    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0 && ws.ws_col > 0) return { ws.ws_row, ws.ws_col };

    return { 24, 80 };
}

std::vector<InteractiveRenderer::Line> InteractiveRenderer::panel_lines(const ServerDescriptor& sd, const ServerStatus* status) const {
    std::vector<Line> lines;

    lines.push_back({ std::format(" {} | {} ", sd.host_label, sd.api_base_url), DIM });
    lines.push_back({ std::format("Model: {}", sd.model_name), DIM });

    if (_round_running) {
        lines.push_back({ "Status: Running", YELLOW });
    }
    else if (!status) {
        lines.push_back({ "Status: Waiting", {} });
    }
    else if (status->last_outcome.ok()) {
        lines.push_back({ "Status: Success", GREEN });
    }
    else {
        lines.push_back({ std::format("Status: Failed ({})", to_string(status->last_outcome.status)), RED });
    }

    if (!status) return lines;

    const auto& last = status->last_outcome;

    lines.push_back({ std::format("Started: {} | Time: {:.2f}s", clock_string(last.issued_at),
                                  static_cast<double>(last.duration.count()) / 1000.0), BLUE });

    if (last.ok()) {
        auto tokens = last.tokens && last.tokens->known() ? std::to_string(last.tokens->total) : std::string("unknown");

        lines.push_back({ std::format("Response: {} | Tokens: {}", last.reply.empty() ? "EMPTY" : "OK", tokens), GREEN });
        if (!last.reply.empty()) lines.push_back({ last.reply, {} });
    }
    else {
        lines.push_back({ last.error_detail.value_or(""), RED });
    }

    auto streak_colour = status->consecutive_failures > 0 ? RED : std::string_view{};

    lines.push_back({ std::format("Failures in a row: {}", status->consecutive_failures), streak_colour });
    lines.push_back({ std::format("Rounds ok: {}/{} ({:.0f}%)", status->total_successes, status->total_rounds,
                                  status->success_ratio() * 100.0), {} });

    // newest first, whatever does not fit the panel is cut by compose_frame
    lines.push_back({ "History:", DIM });

    for (auto it = status->recent.rbegin(); it != status->recent.rend(); ++it) {
        auto seconds = static_cast<double>(it->duration.count()) / 1000.0;

        if (it->ok()) lines.push_back({ std::format("[{}] OK {:.2f}s", clock_string(it->issued_at), seconds), GREEN });
        else lines.push_back({ std::format("[{}] {} {:.2f}s", clock_string(it->issued_at), to_string(it->status), seconds), RED });
    }

    return lines;
}

std::string InteractiveRenderer::compose_frame(const StatusView& status, int rows, int cols) const {
    rows = std::max(rows, HEADER_HEIGHT + FOOTER_HEIGHT + 3);
    cols = std::max(cols, 20);

    const auto width = static_cast<size_t>(cols);
    const auto& servers = _store.servers();

    std::vector<std::string> screen;
    screen.reserve(static_cast<size_t>(rows));

    // header
    auto title = _round > 0 ? std::format("MODEL SERVER TESTING - ITERATION {}", _round) : std::string("MODEL SERVER TESTING");
    auto pad = (width - 2 > title.size()) ? (width - 2 - title.size()) / 2 : 0;

    screen.push_back(border(width));
    screen.push_back(std::format("|{}{}{}{}|", BOLD, CYAN, fit(std::string(pad, ' ') + title, width - 2), RESET));
    screen.push_back(border(width));

    // server grid
    auto [grid_rows, grid_cols] = grid_for(servers.size());
    const int avail = rows - HEADER_HEIGHT - FOOTER_HEIGHT;
    const int panel_h = std::max(avail / grid_rows, 2);
    const size_t panel_w = width / static_cast<size_t>(grid_cols);

    for (int gr = 0; gr < grid_rows; ++gr) {
        std::vector<std::vector<Line>> contents;
        std::vector<std::string> titles;

        for (int gc = 0; gc < grid_cols; ++gc) {
            auto idx = static_cast<size_t>(gr * grid_cols + gc);

            if (idx < servers.size()) {
                contents.push_back(panel_lines(servers[idx], status.find(servers[idx].id)));
                titles.push_back(std::format(" {} ", servers[idx].id));
            }
            else {
                contents.emplace_back();
                titles.emplace_back();
            }
        }

        for (int y = 0; y < panel_h && static_cast<int>(screen.size()) < rows - FOOTER_HEIGHT; ++y) {
            std::string row;

            for (int gc = 0; gc < grid_cols; ++gc) {
                auto idx = static_cast<size_t>(gr * grid_cols + gc);
                if (idx >= servers.size()) { row += std::string(panel_w, ' '); continue; }

                const auto& lines = contents[static_cast<size_t>(gc)];

                if (y == 0 || y == panel_h - 1) row += border(panel_w, y == 0 ? std::string_view(titles[static_cast<size_t>(gc)]) : std::string_view{});
                else if (static_cast<size_t>(y - 1) < lines.size()) row += boxed(lines[static_cast<size_t>(y - 1)].text, lines[static_cast<size_t>(y - 1)].colour, panel_w);
                else row += boxed("", {}, panel_w);
            }

            screen.push_back(std::move(row));
        }
    }

    while (static_cast<int>(screen.size()) < rows - FOOTER_HEIGHT) screen.emplace_back();

    // footer
    std::string_view tone_colour;
    switch (_footer.tone) {
        case Tone::Good:      tone_colour = GREEN; break;
        case Tone::Bad:       tone_colour = RED; break;
        case Tone::Countdown: tone_colour = BLUE; break;
        case Tone::Normal:    break;
    }

    auto message = std::format(" [{}] {}", clock_string(_footer.at), _footer.message);
    auto inner = width - 2;

    std::string footer_text;
    if (message.size() + HELP_TEXT.size() + 2 <= inner) {
        footer_text = message + std::string(inner - message.size() - HELP_TEXT.size() - 1, ' ') + std::string(HELP_TEXT) + " ";
    }
    else {
        footer_text = fit(message, inner);
    }

    screen.push_back(border(width));
    screen.push_back(std::format("|{}{}{}|", tone_colour, fit(footer_text, inner), RESET));
    screen.push_back(border(width));

    std::string frame;
    for (size_t i = 0; i < screen.size(); ++i) {
        frame += screen[i];
        frame += "\x1B[K";
        if (i + 1 < screen.size()) frame += "\r\n";
    }

    return frame;
}

void InteractiveRenderer::draw() {
    auto [rows, cols] = terminal_size();
    auto frame = compose_frame(*_store.snapshot(), rows, cols);

    if (_clear_next) {
        _out << "\x1B[2J";
        _clear_next = false;
    }

    _out << "\x1B[H" << frame;
    _out.flush();

    if (!_out) throw RenderError("terminal output failed");

    ++_frames;
}

boost::asio::awaitable<void> InteractiveRenderer::refresh_loop() {
    boost::system::error_code ec;

    while (!_stopped && !_shutdown.requested()) {
        poll_keys();

        try {
            draw();
        }
        catch (const RenderError& e) {
            Log::error("redraw failed: {}", e.what());
        }

        if (_shutdown.requested() || _stopped) break;

        _wake.expires_after(_tick);
        co_await _wake.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

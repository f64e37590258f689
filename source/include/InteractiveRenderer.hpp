#pragma once

#include "Renderer.hpp"
#include "StatusStore.hpp"
#include "ShutdownSignal.hpp"

#include <chrono>
#include <string>
#include <vector>
#include <ostream>
#include <optional>
#include <string_view>

#include <termios.h>

#include <boost/asio.hpp>

// Full screen grid of server panels. A refresh coroutine redraws on every tick and
// immediately when a round lands; 'q' requests shutdown, 'r' clears and redraws.
// Everything here runs on the executor thread, so no locking.
class InteractiveRenderer: public Renderer {
public:
    InteractiveRenderer(boost::asio::any_io_executor exec,
                        const StatusStore& store,
                        ShutdownSignal& shutdown,
                        std::ostream& out,
                        int input_fd,
                        std::chrono::milliseconds tick);

    ~InteractiveRenderer() override;

    bool is_interactive() const override { return true; }

    void start() override;
    void stop() override;

    void round_started(uint64_t round) override;
    void render_round(const RoundSnapshot& snapshot, const StatusView& status) override;
    void render_waiting(std::chrono::seconds remaining, std::chrono::seconds total) override;

    std::string compose_frame(const StatusView& status, int rows, int cols) const;

    // one keystroke, as read from the terminal
    void handle_key(char key);

    uint64_t frames_drawn() const { return _frames; }

private:
    enum class Tone { Normal, Good, Bad, Countdown };

    struct Footer {
        std::string message;
        Tone tone = Tone::Normal;
        std::chrono::system_clock::time_point at;
    };

    struct Line {
        std::string text;
        std::string_view colour{};
    };

    [[nodiscard]] boost::asio::awaitable<void> refresh_loop();

    void poll_keys();
    void draw();
    void set_footer(std::string message, Tone tone);

    std::pair<int, int> terminal_size() const;
    void enter_terminal();
    void restore_terminal();

    std::vector<Line> panel_lines(const ServerDescriptor& sd, const ServerStatus* status) const;

    boost::asio::any_io_executor _exec;
    const StatusStore& _store;
    ShutdownSignal& _shutdown;
    std::ostream& _out;
    int _input_fd;
    std::chrono::milliseconds _tick;

    boost::asio::steady_timer _wake;

    uint64_t _round{};
    bool _round_running = false;
    Footer _footer;

    bool _clear_next = true;
    bool _started = false;
    bool _stopped = false;
    bool _input_open = true;
    uint64_t _frames{};

    std::optional<termios> _saved_termios;
    bool _alt_screen = false;
};

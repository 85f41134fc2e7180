#include "cli/terminal_input.hpp"

#include <csignal>

#include "pps_types.hpp"

#ifdef _WIN32
// Windows implementation
#include <conio.h>

namespace pps {

namespace {
HANDLE g_in = INVALID_HANDLE_VALUE;
DWORD g_saved_mode = 0;
volatile std::sig_atomic_t g_raw_active = 0;

void RestoreOnSignal(int sig) {
    if (g_raw_active) SetConsoleMode(g_in, g_saved_mode);
    std::signal(sig, SIG_DFL);
    std::raise(sig);
}
} // namespace

void TerminalInput::SetRaw() {
    if (h_in_ == INVALID_HANDLE_VALUE) return;
    DWORD new_mode = original_mode_;
    new_mode &= ~(ENABLE_LINE_INPUT | ENABLE_ECHO_INPUT | ENABLE_PROCESSED_INPUT);
    SetConsoleMode(h_in_, new_mode);
    g_raw_active = 1;
}

void TerminalInput::Restore() {
    if (h_in_ != INVALID_HANDLE_VALUE) {
        SetConsoleMode(h_in_, original_mode_);
    }
    g_raw_active = 0;
}

TerminalInput::TerminalInput() {
    h_in_ = GetStdHandle(STD_INPUT_HANDLE);
    if (h_in_ == INVALID_HANDLE_VALUE || !GetConsoleMode(h_in_, &original_mode_)) {
        throw ProfileError(ProfileErrc::TerminalIo, "Interactive selection requires a terminal on stdin");
    }
    g_in = h_in_;
    g_saved_mode = original_mode_;
    std::signal(SIGINT, RestoreOnSignal);
    std::signal(SIGTERM, RestoreOnSignal);
    SetRaw();
}

TerminalInput::~TerminalInput() {
    Restore();
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}

int TerminalInput::GetChar() {
    int ch = _getch();
    if (ch == EOF) {
        throw ProfileError(ProfileErrc::TerminalIo, "Failed to read from terminal");
    }
    if (ch == 3) { // Ctrl+C
        return CTRL_C;
    }
    if (ch == 0 || ch == 224) { // Special key
        ch = _getch();
        switch (ch) {
            case 72: return UP;
            case 80: return DOWN;
            case 75: return LEFT;
            case 77: return RIGHT;
            case 83: return DEL;
            default: return UNKNOWN;
        }
    }
    switch (ch) {
        case 8:  return BACKSPACE;
        case 9:  return TAB;
        case 13: return ENTER;
        case 27: return ESC;
        default: return ch; // Printable char
    }
}

} // namespace pps

#else
// Unix (Linux/macOS) implementation
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace pps {

namespace {
// Follow-up bytes of an escape sequence arrive together; a lone ESC does not.
constexpr int kEscapeTimeoutMs = 50;

struct termios g_saved_termios;
volatile std::sig_atomic_t g_raw_active = 0;
const int kRestoreSignals[] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};

void RestoreOnSignal(int sig) {
    if (g_raw_active) tcsetattr(STDIN_FILENO, TCSAFLUSH, &g_saved_termios);
    std::signal(sig, SIG_DFL);
    std::raise(sig);
}

int ArrowKey(char final_byte) {
    switch (final_byte) {
        case 'A': return UP;
        case 'B': return DOWN;
        case 'C': return RIGHT;
        case 'D': return LEFT;
        default: return UNKNOWN;
    }
}
} // namespace

void TerminalInput::SetRaw() {
    struct termios raw = original_termios_;
    raw.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
    raw.c_oflag &= ~(OPOST);
    raw.c_cflag |= (CS8);
    raw.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) == -1) {
        throw ProfileError(ProfileErrc::TerminalIo,
                           std::string("Failed to enter raw terminal mode: ") + std::strerror(errno));
    }
    g_raw_active = 1;
}

void TerminalInput::Restore() {
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_termios_);
    g_raw_active = 0;
}

TerminalInput::TerminalInput() {
    if (!isatty(STDIN_FILENO) || tcgetattr(STDIN_FILENO, &original_termios_) == -1) {
        throw ProfileError(ProfileErrc::TerminalIo, "Interactive selection requires a terminal on stdin");
    }
    g_saved_termios = original_termios_;
    for (int sig : kRestoreSignals) std::signal(sig, RestoreOnSignal);
    try {
        SetRaw();
    } catch (...) {
        for (int sig : kRestoreSignals) std::signal(sig, SIG_DFL);
        throw;
    }
}

TerminalInput::~TerminalInput() {
    Restore();
    for (int sig : kRestoreSignals) std::signal(sig, SIG_DFL);
}

// Returns 1 when a byte was read, 0 on timeout or end of input.
int TerminalInput::ReadByte(char& c, int timeout_ms) {
    if (timeout_ms >= 0) {
        struct pollfd pfd{STDIN_FILENO, POLLIN, 0};
        int ready;
        do {
            ready = poll(&pfd, 1, timeout_ms);
        } while (ready == -1 && errno == EINTR);
        if (ready == -1) {
            throw ProfileError(ProfileErrc::TerminalIo, std::string("Failed to poll terminal: ") + std::strerror(errno));
        }
        if (ready == 0) return 0;
    }
    ssize_t n;
    do {
        n = read(STDIN_FILENO, &c, 1);
    } while (n == -1 && errno == EINTR);
    if (n == -1) {
        throw ProfileError(ProfileErrc::TerminalIo, std::string("Failed to read from terminal: ") + std::strerror(errno));
    }
    return static_cast<int>(n);
}

// Parameter bytes are 0x30-0x3F, intermediates 0x20-0x2F, and the final
// byte 0x40-0x7E. Modifier parameters ("1;5A") do not change the key.
int TerminalInput::ReadCsiSequence() {
    std::string params;
    char b;
    while (ReadByte(b, kEscapeTimeoutMs) == 1) {
        const unsigned char u = static_cast<unsigned char>(b);
        if (u >= 0x20 && u <= 0x3F) {
            params.push_back(b);
            continue;
        }
        if (u < 0x40 || u > 0x7E) break;
        if (b == '~') {
            return (params == "3" || params.rfind("3;", 0) == 0) ? DEL : UNKNOWN;
        }
        return ArrowKey(b);
    }
    return UNKNOWN;
}

int TerminalInput::GetChar() {
    char c;
    if (ReadByte(c, -1) != 1) {
        throw ProfileError(ProfileErrc::TerminalIo, "Unexpected end of terminal input");
    }

    if (c == 3) {
        return CTRL_C;
    } else if (c == '\x1b') {
        char next;
        if (ReadByte(next, kEscapeTimeoutMs) != 1) return ESC;
        if (next == '[') return ReadCsiSequence();
        if (next == 'O') { // application cursor mode
            char final_byte;
            if (ReadByte(final_byte, kEscapeTimeoutMs) != 1) return UNKNOWN;
            return ArrowKey(final_byte);
        }
        return UNKNOWN;
    } else if (c == 127 || c == 8) { // Backspace on Mac/Linux
        return BACKSPACE;
    } else if (c == '\n' || c == '\r') {
        return ENTER;
    } else if (c == '\t') {
        return TAB;
    }

    return c;
}

} // namespace pps

#endif

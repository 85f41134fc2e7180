#pragma once

#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <termios.h>
#endif

namespace pps {

// Special key codes returned by GetChar
enum Key {
    // Printable keys are returned as their char value
    UP = 1000,
    DOWN,
    LEFT,
    RIGHT,
    BACKSPACE,
    ENTER,
    TAB,
    DEL,
    ESC,
    CTRL_C,
    UNKNOWN
};

// Puts stdin into raw mode for its lifetime. The saved mode is also restored
// from SIGINT/SIGTERM/SIGHUP/SIGQUIT handlers before the signal is re-raised.
// Throws ProfileError(TerminalIo) when stdin is not a terminal.
class TerminalInput {
public:
    TerminalInput();
    ~TerminalInput();
    TerminalInput(const TerminalInput&) = delete;
    TerminalInput& operator=(const TerminalInput&) = delete;

    // Blocks for one key. Throws ProfileError(TerminalIo) on read failure or EOF.
    int GetChar();

private:
    void Restore();
    void SetRaw();

#ifdef _WIN32
    HANDLE h_in_;
    DWORD original_mode_;
#else
    struct termios original_termios_;
    int ReadByte(char& c, int timeout_ms);
    // Consumes the rest of an "ESC [" sequence through its final byte.
    int ReadCsiSequence();
#endif
};

} // namespace pps

#include <gtest/gtest.h>

#include <csignal>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

#include "cli/selector_session.hpp"
#include "cli/terminal_input.hpp"
#include "pty_stdin.hpp"

using pps::ProfileErrc;
using pps::ProfileError;
using pps::TerminalInput;

namespace {

template <typename T, typename = void>
struct HasPublicRestore : std::false_type {};
template <typename T>
struct HasPublicRestore<T, decltype(std::declval<T&>().Restore())> : std::true_type {};

template <typename T, typename = void>
struct HasPublicSetRaw : std::false_type {};
template <typename T>
struct HasPublicSetRaw<T, decltype(std::declval<T&>().SetRaw())> : std::true_type {};

// Mode switching belongs to construction and destruction only.
static_assert(!HasPublicRestore<TerminalInput>::value, "Restore must not be callable");
static_assert(!HasPublicSetRaw<TerminalInput>::value, "SetRaw must not be callable");
// Every ProfileError carries an explicit code.
static_assert(!std::is_constructible<ProfileError, std::string>::value,
              "ProfileError requires a ProfileErrc");

std::vector<int> ReadKeys(TerminalInput& input, size_t count) {
  std::vector<int> keys;
  for (size_t i = 0; i < count; ++i) keys.push_back(input.GetChar());
  return keys;
}

}  // namespace

TEST(TerminalInputTest, RawModeLastsForObjectLifetime) {
  PtyStdin pty;
  ASSERT_TRUE(pty.Canonical());
  {
    TerminalInput input;
    termios raw = pty.Mode();
    EXPECT_FALSE(raw.c_lflag & ICANON);
    EXPECT_FALSE(raw.c_lflag & ECHO);
    EXPECT_FALSE(raw.c_lflag & ISIG);
  }
  termios restored = pty.Mode();
  EXPECT_TRUE(restored.c_lflag & ICANON);
  EXPECT_TRUE(restored.c_lflag & ECHO);
}

TEST(TerminalInputTest, SigtermRestoresModeBeforeTerminating) {
  PtyStdin pty;
  ASSERT_TRUE(pty.Canonical());

  pid_t child = fork();
  ASSERT_NE(child, -1);
  if (child == 0) {
    try {
      TerminalInput input;
      std::raise(SIGTERM);
    } catch (const ProfileError&) {
      _exit(2);
    }
    _exit(1);
  }

  int status = 0;
  ASSERT_EQ(waitpid(child, &status, 0), child);
  ASSERT_TRUE(WIFSIGNALED(status)) << "child exit status " << status;
  EXPECT_EQ(WTERMSIG(status), SIGTERM);
  termios restored = pty.Mode();
  EXPECT_TRUE(restored.c_lflag & ICANON);
  EXPECT_TRUE(restored.c_lflag & ECHO);
}

TEST(TerminalInputTest, NonTerminalStdinIsRejected) {
  int fds[2];
  ASSERT_EQ(pipe(fds), 0);
  {
    ScopedStdin redirect(fds[0]);
    try {
      TerminalInput input;
      FAIL() << "expected ProfileError";
    } catch (const ProfileError& e) {
      EXPECT_EQ(e.code(), ProfileErrc::TerminalIo);
    }
  }
  close(fds[0]);
  close(fds[1]);
}

TEST(TerminalInputTest, HangupWhileReadingIsTerminalIoError) {
  PtyStdin pty;
  TerminalInput input;
  pty.CloseMaster();
  try {
    input.GetChar();
    FAIL() << "expected ProfileError";
  } catch (const ProfileError& e) {
    EXPECT_EQ(e.code(), ProfileErrc::TerminalIo);
  }
}

TEST(TerminalInputTest, DecodesPlainKeys) {
  PtyStdin pty;
  TerminalInput input;
  pty.Type(std::string("a\r\x7f\t\x03", 5));
  EXPECT_EQ(ReadKeys(input, 5),
            (std::vector<int>{'a', pps::ENTER, pps::BACKSPACE, pps::TAB, pps::CTRL_C}));
}

TEST(TerminalInputTest, LoneEscapeIsEscKey) {
  PtyStdin pty;
  TerminalInput input;
  pty.Type("\x1b");
  EXPECT_EQ(input.GetChar(), pps::ESC);
  pty.Type("\x1b[A");
  EXPECT_EQ(input.GetChar(), pps::UP);
}

TEST(TerminalInputTest, DecodesCursorKeysInBothModes) {
  PtyStdin pty;
  TerminalInput input;
  pty.Type("\x1b[A\x1b[B\x1b[C\x1b[D\x1bOA\x1bOB\x1b[3~");
  EXPECT_EQ(ReadKeys(input, 7),
            (std::vector<int>{pps::UP, pps::DOWN, pps::RIGHT, pps::LEFT, pps::UP, pps::DOWN,
                              pps::DEL}));
}

TEST(TerminalInputTest, LongSequencesAreConsumedWhole) {
  PtyStdin pty;
  TerminalInput input;
  // F5, Ctrl+Up, Alt+Insert, Shift+Delete, Ctrl+Right; each followed by a plain key.
  pty.Type("\x1b[15~x\x1b[1;5Ay\x1b[2;3~z\x1b[3;2~w\x1b[1;5Cv");
  EXPECT_EQ(ReadKeys(input, 10),
            (std::vector<int>{pps::UNKNOWN, 'x', pps::UP, 'y', pps::UNKNOWN, 'z', pps::DEL, 'w',
                              pps::RIGHT, 'v'}));
}

TEST(TerminalInputTest, FunctionKeysLeaveFilterQueryUntouched) {
  PtyStdin pty;
  TerminalInput input;
  pps::SelectorSession session({{"dev", "s3://a"}, {"prod", "s3://b"}});
  pty.Type("\x1b[15~\x1b[1;5A\x1b[24~p\r");
  while (!session.Done()) session.HandleKey(input.GetChar());
  EXPECT_EQ(session.Query(), "p");
  ASSERT_TRUE(session.SelectedName().has_value());
  EXPECT_EQ(*session.SelectedName(), "prod");
}

#pragma once

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <pty.h>
#include <string_view>
#include <termios.h>
#include <thread>
#include <unistd.h>

struct TerminalSnapshot {
  termios tio{};
  int flags = 0;
};

inline TerminalSnapshot snapshot(int fd) {
  TerminalSnapshot ret;
  EXPECT_EQ(tcgetattr(fd, &ret.tio), 0) << strerror(errno);
  ret.flags = fcntl(fd, F_GETFL);
  EXPECT_NE(ret.flags, -1) << strerror(errno);
  return ret;
}

inline void expect_identical(const TerminalSnapshot &a,
                             const TerminalSnapshot &b) {
  EXPECT_EQ(a.tio.c_iflag, b.tio.c_iflag);
  EXPECT_EQ(a.tio.c_oflag, b.tio.c_oflag);
  EXPECT_EQ(a.tio.c_cflag, b.tio.c_cflag);
  EXPECT_EQ(a.tio.c_lflag, b.tio.c_lflag);
  EXPECT_EQ(std::memcmp(a.tio.c_cc, b.tio.c_cc, sizeof(a.tio.c_cc)), 0);
  EXPECT_EQ(cfgetispeed(&a.tio), cfgetispeed(&b.tio));
  EXPECT_EQ(cfgetospeed(&a.tio), cfgetospeed(&b.tio));
  EXPECT_EQ(a.flags, b.flags);
}

// Polls fd until its canonical mode flag reads as wanted, gives up after 5 s
inline bool wait_for_canonical(int fd, bool wanted) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(5);

  while (std::chrono::steady_clock::now() < deadline) {
    termios tio{};
    if (tcgetattr(fd, &tio) == 0 && ((tio.c_lflag & ICANON) != 0) == wanted) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  return false;
}

class PseudoTerminalTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_EQ(openpty(&master, &slave, nullptr, nullptr, nullptr), 0)
        << strerror(errno);
  }

  void TearDown() override {
    if (slave != -1)
      close(slave);
    if (master != -1)
      close(master);
  }

  void type(std::string_view bytes) {
    ASSERT_EQ(write(master, bytes.data(), bytes.size()),
              static_cast<ssize_t>(bytes.size()));
  }

  int master = -1;
  int slave = -1;
};

#include "msh/FileDescriptor.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <utility>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

using namespace msh;

TEST(FileDescriptor, DefaultIsInvalid) {
  FileDescriptor fd;
  EXPECT_EQ(fd.get(), -1);
  EXPECT_FALSE(fd.valid());
}

TEST(FileDescriptor, DestructorClosesFd) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);
  {
    FileDescriptor fd(fds[0]);
    EXPECT_TRUE(fd.valid());
  }
  errno = 0;
  EXPECT_EQ(close(fds[0]), -1);
  EXPECT_EQ(errno, EBADF);
  close(fds[1]);
}

TEST(FileDescriptor, MoveTransfersOwnership) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);
  FileDescriptor writer(fds[1]);
  FileDescriptor a(fds[0]);
  FileDescriptor b(std::move(a));
  EXPECT_EQ(a.get(), -1); // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(b.get(), fds[0]);

  char c = 'x';
  ASSERT_EQ(write(writer.get(), &c, 1), 1) << std::strerror(errno);
  char buf{};
  ASSERT_EQ(read(b.get(), &buf, 1), 1) << std::strerror(errno);
  EXPECT_EQ(buf, 'x');
}

TEST(FileDescriptor, MoveAssignmentClosesPrevious) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);

  FileDescriptor a(fds[0]);
  FileDescriptor b(fds[1]);
  b = std::move(a);

  char c = 'x';
  errno  = 0;
  EXPECT_EQ(write(fds[1], &c, 1), -1);
  EXPECT_EQ(errno, EBADF);
  EXPECT_EQ(a.get(), -1); // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(b.get(), fds[0]);
}

TEST(FileDescriptor, ReleaseGivesUpOwnership) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);

  FileDescriptor fd(fds[0]);
  int            raw = fd.release();
  EXPECT_EQ(raw, fds[0]);
  EXPECT_FALSE(fd.valid());
  EXPECT_EQ(close(raw), 0);
  close(fds[1]);
}

TEST(FileDescriptor, ResetClosesCurrent) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);

  FileDescriptor fd(fds[1]);
  fd.reset();
  EXPECT_FALSE(fd.valid());

  // With the write end closed the reader sees end of file.
  char buf{};
  EXPECT_EQ(read(fds[0], &buf, 1), 0);
  close(fds[0]);
}

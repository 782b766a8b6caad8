#include "msh/FileDescriptor.hpp"

#include <unistd.h>

namespace msh {

FileDescriptor::FileDescriptor(int fd)
    : fd_(fd) {}

FileDescriptor::~FileDescriptor() {
  reset();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.release()) {}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
  if (this != &other) {
    reset(other.release());
  }
  return *this;
}

int FileDescriptor::get() const {
  return fd_;
}

bool FileDescriptor::valid() const {
  return fd_ != -1;
}

int FileDescriptor::release() {
  int old_fd = fd_;
  fd_        = -1;
  return old_fd;
}

void FileDescriptor::reset(int fd) {
  if (fd_ != -1 && fd_ != fd) {
    close(fd_);
  }
  fd_ = fd;
}

} // namespace msh

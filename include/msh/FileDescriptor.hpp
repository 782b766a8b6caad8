#pragma once

namespace msh {

class FileDescriptor {
  int fd_ = -1;

public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd);
  ~FileDescriptor();
  FileDescriptor(FileDescriptor const&)            = delete;
  FileDescriptor& operator=(FileDescriptor const&) = delete;
  FileDescriptor(FileDescriptor&& other) noexcept;
  FileDescriptor& operator=(FileDescriptor&& other) noexcept;

  [[nodiscard]] int  get() const;
  [[nodiscard]] bool valid() const;
  int                release();
  void               reset(int fd = -1);
};

} // namespace msh

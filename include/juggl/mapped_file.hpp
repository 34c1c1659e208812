#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace juggl {

// Read-only memory map of a whole file. Empty files map to an empty view.
class MappedFile {
public:
  struct Config {
    bool sequential_hint = true; // madvise(MADV_SEQUENTIAL)
  };

  MappedFile();
  ~MappedFile();
  MappedFile(MappedFile&& other) noexcept;
  MappedFile& operator=(MappedFile&& other) noexcept;
  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;

  bool open(const std::string& path);              // uses default Config{}
  bool open(const std::string& path, Config cfg);
  void close() noexcept;

  std::string_view bytes() const noexcept;
  std::uint64_t size() const noexcept;
  bool is_open() const noexcept;

  int  last_error() const noexcept;                // errno of the failed step
  const std::string& error() const noexcept;       // "<step>: <strerror>"

private:
  struct Impl; Impl* p_;
};

}

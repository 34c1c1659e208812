#include "juggl/mapped_file.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace juggl {

struct MappedFile::Impl {
  void* addr{nullptr};
  std::size_t len{0};
  bool open{false};
  int last_errno{0};
  std::string err;

  bool fail(const char* step, const std::string& path, int e) {
    last_errno = e;
    err = std::string(step) + " " + path + ": " + std::strerror(e);
    return false;
  }

  void unmap() noexcept {
    if (addr) ::munmap(addr, len);
    addr = nullptr;
    len = 0;
    open = false;
  }

  bool map(const std::string& path, const Config& cfg) {
    unmap();
    last_errno = 0;
    err.clear();

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return fail("open", path, errno);

    struct stat st {};
    if (::fstat(fd, &st) != 0) { int e = errno; ::close(fd); return fail("stat", path, e); }
    if (!S_ISREG(st.st_mode))  { ::close(fd); return fail("map", path, EINVAL); }

    const std::size_t n = static_cast<std::size_t>(st.st_size);
    if (n == 0) { ::close(fd); open = true; return true; }

    void* p = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd, 0);
    int e = errno;
    ::close(fd); // the mapping keeps its own reference
    if (p == MAP_FAILED) return fail("mmap", path, e);

    if (cfg.sequential_hint) (void)::madvise(p, n, MADV_SEQUENTIAL);
    addr = p;
    len = n;
    open = true;
    return true;
  }
};

MappedFile::MappedFile() : p_(new Impl{}) {}
MappedFile::~MappedFile() { if (p_) p_->unmap(); delete p_; }

MappedFile::MappedFile(MappedFile&& other) noexcept : p_(other.p_) { other.p_ = nullptr; }

MappedFile& MappedFile::operator=(MappedFile&& other) noexcept {
  if (this != &other) {
    if (p_) p_->unmap();
    delete p_;
    p_ = other.p_;
    other.p_ = nullptr;
  }
  return *this;
}

bool MappedFile::open(const std::string& path) { return open(path, Config{}); }

bool MappedFile::open(const std::string& path, Config cfg) {
  if (!p_) p_ = new Impl{};
  return p_->map(path, cfg);
}

void MappedFile::close() noexcept { if (p_) p_->unmap(); }

std::string_view MappedFile::bytes() const noexcept {
  if (!p_ || !p_->addr) return {};
  return std::string_view(static_cast<const char*>(p_->addr), p_->len);
}

std::uint64_t MappedFile::size() const noexcept { return p_ ? p_->len : 0; }
bool MappedFile::is_open() const noexcept { return p_ && p_->open; }
int  MappedFile::last_error() const noexcept { return p_ ? p_->last_errno : 0; }

const std::string& MappedFile::error() const noexcept {
  static const std::string none;
  return p_ ? p_->err : none;
}

}

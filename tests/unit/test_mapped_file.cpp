#include "juggl/mapped_file.hpp"
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>

namespace fs = std::filesystem;

int main(){
  const fs::path f = fs::temp_directory_path() / "juggl_mapped.bin";
  const std::string body = std::string("part1") + '\0' + "part2" + '\0' + "part3";
  { std::ofstream out(f, std::ios::binary); out.write(body.data(), (std::streamsize)body.size()); }

  juggl::MappedFile m;
  if (!m.open(f.string())) { std::cerr << "[FAIL] open: " << m.error() << "\n"; return 1; }
  if (m.bytes() != body || m.size() != body.size()) { std::cerr << "[FAIL] contents differ\n"; return 1; }

  juggl::MappedFile moved(std::move(m));
  if (moved.bytes() != body) { std::cerr << "[FAIL] move lost the mapping\n"; return 1; }

  const fs::path empty = fs::temp_directory_path() / "juggl_mapped_empty.bin";
  { std::ofstream out(empty, std::ios::binary); }
  juggl::MappedFile e;
  if (!e.open(empty.string()) || !e.is_open() || !e.bytes().empty()) {
    std::cerr << "[FAIL] empty file: " << e.error() << "\n"; return 1;
  }

  juggl::MappedFile missing;
  if (missing.open("/nonexistent/juggl/input.txt")) { std::cerr << "[FAIL] missing file opened\n"; return 1; }
  if (missing.last_error() != ENOENT || missing.error().empty()) {
    std::cerr << "[FAIL] missing file errno=" << missing.last_error() << "\n"; return 1;
  }

  juggl::MappedFile dir;
  if (dir.open(fs::temp_directory_path().string())) { std::cerr << "[FAIL] directory mapped\n"; return 1; }

  std::cout << "[PASS] mapped file bytes=" << body.size() << "\n";
  return 0;
}

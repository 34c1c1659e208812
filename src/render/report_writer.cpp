#include "juggl/run_json.hpp"
#include "juggl/path_utils.hpp"
#include <filesystem>
#include <fstream>

namespace juggl {

bool write_run_json(const std::string& path, const std::string& json,
                    std::string* err_out) {
  const std::filesystem::path out(path);
  if (!ensure_parent_dirs(out)) {
    if (err_out) *err_out = "cannot create directory for " + path;
    return false;
  }
  std::ofstream rj(out, std::ios::binary);
  if (!rj) {
    if (err_out) *err_out = "failed to open " + path;
    return false;
  }
  rj.write(json.data(), static_cast<std::streamsize>(json.size()));
  rj.flush();
  if (!rj) {
    if (err_out) *err_out = "failed to write " + path;
    return false;
  }
  return true;
}

}

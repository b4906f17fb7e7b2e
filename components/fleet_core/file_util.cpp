#include "fleet_core/file_util.hpp"
#include "fleet_core/log.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>

static const char* TAG = "file";

namespace fleet {

bool file_exists(const std::string& path) {
  struct stat st {};
  return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

fleet_err_t dir_list_files(const std::string& dir, std::vector<std::string>& out) {
  DIR* d = opendir(dir.c_str());
  if (!d) {
    if (errno == ENOENT || errno == ENOTDIR) {
      return FLEET_ERR_NOT_FOUND;
    }
    FLEET_LOGE(TAG, "Cannot open directory {}: {}", dir, std::strerror(errno));
    return FLEET_ERR_IO;
  }
  std::vector<std::string> names;
  while (const dirent* entry = readdir(d)) {
    const std::string name = entry->d_name;
    if (name == "." || name == "..") {
      continue;
    }
    if (file_exists(dir + "/" + name)) {
      names.push_back(name);
    }
  }
  closedir(d);
  std::sort(names.begin(), names.end());
  out = std::move(names);
  return FLEET_OK;
}

fleet_err_t file_read_all(const std::string& path, std::string& out) {
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) {
    if (errno == ENOENT) {
      return FLEET_ERR_NOT_FOUND;
    }
    FLEET_LOGE(TAG, "Cannot open {}: {}", path, std::strerror(errno));
    return FLEET_ERR_IO;
  }
  out.clear();
  char buffer[4096];
  while (true) {
    const size_t read = std::fread(buffer, 1, sizeof(buffer), f);
    if (read == 0) {
      break;
    }
    out.append(buffer, read);
  }
  const bool failed = std::ferror(f) != 0;
  std::fclose(f);
  if (failed) {
    FLEET_LOGE(TAG, "Read error on {}", path);
    return FLEET_ERR_IO;
  }
  return FLEET_OK;
}

fleet_err_t file_write_atomic(const std::string& path, const std::string& data) {
  const std::string tmp = path + ".tmp";
  FILE* f = std::fopen(tmp.c_str(), "wb");
  if (!f) {
    FLEET_LOGE(TAG, "Cannot create {}: {}", tmp, std::strerror(errno));
    return FLEET_ERR_IO;
  }
  const size_t written = std::fwrite(data.data(), 1, data.size(), f);
  const bool flushed = std::fflush(f) == 0;
  std::fclose(f);
  if (written != data.size() || !flushed) {
    FLEET_LOGE(TAG, "Short write on {}", tmp);
    std::remove(tmp.c_str());
    return FLEET_ERR_IO;
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    FLEET_LOGE(TAG, "Cannot rename {} to {}: {}", tmp, path, std::strerror(errno));
    std::remove(tmp.c_str());
    return FLEET_ERR_IO;
  }
  return FLEET_OK;
}

}  // namespace fleet

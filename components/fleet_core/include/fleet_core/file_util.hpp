#pragma once
#include "fleet_core/err.hpp"
#include <string>
#include <vector>

namespace fleet {

// FLEET_ERR_NOT_FOUND when the file does not exist, FLEET_ERR_IO otherwise.
fleet_err_t file_read_all(const std::string& path, std::string& out);

// Writes `<path>.tmp` and renames it over `path`.
fleet_err_t file_write_atomic(const std::string& path, const std::string& data);

bool file_exists(const std::string& path);

// Names of the regular files directly inside `dir`, sorted. FLEET_ERR_NOT_FOUND
// when `dir` is missing or not a directory.
fleet_err_t dir_list_files(const std::string& dir, std::vector<std::string>& out);

}  // namespace fleet

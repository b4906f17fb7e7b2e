#pragma once
#include "fleet_core/batch_dispatcher.hpp"
#include "fleet_core/err.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fleet {

constexpr int TRACK_COUNT = 3;
constexpr int VOLUME_MAX = 100;

struct RemoteFile {
  std::string name{};
  uint64_t size{0};
  std::string type{};
};

// Decodes a /api/files body.
fleet_err_t parse_file_list(const std::string& body, std::vector<RemoteFile>& out);

using DeviceOperationPtr = std::unique_ptr<DeviceOperation>;

namespace ops {

DeviceOperationPtr status();
DeviceOperationPtr get_loops();
DeviceOperationPtr stop_all_tracks();
DeviceOperationPtr start_configured_tracks();
DeviceOperationPtr save_config();
DeviceOperationPtr load_config();
DeviceOperationPtr list_files();

// Argument checks happen here, before any request exists.
fleet_err_t set_track_volume(int track, int volume, DeviceOperationPtr& out);
fleet_err_t set_global_volume(int volume, DeviceOperationPtr& out);
// Exactly one of file_index and file_path.
fleet_err_t set_track_file(int track, std::optional<int> file_index, std::optional<std::string> file_path,
                           DeviceOperationPtr& out);
fleet_err_t set_id(const std::string& new_id, DeviceOperationPtr& out);
fleet_err_t delete_file(const std::string& filename, DeviceOperationPtr& out);
// Reads `local_path` once. An empty target name uploads under the local
// file name. With skip_existing a remote file of the same size is left alone
// and reported as success with response "skipped".
fleet_err_t upload_file(const std::string& local_path, const std::string& target_name, bool skip_existing,
                        std::chrono::milliseconds min_timeout, DeviceOperationPtr& out);
// Loops file 0 on track 0.
DeviceOperationPtr identify_start();
fleet_err_t stop_track(int track, DeviceOperationPtr& out);

}  // namespace ops

// .wav .mp3 .m4a .aac .flac, any case.
bool is_audio_file(const std::string& name);

struct SyncedFile {
  std::string name{};
  std::vector<OperationResult> results{};
};

// Uploads every audio file of `dir` to `devices`, one file at a time in name
// order, leaving files the device already has at the same size. Stops with
// FLEET_ERR_CANCELLED once the dispatcher is interrupted.
fleet_err_t sync_directory(BatchDispatcher& dispatcher, const std::vector<DeviceRecord>& devices,
                           const std::string& dir, std::chrono::milliseconds min_timeout, size_t concurrency_limit,
                           std::vector<SyncedFile>& out);

}  // namespace fleet

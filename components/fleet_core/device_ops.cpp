#include "fleet_core/device_ops.hpp"
#include "fleet_core/file_util.hpp"
#include "fleet_core/http_client.hpp"
#include "fleet_core/log.hpp"
#include "cJSON.h"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <memory>
#include <vector>

static const char* TAG = "device_ops";

namespace fleet {

namespace {

std::string print_json(cJSON* root) {
  char* txt = cJSON_PrintUnformatted(root);
  std::string out = txt ? txt : "{}";
  if (txt) {
    cJSON_free(txt);
  }
  cJSON_Delete(root);
  return out;
}

std::string track_body(int track) {
  cJSON* root = cJSON_CreateObject();
  cJSON_AddNumberToObject(root, "track", track);
  return print_json(root);
}

bool valid_track(int track) {
  return track >= 0 && track < TRACK_COUNT;
}

bool valid_volume(int volume) {
  return volume >= 0 && volume <= VOLUME_MAX;
}

void fill_from_response(OperationResult& result, const HttpResponse& resp) {
  result.http_status = resp.status;
  result.response = resp.body;
  if (!resp.ok()) {
    result.error = resp.error;
  }
}

// Runs requests one after another against one device and folds the
// outcomes into a composite result. Later steps still run after a failure.
class StepSequence : public std::enable_shared_from_this<StepSequence> {
public:
  StepSequence(boost::asio::io_context& io, const DeviceRecord& device, const RequestOptions& opts,
               std::vector<HttpRequest> steps, ResultHandler done)
      : io_(io), opts_(opts), steps_(std::move(steps)), done_(std::move(done)), result_(make_result(device)) {}

  void run() { next(); }

private:
  void next() {
    if (index_ >= steps_.size()) {
      finish();
      return;
    }
    auto self = shared_from_this();
    http_async_request(io_, result_.ip_address, opts_.port, steps_[index_], opts_.timeout,
                       [self](HttpResponse resp) { self->on_step(resp); });
  }

  void on_step(const HttpResponse& resp) {
    result_.http_status = resp.status;
    result_.response = resp.body;
    if (resp.ok()) {
      ++ok_;
    } else {
      FLEET_LOGD(TAG, "{} {} {}: {}", result_.ip_address, steps_[index_].method, steps_[index_].path, resp.error);
      if (result_.error.empty()) {
        result_.error = steps_[index_].path + ": " + resp.error;
      }
    }
    ++index_;
    next();
  }

  void finish() {
    result_.steps_ok = ok_;
    result_.steps_total = static_cast<uint16_t>(steps_.size());
    result_.status = classify_steps(ok_, result_.steps_total);
    if (result_.status == OperationStatus::Success) {
      result_.error.clear();
    }
    auto done = std::move(done_);
    done(std::move(result_));
  }

  boost::asio::io_context& io_;
  RequestOptions opts_;
  std::vector<HttpRequest> steps_;
  ResultHandler done_;
  OperationResult result_;
  size_t index_{0};
  uint16_t ok_{0};
};

void run_steps(boost::asio::io_context& io, const DeviceRecord& device, const RequestOptions& opts,
               std::vector<HttpRequest> steps, ResultHandler done) {
  std::make_shared<StepSequence>(io, device, opts, std::move(steps), std::move(done))->run();
}

class RequestOp : public DeviceOperation {
public:
  RequestOp(const char* name, HttpRequest request) : name_(name), request_(std::move(request)) {}

  const char* name() const override { return name_; }

  void start(boost::asio::io_context& io, const DeviceRecord& device, const RequestOptions& opts,
             ResultHandler done) const override {
    OperationResult base = make_result(device);
    http_async_request(io, device.ip_address, opts.port, request_, opts.timeout,
                       [base, done](HttpResponse resp) mutable {
                         fill_from_response(base, resp);
                         base.steps_total = 1;
                         base.steps_ok = resp.ok() ? 1 : 0;
                         base.status = resp.ok() ? OperationStatus::Success : OperationStatus::Error;
                         done(std::move(base));
                       });
  }

private:
  const char* name_;
  HttpRequest request_;
};

class SequenceOp : public DeviceOperation {
public:
  SequenceOp(const char* name, std::vector<HttpRequest> steps) : name_(name), steps_(std::move(steps)) {}

  const char* name() const override { return name_; }

  void start(boost::asio::io_context& io, const DeviceRecord& device, const RequestOptions& opts,
             ResultHandler done) const override {
    run_steps(io, device, opts, steps_, std::move(done));
  }

private:
  const char* name_;
  std::vector<HttpRequest> steps_;
};

std::vector<int> configured_tracks(const std::string& body) {
  std::vector<int> tracks;
  cJSON* root = cJSON_ParseWithLength(body.c_str(), body.size());
  if (!root) {
    return tracks;
  }
  cJSON* loops = cJSON_GetObjectItem(root, "loops");
  const cJSON* loop = nullptr;
  cJSON_ArrayForEach(loop, loops) {
    cJSON* track = cJSON_GetObjectItem(loop, "track");
    cJSON* file = cJSON_GetObjectItem(loop, "file");
    if (cJSON_IsNumber(track) && cJSON_IsString(file) && file->valuestring[0] != '\0') {
      tracks.push_back(track->valueint);
    }
  }
  cJSON_Delete(root);
  return tracks;
}

// GET /api/loops, then start every loop with a file assigned.
class StartConfiguredOp : public DeviceOperation {
public:
  const char* name() const override { return "start_configured_tracks"; }

  void start(boost::asio::io_context& io, const DeviceRecord& device, const RequestOptions& opts,
             ResultHandler done) const override {
    DeviceRecord target = device;
    http_async_request(
        io, device.ip_address, opts.port, http_get("/api/loops"), opts.timeout,
        [&io, target, opts, done](HttpResponse resp) mutable {
          if (!resp.ok()) {
            OperationResult result = make_result(target);
            fill_from_response(result, resp);
            result.error = "/api/loops: " + resp.error;
            done(std::move(result));
            return;
          }
          std::vector<HttpRequest> steps;
          for (int track : configured_tracks(resp.body)) {
            steps.push_back(http_post_json("/api/loop/start", track_body(track)));
          }
          if (steps.empty()) {
            OperationResult result = make_result(target);
            result.status = OperationStatus::Success;
            result.http_status = resp.status;
            result.response = "no configured loops";
            done(std::move(result));
            return;
          }
          run_steps(io, target, opts, std::move(steps), std::move(done));
        });
  }
};

class UploadOp : public DeviceOperation {
public:
  UploadOp(std::string data, std::string target_name, bool skip_existing, std::chrono::milliseconds timeout)
      : data_(std::make_shared<const std::string>(std::move(data))), target_name_(std::move(target_name)),
        skip_existing_(skip_existing), timeout_(timeout) {}

  const char* name() const override { return "upload_file"; }

  void start(boost::asio::io_context& io, const DeviceRecord& device, const RequestOptions& opts,
             ResultHandler done) const override {
    if (!skip_existing_) {
      send(io, device, opts, std::move(done));
      return;
    }
    const UploadOp* self = this;
    DeviceRecord target = device;
    http_async_request(io, device.ip_address, opts.port, http_get("/api/files"), opts.timeout,
                       [self, &io, target, opts, done](HttpResponse resp) mutable {
                         if (resp.ok() && self->remote_matches(resp.body)) {
                           FLEET_LOGI(TAG, "{} ({}): {} already present, skipping", target.id, target.ip_address,
                                      self->target_name_);
                           OperationResult result = make_result(target);
                           result.status = OperationStatus::Success;
                           result.http_status = resp.status;
                           result.response = "skipped";
                           done(std::move(result));
                           return;
                         }
                         self->send(io, target, opts, std::move(done));
                       });
  }

private:
  bool remote_matches(const std::string& body) const {
    std::vector<RemoteFile> files;
    if (parse_file_list(body, files) != FLEET_OK) {
      return false;
    }
    return std::any_of(files.begin(), files.end(), [this](const RemoteFile& f) {
      return f.name == target_name_ && f.size == data_->size();
    });
  }

  void send(boost::asio::io_context& io, const DeviceRecord& device, const RequestOptions& opts,
            ResultHandler done) const {
    HttpRequest req;
    req.method = "POST";
    req.path = "/api/upload?filename=" + http_url_encode(target_name_);
    req.content_type = "application/octet-stream";
    req.body = *data_;
    // Roughly two seconds per MB, never below the configured floor.
    const auto per_size = std::chrono::milliseconds(static_cast<int64_t>(data_->size() / 524288) * 1000);
    const auto timeout = std::max({timeout_, opts.timeout, per_size});
    OperationResult base = make_result(device);
    const std::string name = target_name_;
    http_async_request(io, device.ip_address, opts.port, std::move(req), timeout,
                       [base, name, done](HttpResponse resp) mutable {
                         fill_from_response(base, resp);
                         base.steps_total = 1;
                         base.steps_ok = resp.ok() ? 1 : 0;
                         base.status = resp.ok() ? OperationStatus::Success : OperationStatus::Error;
                         if (resp.ok()) {
                           FLEET_LOGI(TAG, "{} ({}): {} uploaded", base.device_id, base.ip_address, name);
                         } else {
                           FLEET_LOGE(TAG, "{} ({}): upload of {} failed: {}", base.device_id, base.ip_address,
                                      name, resp.error);
                         }
                         done(std::move(base));
                       });
  }

  std::shared_ptr<const std::string> data_;
  std::string target_name_;
  bool skip_existing_;
  std::chrono::milliseconds timeout_;
};

std::string base_name(const std::string& path) {
  const auto slash = path.find_last_of("/\\");
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

}  // namespace

fleet_err_t parse_file_list(const std::string& body, std::vector<RemoteFile>& out) {
  cJSON* root = cJSON_ParseWithLength(body.c_str(), body.size());
  if (!root) {
    return FLEET_ERR_INVALID_FORMAT;
  }
  cJSON* files = cJSON_GetObjectItem(root, "files");
  if (!cJSON_IsArray(files)) {
    cJSON_Delete(root);
    return FLEET_ERR_INVALID_FORMAT;
  }
  std::vector<RemoteFile> list;
  const cJSON* node = nullptr;
  cJSON_ArrayForEach(node, files) {
    RemoteFile file{};
    if (cJSON* name = cJSON_GetObjectItem(node, "name"); cJSON_IsString(name)) {
      file.name = name->valuestring;
    } else {
      continue;
    }
    if (cJSON* size = cJSON_GetObjectItem(node, "size"); cJSON_IsNumber(size)) {
      file.size = json_number_to_u64(size->valuedouble);
    }
    if (cJSON* type = cJSON_GetObjectItem(node, "type"); cJSON_IsString(type)) {
      file.type = type->valuestring;
    }
    list.push_back(std::move(file));
  }
  cJSON_Delete(root);
  out = std::move(list);
  return FLEET_OK;
}

namespace ops {

DeviceOperationPtr status() {
  return std::make_unique<RequestOp>("status", http_get("/api/status"));
}

DeviceOperationPtr get_loops() {
  return std::make_unique<RequestOp>("get_loops", http_get("/api/loops"));
}

DeviceOperationPtr stop_all_tracks() {
  std::vector<HttpRequest> steps;
  for (int track = 0; track < TRACK_COUNT; ++track) {
    steps.push_back(http_post_json("/api/loop/stop", track_body(track)));
  }
  return std::make_unique<SequenceOp>("stop_all_tracks", std::move(steps));
}

DeviceOperationPtr start_configured_tracks() {
  return std::make_unique<StartConfiguredOp>();
}

DeviceOperationPtr save_config() {
  return std::make_unique<RequestOp>("save_config", http_post_json("/api/config/save", ""));
}

DeviceOperationPtr load_config() {
  return std::make_unique<RequestOp>("load_config", http_post_json("/api/config/load", ""));
}

DeviceOperationPtr list_files() {
  return std::make_unique<RequestOp>("list_files", http_get("/api/files"));
}

fleet_err_t set_track_volume(int track, int volume, DeviceOperationPtr& out) {
  if (!valid_track(track) || !valid_volume(volume)) {
    FLEET_LOGE(TAG, "Track must be 0-{} and volume 0-{} (got {}, {})", TRACK_COUNT - 1, VOLUME_MAX, track, volume);
    return FLEET_ERR_INVALID_ARG;
  }
  cJSON* root = cJSON_CreateObject();
  cJSON_AddNumberToObject(root, "track", track);
  cJSON_AddNumberToObject(root, "volume", volume);
  out = std::make_unique<RequestOp>("set_track_volume", http_post_json("/api/loop/volume", print_json(root)));
  return FLEET_OK;
}

fleet_err_t set_global_volume(int volume, DeviceOperationPtr& out) {
  if (!valid_volume(volume)) {
    FLEET_LOGE(TAG, "Volume must be 0-{} (got {})", VOLUME_MAX, volume);
    return FLEET_ERR_INVALID_ARG;
  }
  cJSON* root = cJSON_CreateObject();
  cJSON_AddNumberToObject(root, "volume", volume);
  out = std::make_unique<RequestOp>("set_global_volume", http_post_json("/api/global/volume", print_json(root)));
  return FLEET_OK;
}

fleet_err_t set_track_file(int track, std::optional<int> file_index, std::optional<std::string> file_path,
                           DeviceOperationPtr& out) {
  if (!valid_track(track)) {
    FLEET_LOGE(TAG, "Track must be 0-{} (got {})", TRACK_COUNT - 1, track);
    return FLEET_ERR_INVALID_ARG;
  }
  if (file_index.has_value() == file_path.has_value()) {
    FLEET_LOGE(TAG, "Give either a file index or a file path");
    return FLEET_ERR_INVALID_ARG;
  }
  if (file_index && *file_index < 0) {
    return FLEET_ERR_INVALID_ARG;
  }
  cJSON* root = cJSON_CreateObject();
  cJSON_AddNumberToObject(root, "track", track);
  if (file_index) {
    cJSON_AddNumberToObject(root, "file_index", *file_index);
  } else {
    cJSON_AddStringToObject(root, "file_path", file_path->c_str());
  }
  out = std::make_unique<RequestOp>("set_track_file", http_post_json("/api/loop/file", print_json(root)));
  return FLEET_OK;
}

fleet_err_t set_id(const std::string& new_id, DeviceOperationPtr& out) {
  if (new_id.empty()) {
    FLEET_LOGE(TAG, "Device ID must not be empty");
    return FLEET_ERR_INVALID_ARG;
  }
  cJSON* root = cJSON_CreateObject();
  cJSON_AddStringToObject(root, "id", new_id.c_str());
  out = std::make_unique<RequestOp>("set_id", http_post_json("/api/id", print_json(root)));
  return FLEET_OK;
}

fleet_err_t delete_file(const std::string& filename, DeviceOperationPtr& out) {
  if (filename.empty()) {
    FLEET_LOGE(TAG, "File name must not be empty");
    return FLEET_ERR_INVALID_ARG;
  }
  cJSON* root = cJSON_CreateObject();
  cJSON_AddStringToObject(root, "filename", filename.c_str());
  out = std::make_unique<RequestOp>("delete_file", http_delete_json("/api/file/delete", print_json(root)));
  return FLEET_OK;
}

fleet_err_t upload_file(const std::string& local_path, const std::string& target_name, bool skip_existing,
                        std::chrono::milliseconds min_timeout, DeviceOperationPtr& out) {
  std::string data;
  const fleet_err_t err = file_read_all(local_path, data);
  if (err != FLEET_OK) {
    FLEET_LOGE(TAG, "Cannot read {}: {}", local_path, fleet_err_to_name(err));
    return err;
  }
  const std::string name = target_name.empty() ? base_name(local_path) : target_name;
  if (name.empty()) {
    return FLEET_ERR_INVALID_ARG;
  }
  FLEET_LOGI(TAG, "Prepared {} as '{}' ({:.2f} MB)", local_path, name, data.size() / (1024.0 * 1024.0));
  out = std::make_unique<UploadOp>(std::move(data), name, skip_existing, min_timeout);
  return FLEET_OK;
}

DeviceOperationPtr identify_start() {
  cJSON* root = cJSON_CreateObject();
  cJSON_AddNumberToObject(root, "track", 0);
  cJSON_AddNumberToObject(root, "file_index", 0);
  return std::make_unique<RequestOp>("identify_start", http_post_json("/api/loop/start", print_json(root)));
}

fleet_err_t stop_track(int track, DeviceOperationPtr& out) {
  if (!valid_track(track)) {
    return FLEET_ERR_INVALID_ARG;
  }
  out = std::make_unique<RequestOp>("stop_track", http_post_json("/api/loop/stop", track_body(track)));
  return FLEET_OK;
}

}  // namespace ops

bool is_audio_file(const std::string& name) {
  static const char* const extensions[] = {".wav", ".mp3", ".m4a", ".aac", ".flac"};
  const auto dot = name.find_last_of('.');
  if (dot == std::string::npos || dot == 0) {
    return false;
  }
  std::string ext = name.substr(dot);
  for (auto& ch : ext) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return std::find(std::begin(extensions), std::end(extensions), ext) != std::end(extensions);
}

fleet_err_t sync_directory(BatchDispatcher& dispatcher, const std::vector<DeviceRecord>& devices,
                           const std::string& dir, std::chrono::milliseconds min_timeout, size_t concurrency_limit,
                           std::vector<SyncedFile>& out) {
  out.clear();
  std::vector<std::string> names;
  fleet_err_t err = dir_list_files(dir, names);
  if (err != FLEET_OK) {
    FLEET_LOGE(TAG, "Directory {} unusable: {}", dir, fleet_err_to_name(err));
    return err;
  }
  names.erase(std::remove_if(names.begin(), names.end(), [](const std::string& n) { return !is_audio_file(n); }),
              names.end());
  if (names.empty()) {
    FLEET_LOGW(TAG, "No audio files found in {}", dir);
    return FLEET_OK;
  }
  FLEET_LOGI(TAG, "Found {} audio file(s) to sync", names.size());

  for (const auto& name : names) {
    DeviceOperationPtr op;
    err = ops::upload_file(dir + "/" + name, name, true, min_timeout, op);
    if (err != FLEET_OK) {
      return err;
    }
    FLEET_LOGI(TAG, "Syncing {}", name);
    out.push_back(SyncedFile{name, dispatcher.dispatch(devices, *op, concurrency_limit)});
    if (dispatcher.cancelled()) {
      return FLEET_ERR_CANCELLED;
    }
  }
  return FLEET_OK;
}

}  // namespace fleet

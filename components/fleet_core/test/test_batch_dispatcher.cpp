#include <unity.h>
#include "fake_device.hpp"
#include "fleet_core/batch_dispatcher.hpp"
#include "fleet_core/device_ops.hpp"
#include "fleet_core/file_util.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

using namespace fleet;
using fleet::test::FakeDevice;
using fleet::test::FakeMode;

static const char* LOCAL_FILE = "test_batch_upload.wav";
static const char* SYNC_DIR = "test_batch_sync";
static const char* const SYNC_FILES[] = {"b.wav", "a.WAV", "notes.txt", "c.flac"};

static void remove_sync_dir() {
  for (const char* name : SYNC_FILES) {
    std::remove((std::string(SYNC_DIR) + "/" + name).c_str());
  }
  rmdir((std::string(SYNC_DIR) + "/nested.wav").c_str());
  rmdir(SYNC_DIR);
}
static constexpr std::chrono::milliseconds OP_TIMEOUT{500};

static DeviceRecord record_for(const FakeDevice& dev, const std::string& id) {
  DeviceRecord d;
  d.mac_address = dev.mac();
  d.id = id;
  d.ip_address = dev.address();
  d.online = true;
  return d;
}

static DeviceRecord unreachable(const std::string& ip, const std::string& mac, const std::string& id) {
  DeviceRecord d;
  d.mac_address = mac;
  d.id = id;
  d.ip_address = ip;
  d.online = true;
  return d;
}

static RequestOptions options_for(uint16_t port) {
  RequestOptions opts;
  opts.port = port;
  opts.timeout = OP_TIMEOUT;
  return opts;
}

void setUp() {
  std::remove(LOCAL_FILE);
  remove_sync_dir();
}

void tearDown() {
  std::remove(LOCAL_FILE);
  remove_sync_dir();
}

void test_step_classification() {
  TEST_ASSERT_EQUAL_INT(static_cast<int>(OperationStatus::Success), static_cast<int>(classify_steps(3, 3)));
  TEST_ASSERT_EQUAL_INT(static_cast<int>(OperationStatus::Partial), static_cast<int>(classify_steps(2, 3)));
  TEST_ASSERT_EQUAL_INT(static_cast<int>(OperationStatus::Error), static_cast<int>(classify_steps(0, 3)));
  TEST_ASSERT_EQUAL_INT(static_cast<int>(OperationStatus::Success), static_cast<int>(classify_steps(0, 0)));
}

void test_argument_checks_precede_requests() {
  DeviceOperationPtr op;
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_INVALID_ARG, ops::set_track_volume(3, 50, op));
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_INVALID_ARG, ops::set_track_volume(0, 101, op));
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_INVALID_ARG, ops::set_track_volume(-1, 10, op));
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_INVALID_ARG, ops::set_global_volume(-5, op));
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_INVALID_ARG, ops::set_track_file(1, std::nullopt, std::nullopt, op));
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_INVALID_ARG, ops::set_track_file(1, 2, std::string("/sdcard/x.wav"), op));
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_INVALID_ARG, ops::set_id("", op));
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_INVALID_ARG, ops::delete_file("", op));
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_INVALID_ARG, ops::stop_track(7, op));
  TEST_ASSERT_NULL(op.get());
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_NOT_FOUND,
                        ops::upload_file("no_such_dir/missing.wav", "", true, OP_TIMEOUT, op));

  TEST_ASSERT_EQUAL_INT(FLEET_OK, ops::set_track_volume(2, 100, op));
  TEST_ASSERT_EQUAL_STRING("set_track_volume", op->name());
  TEST_ASSERT_EQUAL_INT(FLEET_OK, ops::set_global_volume(0, op));
}

void test_unreachable_devices_do_not_hold_the_batch() {
  FakeDevice a("127.0.1.1", "02:00:00:01:00:01", "A");
  TEST_ASSERT_TRUE(a.start(0));
  const uint16_t port = a.port();
  FakeDevice b("127.0.1.2", "02:00:00:01:00:02", "B");
  FakeDevice stall("127.0.1.3", "02:00:00:01:00:03", "S", FakeMode::Stall);
  FakeDevice c("127.0.1.5", "02:00:00:01:00:05", "C");
  TEST_ASSERT_TRUE(b.start(port));
  TEST_ASSERT_TRUE(stall.start(port));
  TEST_ASSERT_TRUE(c.start(port));

  const std::vector<DeviceRecord> devices = {
      record_for(a, "A"), record_for(b, "B"), record_for(stall, "S"),
      unreachable("127.0.1.4", "02:00:00:01:00:04", "R"), record_for(c, "C")};
  BatchDispatcher dispatcher(options_for(port));
  const auto started = std::chrono::steady_clock::now();
  const auto results = dispatcher.dispatch(devices, *ops::status(), 10);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  TEST_ASSERT_EQUAL_UINT32(5, results.size());
  const char* order[] = {"A", "B", "S", "R", "C"};
  for (size_t i = 0; i < results.size(); ++i) {
    TEST_ASSERT_EQUAL_STRING(order[i], results[i].device_id.c_str());
  }
  TEST_ASSERT_TRUE(results[0].success());
  TEST_ASSERT_TRUE(results[1].success());
  TEST_ASSERT_TRUE(results[4].success());
  TEST_ASSERT_EQUAL_INT(200, results[0].http_status);
  TEST_ASSERT_EQUAL_INT(static_cast<int>(OperationStatus::Error), static_cast<int>(results[2].status));
  TEST_ASSERT_EQUAL_INT(static_cast<int>(OperationStatus::Error), static_cast<int>(results[3].status));
  TEST_ASSERT_FALSE(results[2].error.empty());
  TEST_ASSERT_FALSE(results[3].error.empty());
  TEST_ASSERT_FALSE(dispatcher.cancelled());
  // All five share one window, so the batch costs about one timeout.
  TEST_ASSERT_TRUE(elapsed < OP_TIMEOUT * 3);
}

void test_windows_report_progress() {
  FakeDevice a("127.0.1.11", "02:00:00:01:00:11", "A");
  TEST_ASSERT_TRUE(a.start(0));
  FakeDevice b("127.0.1.12", "02:00:00:01:00:12", "B");
  FakeDevice c("127.0.1.13", "02:00:00:01:00:13", "C");
  TEST_ASSERT_TRUE(b.start(a.port()));
  TEST_ASSERT_TRUE(c.start(a.port()));

  BatchDispatcher dispatcher(options_for(a.port()));
  std::vector<size_t> done_counts;
  dispatcher.set_progress_callback([&done_counts](size_t done, size_t) { done_counts.push_back(done); });
  const auto results =
      dispatcher.dispatch({record_for(a, "A"), record_for(b, "B"), record_for(c, "C")}, *ops::save_config(), 2);
  TEST_ASSERT_EQUAL_UINT32(3, results.size());
  TEST_ASSERT_EQUAL_UINT32(2, done_counts.size());
  TEST_ASSERT_EQUAL_UINT32(2, done_counts[0]);
  TEST_ASSERT_EQUAL_UINT32(3, done_counts[1]);
  TEST_ASSERT_EQUAL_UINT32(1, c.request_count("/api/config/save"));
}

void test_cancel_before_start_sends_nothing() {
  FakeDevice a("127.0.1.21", "02:00:00:01:00:21", "A");
  TEST_ASSERT_TRUE(a.start(0));

  std::atomic<bool> stop{true};
  BatchDispatcher dispatcher(options_for(a.port()));
  dispatcher.set_cancel_flag(&stop);
  const auto results = dispatcher.dispatch({record_for(a, "A")}, *ops::load_config(), 4);
  TEST_ASSERT_TRUE(dispatcher.cancelled());
  TEST_ASSERT_EQUAL_UINT32(1, results.size());
  TEST_ASSERT_EQUAL_STRING("cancelled", results[0].error.c_str());
  TEST_ASSERT_FALSE(results[0].success());
  TEST_ASSERT_EQUAL_UINT32(0, a.request_count());
}

void test_stop_all_reports_partial() {
  FakeDevice a("127.0.1.31", "02:00:00:01:00:31", "A");
  TEST_ASSERT_TRUE(a.start(0));
  a.fail_request("/api/loop/stop", "\"track\":1");

  BatchDispatcher dispatcher(options_for(a.port()));
  const OperationResult result = dispatcher.run_one(record_for(a, "A"), *ops::stop_all_tracks());
  TEST_ASSERT_EQUAL_INT(static_cast<int>(OperationStatus::Partial), static_cast<int>(result.status));
  TEST_ASSERT_EQUAL_UINT32(2, result.steps_ok);
  TEST_ASSERT_EQUAL_UINT32(3, result.steps_total);
  TEST_ASSERT_FALSE(result.error.empty());
  TEST_ASSERT_EQUAL_UINT32(3, a.request_count("/api/loop/stop"));
}

void test_start_configured_tracks_only() {
  FakeDevice a("127.0.1.41", "02:00:00:01:00:41", "A");
  TEST_ASSERT_TRUE(a.start(0));
  FakeDevice empty("127.0.1.42", "02:00:00:01:00:42", "E");
  TEST_ASSERT_TRUE(empty.start(a.port()));
  empty.set_loops_json(R"({"loops":[{"track":0,"file":""}]})");

  BatchDispatcher dispatcher(options_for(a.port()));
  const OperationResult result = dispatcher.run_one(record_for(a, "A"), *ops::start_configured_tracks());
  TEST_ASSERT_TRUE(result.success());
  TEST_ASSERT_EQUAL_UINT32(2, result.steps_total);
  const auto requests = a.requests();
  TEST_ASSERT_EQUAL_UINT32(3, requests.size());
  TEST_ASSERT_EQUAL_STRING("/api/loops", requests[0].path.c_str());
  TEST_ASSERT_EQUAL_STRING("/api/loop/start", requests[1].path.c_str());
  TEST_ASSERT_EQUAL_STRING(R"({"track":0})", requests[1].body.c_str());
  TEST_ASSERT_EQUAL_STRING(R"({"track":2})", requests[2].body.c_str());

  const OperationResult idle = dispatcher.run_one(record_for(empty, "E"), *ops::start_configured_tracks());
  TEST_ASSERT_TRUE(idle.success());
  TEST_ASSERT_EQUAL_STRING("no configured loops", idle.response.c_str());
  TEST_ASSERT_EQUAL_UINT32(0, empty.request_count("/api/loop/start"));
}

void test_upload_skips_matching_file() {
  TEST_ASSERT_EQUAL_INT(FLEET_OK, file_write_atomic(LOCAL_FILE, "abcd"));
  FakeDevice a("127.0.1.51", "02:00:00:01:00:51", "A");
  TEST_ASSERT_TRUE(a.start(0));
  a.set_files_json(R"({"files":[{"name":"a.wav","size":4,"type":"wav"}]})");
  FakeDevice b("127.0.1.52", "02:00:00:01:00:52", "B");
  TEST_ASSERT_TRUE(b.start(a.port()));
  b.set_files_json(R"({"files":[{"name":"a.wav","size":3,"type":"wav"}]})");

  DeviceOperationPtr op;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, ops::upload_file(LOCAL_FILE, "a.wav", true, OP_TIMEOUT, op));
  BatchDispatcher dispatcher(options_for(a.port()));
  const auto results = dispatcher.dispatch({record_for(a, "A"), record_for(b, "B")}, *op, 2);
  TEST_ASSERT_TRUE(results[0].success());
  TEST_ASSERT_EQUAL_STRING("skipped", results[0].response.c_str());
  TEST_ASSERT_EQUAL_UINT32(0, a.request_count("/api/upload"));
  TEST_ASSERT_TRUE(results[1].success());
  TEST_ASSERT_EQUAL_UINT32(1, b.request_count("/api/upload"));
  const auto sent = b.requests().back();
  TEST_ASSERT_EQUAL_STRING("POST", sent.method.c_str());
  TEST_ASSERT_EQUAL_STRING("/api/upload?filename=a.wav", sent.path.c_str());
  TEST_ASSERT_EQUAL_STRING("abcd", sent.body.c_str());
}

void test_upload_without_skip_encodes_name() {
  TEST_ASSERT_EQUAL_INT(FLEET_OK, file_write_atomic(LOCAL_FILE, "abcd"));
  FakeDevice a("127.0.1.61", "02:00:00:01:00:61", "A");
  TEST_ASSERT_TRUE(a.start(0));

  DeviceOperationPtr op;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, ops::upload_file(LOCAL_FILE, "my loop.wav", false, OP_TIMEOUT, op));
  BatchDispatcher dispatcher(options_for(a.port()));
  const OperationResult result = dispatcher.run_one(record_for(a, "A"), *op);
  TEST_ASSERT_TRUE(result.success());
  TEST_ASSERT_EQUAL_UINT32(0, a.request_count("/api/files"));
  const auto requests = a.requests();
  TEST_ASSERT_EQUAL_UINT32(1, requests.size());
  TEST_ASSERT_EQUAL_STRING("/api/upload?filename=my%20loop.wav", requests[0].path.c_str());
}

void test_delete_uses_delete_method() {
  FakeDevice a("127.0.1.71", "02:00:00:01:00:71", "A");
  TEST_ASSERT_TRUE(a.start(0));

  DeviceOperationPtr op;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, ops::delete_file("old.wav", op));
  BatchDispatcher dispatcher(options_for(a.port()));
  TEST_ASSERT_TRUE(dispatcher.run_one(record_for(a, "A"), *op).success());
  const auto requests = a.requests();
  TEST_ASSERT_EQUAL_UINT32(1, requests.size());
  TEST_ASSERT_EQUAL_STRING("DELETE", requests[0].method.c_str());
  TEST_ASSERT_EQUAL_STRING("/api/file/delete", requests[0].path.c_str());
  TEST_ASSERT_EQUAL_STRING(R"({"filename":"old.wav"})", requests[0].body.c_str());
}

void test_sync_uploads_audio_files_in_name_order() {
  TEST_ASSERT_EQUAL_INT(0, mkdir(SYNC_DIR, 0755));
  TEST_ASSERT_EQUAL_INT(0, mkdir((std::string(SYNC_DIR) + "/nested.wav").c_str(), 0755));
  for (const char* name : SYNC_FILES) {
    TEST_ASSERT_EQUAL_INT(FLEET_OK, file_write_atomic(std::string(SYNC_DIR) + "/" + name, "abcd"));
  }
  FakeDevice a("127.0.1.81", "02:00:00:01:00:81", "A");
  TEST_ASSERT_TRUE(a.start(0));
  a.set_files_json(R"({"files":[{"name":"a.WAV","size":4,"type":"wav"}]})");
  FakeDevice b("127.0.1.82", "02:00:00:01:00:82", "B");
  TEST_ASSERT_TRUE(b.start(a.port()));
  b.set_files_json(R"({"files":[]})");

  BatchDispatcher dispatcher(options_for(a.port()));
  std::vector<SyncedFile> synced;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, sync_directory(dispatcher, {record_for(a, "A"), record_for(b, "B")}, SYNC_DIR,
                                                 OP_TIMEOUT, 2, synced));
  TEST_ASSERT_EQUAL_UINT32(3, synced.size());
  TEST_ASSERT_EQUAL_STRING("a.WAV", synced[0].name.c_str());
  TEST_ASSERT_EQUAL_STRING("b.wav", synced[1].name.c_str());
  TEST_ASSERT_EQUAL_STRING("c.flac", synced[2].name.c_str());
  for (const auto& file : synced) {
    TEST_ASSERT_EQUAL_UINT32(2, file.results.size());
    TEST_ASSERT_TRUE(file.results[0].success());
    TEST_ASSERT_TRUE(file.results[1].success());
  }
  TEST_ASSERT_EQUAL_STRING("skipped", synced[0].results[0].response.c_str());

  TEST_ASSERT_EQUAL_UINT32(2, a.request_count("/api/upload"));
  TEST_ASSERT_EQUAL_UINT32(3, b.request_count("/api/upload"));
  std::vector<std::string> uploaded;
  for (const auto& req : b.requests()) {
    if (req.method == "POST") {
      uploaded.push_back(req.path);
    }
  }
  TEST_ASSERT_EQUAL_UINT32(3, uploaded.size());
  TEST_ASSERT_EQUAL_STRING("/api/upload?filename=a.WAV", uploaded[0].c_str());
  TEST_ASSERT_EQUAL_STRING("/api/upload?filename=c.flac", uploaded[2].c_str());
}

void test_sync_rejects_missing_directory() {
  BatchDispatcher dispatcher;
  std::vector<SyncedFile> synced;
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_NOT_FOUND, sync_directory(dispatcher, {}, "no_such_sync_dir", OP_TIMEOUT, 2, synced));
  TEST_ASSERT_TRUE(synced.empty());
  TEST_ASSERT_TRUE(is_audio_file("Loop.FLAC"));
  TEST_ASSERT_TRUE(is_audio_file("x.m4a"));
  TEST_ASSERT_FALSE(is_audio_file("readme.txt"));
  TEST_ASSERT_FALSE(is_audio_file(".wav"));
  TEST_ASSERT_FALSE(is_audio_file("wav"));
}

void test_file_list_parsing() {
  std::vector<RemoteFile> files;
  TEST_ASSERT_EQUAL_INT(FLEET_OK,
                        parse_file_list(R"({"files":[{"name":"a.wav","size":10,"type":"wav"},{"size":3}]})", files));
  TEST_ASSERT_EQUAL_UINT32(1, files.size());
  TEST_ASSERT_EQUAL_STRING("a.wav", files[0].name.c_str());
  TEST_ASSERT_EQUAL_UINT32(10, static_cast<uint32_t>(files[0].size));
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_INVALID_FORMAT, parse_file_list(R"({"loops":[]})", files));
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_step_classification);
  RUN_TEST(test_argument_checks_precede_requests);
  RUN_TEST(test_unreachable_devices_do_not_hold_the_batch);
  RUN_TEST(test_windows_report_progress);
  RUN_TEST(test_cancel_before_start_sends_nothing);
  RUN_TEST(test_stop_all_reports_partial);
  RUN_TEST(test_start_configured_tracks_only);
  RUN_TEST(test_upload_skips_matching_file);
  RUN_TEST(test_upload_without_skip_encodes_name);
  RUN_TEST(test_delete_uses_delete_method);
  RUN_TEST(test_sync_uploads_audio_files_in_name_order);
  RUN_TEST(test_sync_rejects_missing_directory);
  RUN_TEST(test_file_list_parsing);
  return UNITY_END();
}

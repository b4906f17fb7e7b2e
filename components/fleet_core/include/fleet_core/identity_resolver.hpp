#pragma once
#include "fleet_core/batch_dispatcher.hpp"
#include "fleet_core/err.hpp"
#include "fleet_core/prober.hpp"
#include "fleet_core/registry.hpp"
#include "fleet_core/types.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace fleet {

struct IdentityOptions {
  uint16_t port{80};
  std::chrono::milliseconds timeout{2000};
  std::string prefix{"LOUD"};
  int start_num{1};
  bool include_offline{false};
};

struct DuplicateGroup {
  std::string id{};
  std::vector<DeviceRecord> members{};
};

struct IdAssignment {
  std::string mac_address{};
  std::string ip_address{};
  std::string old_id{};
  std::string new_id{};
};

struct AutoAssignPlan {
  std::vector<IdAssignment> assignments{};
  size_t already_assigned{0};
  size_t skipped_offline{0};
};

enum class ProvisionOutcome : uint8_t {
  Assigned,
  NoneFound,
  MultipleFound,
  RequestFailed,
  Cancelled,
};

struct ProvisionReport {
  ProvisionOutcome outcome{ProvisionOutcome::NoneFound};
  std::vector<DeviceRecord> found{};
  OperationResult result{};
  ScanStats stats{};
};

const char* provision_outcome_name(ProvisionOutcome outcome);

// IDs held by more than one MAC, ordered by ID, members by MAC.
std::vector<DuplicateGroup> find_duplicates(const DeviceMap& devices);

// `{prefix}-{NNN}` in MAC order. Every considered device consumes a number,
// including ones that already carry their target ID.
AutoAssignPlan plan_auto_assign(const DeviceMap& devices, const std::string& prefix, int start_num,
                                bool include_offline);

std::string format_device_id(const std::string& prefix, int number);

// Picks one device by MAC, or by ID when that ID is unique. FLEET_ERR_DUPLICATE
// when the ID is shared, FLEET_ERR_NOT_FOUND when nothing matches.
fleet_err_t select_device(const Registry& registry, const std::string& mac, const std::string& id,
                          DeviceRecord& out);

class IdentityResolver {
public:
  using ConfirmFn = std::function<bool(const AutoAssignPlan& plan)>;

  IdentityResolver(Registry& registry, IdentityOptions opts) : registry_(registry), opts_(std::move(opts)) {}

  void set_cancel_flag(const std::atomic<bool>* flag) { cancel_ = flag; }

  std::vector<DuplicateGroup> find_duplicates() const;

  // Renames the device over HTTP, then records the new ID in the registry.
  fleet_err_t assign_id(const std::string& mac, const std::string& new_id, OperationResult& out);

  AutoAssignPlan plan_auto_assign() const;
  // Executes the plan one device at a time once `confirm` agrees.
  // FLEET_ERR_CANCELLED when it declines.
  fleet_err_t auto_assign(const ConfirmFn& confirm, AutoAssignPlan& plan, size_t& succeeded);

  // Probes the whole range and renames the device only if it is alone there.
  fleet_err_t provision_single(const std::string& cidr, const std::string& new_id, size_t concurrency,
                               ProvisionReport& report);

  // Loops a sound on the device for `duration`, then stops it.
  fleet_err_t identify(const DeviceRecord& device, std::chrono::seconds duration, OperationResult& out);

private:
  bool cancelled() const { return cancel_ && cancel_->load(); }
  BatchDispatcher dispatcher() const;

  Registry& registry_;
  IdentityOptions opts_;
  const std::atomic<bool>* cancel_{nullptr};
};

}  // namespace fleet

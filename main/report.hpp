#pragma once
#include "fleet_core/identity_resolver.hpp"
#include "fleet_core/types.hpp"
#include <string>
#include <vector>

namespace fleet::cli {

void print_scan_summary(const ScanStats& stats, const MergeStats& merge, size_t total_in_map);
void print_results(const std::string& title, const std::vector<OperationResult>& results);
void print_status_results(const std::vector<OperationResult>& results);
void print_file_listing(const std::vector<OperationResult>& results);
void print_loops(const OperationResult& result);
void print_device_list(const std::vector<DeviceRecord>& devices);
void print_duplicates(const std::vector<DuplicateGroup>& groups);
void print_plan(const AutoAssignPlan& plan);
void print_found_devices(const std::vector<DeviceRecord>& devices);

}  // namespace fleet::cli

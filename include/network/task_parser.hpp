#pragma once

#include "common/operation_status.hpp"
#include "common/vcd_types.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Builds a TaskResult from a task representation.
TaskResult taskFromJson(const nlohmann::json& task);

// Entities returned by create and update calls carry their queued tasks in
// tasks.task[]. The first one is reported.
OperationStatus firstQueuedTask(const nlohmann::json& entity, TaskResult& task);

// Delete calls answer with a bare task.
OperationStatus taskFromDeleteResponse(const nlohmann::json& response, TaskResult& task);

// First query record whose `name` equals `name` exactly, or nullptr.
const nlohmann::json* findRecordByName(const std::vector<nlohmann::json>& records, const std::string& name);

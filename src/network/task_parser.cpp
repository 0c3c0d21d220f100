#include "network/task_parser.hpp"
#include "common/logger.hpp"

static std::string stringField(const nlohmann::json& object, const char* key) {
    if (object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

TaskResult taskFromJson(const nlohmann::json& task) {
    TaskResult result;
    result.href = stringField(task, "href");
    result.name = stringField(task, "name");
    result.operation = stringField(task, "operation");
    result.operationName = stringField(task, "operationName");
    result.status = stringField(task, "status");
    result.raw = task;
    return result;
}

OperationStatus firstQueuedTask(const nlohmann::json& entity, TaskResult& task) {
    if (entity.is_object() && entity.contains("tasks") && entity["tasks"].is_object()) {
        const auto& tasks = entity["tasks"];
        if (tasks.contains("task") && tasks["task"].is_array() && !tasks["task"].empty()) {
            task = taskFromJson(tasks["task"][0]);
            Logger::debug("Queued task: " + task.href);
            return OperationStatus::success();
        }
    }
    Logger::error("Response does not contain a queued task");
    return OperationStatus::failure(ErrorKind::RemoteRejected, "Server response did not contain a task");
}

OperationStatus taskFromDeleteResponse(const nlohmann::json& response, TaskResult& task) {
    if (!response.is_object() || !response.contains("href")) {
        Logger::error("Delete response is not a task");
        return OperationStatus::failure(ErrorKind::RemoteRejected, "Server response did not contain a task");
    }
    task = taskFromJson(response);
    return OperationStatus::success();
}

const nlohmann::json* findRecordByName(const std::vector<nlohmann::json>& records, const std::string& name) {
    for (const auto& record : records) {
        if (stringField(record, "name") == name) {
            return &record;
        }
    }
    return nullptr;
}

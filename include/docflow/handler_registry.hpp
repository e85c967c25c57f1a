#pragma once

#include "docflow/document_handler.hpp"
#include "docflow/task_handler.hpp"
#include "docflow/task_types.hpp"
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace docflow {

// Every handler kind the worker can run
using TaskHandler = std::variant<DocumentHandler>;

/**
 * Fixed table from task type to handler, built once at startup and shared
 * read-only by all worker loops.
 */
class HandlerRegistry {
public:
    void add(TaskType type, TaskHandler handler) {
        handlers_.insert_or_assign(type, std::move(handler));
    }

    // nullptr for tags this worker does not know or has no handler for
    const TaskHandler* find(const std::string& tag) const {
        auto type = parse_task_type(tag);
        if (!type) return nullptr;
        auto it = handlers_.find(*type);
        return it == handlers_.end() ? nullptr : &it->second;
    }

    std::vector<std::string> tags() const {
        std::vector<std::string> result;
        for (const auto& entry : handlers_) {
            result.emplace_back(to_string(entry.first));
        }
        return result;
    }

    bool empty() const { return handlers_.empty(); }

private:
    std::map<TaskType, TaskHandler> handlers_;
};

inline void execute(const TaskHandler& handler, const Task& task, const CancellationToken& token) {
    std::visit([&](const auto& h) { execute_task(h, task, token); }, handler);
}

} // namespace docflow

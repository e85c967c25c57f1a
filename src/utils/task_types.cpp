#include "docflow/task_types.hpp"
#include <array>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace docflow {

const char* to_string(TaskType type) {
    switch (type) {
        case TaskType::DocumentProcess:
            return "document:process";
    }
    return "unknown";
}

std::optional<TaskType> parse_task_type(const std::string& tag) {
    if (tag == "document:process") return TaskType::DocumentProcess;
    return std::nullopt;
}

nlohmann::json encode_task_fields(const std::string& id,
                                  const std::string& type,
                                  const nlohmann::json& payload,
                                  int retry_count) {
    return {
        {"id", id},
        {"type", type},
        {"payload", payload.dump()},
        {"retry_count", std::to_string(retry_count)}
    };
}

namespace {

std::string require_string(const nlohmann::json& fields, const char* name) {
    auto it = fields.find(name);
    if (it == fields.end()) {
        throw std::invalid_argument(std::string("missing field '") + name + "'");
    }
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("field '") + name + "' is not a string");
    }
    return it->get<std::string>();
}

} // anonymous namespace

Task decode_task_fields(const nlohmann::json& fields, int64_t delivery_token) {
    if (!fields.is_object()) {
        throw std::invalid_argument("entry is not an object");
    }

    Task task;
    task.delivery_token = delivery_token;
    task.id = require_string(fields, "id");
    task.type = require_string(fields, "type");
    if (task.id.empty()) {
        throw std::invalid_argument("empty task id");
    }

    std::string raw_payload = require_string(fields, "payload");
    try {
        task.payload = nlohmann::json::parse(raw_payload);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::string("payload is not valid JSON: ") + e.what());
    }
    if (!task.payload.is_object()) {
        throw std::invalid_argument("payload is not a JSON object");
    }

    // Entries written before retries were tracked carry no counter
    if (fields.contains("retry_count")) {
        std::string raw_count = require_string(fields, "retry_count");
        size_t consumed = 0;
        try {
            task.retry_count = std::stoi(raw_count, &consumed);
        } catch (const std::logic_error&) {
            throw std::invalid_argument("retry_count is not an integer: '" + raw_count + "'");
        }
        if (consumed != raw_count.size() || task.retry_count < 0) {
            throw std::invalid_argument("retry_count is not a non-negative integer: '" + raw_count + "'");
        }
    }

    return task;
}

std::string generate_task_id() {
    static std::mutex uuid_mutex;
    static uint64_t last_ms = 0;
    static uint16_t sequence = 0;
    static std::random_device rd;
    static std::mt19937_64 gen(rd());

    std::lock_guard<std::mutex> lock(uuid_mutex);

    auto now = std::chrono::system_clock::now();
    uint64_t current_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    // Same or earlier millisecond: keep the timestamp and bump the sequence
    if (current_ms <= last_ms) {
        sequence++;
    } else {
        last_ms = current_ms;
        sequence = 0;
    }

    std::array<uint8_t, 16> bytes;

    // 48-bit unix_ts_ms, big-endian
    for (int i = 0; i < 6; ++i) {
        bytes[i] = (last_ms >> (40 - 8 * i)) & 0xFF;
    }

    // Version 7 and 12-bit sequence
    uint16_t seq = sequence & 0x0FFF;
    bytes[6] = 0x70 | (seq >> 8);
    bytes[7] = seq & 0xFF;

    // Variant 10 and 62 random bits
    uint64_t rand_data = gen();
    bytes[8] = 0x80 | ((rand_data >> 56) & 0x3F);
    for (int i = 9; i < 16; ++i) {
        bytes[i] = (rand_data >> (8 * (15 - i))) & 0xFF;
    }

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

std::string generate_consumer_name(const std::optional<int>& suffix) {
    static std::mutex gen_mutex;
    static std::random_device rd;
    static std::mt19937 gen(rd());

    uint32_t value;
    {
        std::lock_guard<std::mutex> lock(gen_mutex);
        value = gen();
    }

    std::stringstream ss;
    ss << "worker-" << std::hex << std::setw(8) << std::setfill('0') << value;
    if (suffix) {
        ss << std::dec << "-" << *suffix;
    }
    return ss.str();
}

} // namespace docflow

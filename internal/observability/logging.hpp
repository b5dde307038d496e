#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace reservation::runtime::config {
class RuntimeConfig;
}

namespace reservation::model {
struct SlotKey;
}

namespace reservation::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

// slot_key=<date>_<time>_<seating>, the same string the slot lock row is keyed by.
LogField SlotKeyField(const reservation::model::SlotKey& key);
LogField ReservationIdField(std::string_view id);

void InitializeLogging(const reservation::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace reservation::observability

#define RESERVATION_LOG_INFO(message, ...) ::reservation::observability::LogInfo((message), ##__VA_ARGS__)
#define RESERVATION_LOG_WARN(message, ...) ::reservation::observability::LogWarn((message), ##__VA_ARGS__)
#define RESERVATION_LOG_ERROR(message, ...) ::reservation::observability::LogError((message), ##__VA_ARGS__)

#include <main/utils/logger.hpp>
#include <cstdio>

LogLevel Logger::s_level = LogLevel::INFO;

void Logger::setLevel(LogLevel level) {
    s_level = level;
}

LogLevel Logger::getLevel() {
    return s_level;
}

bool Logger::isEnabled(LogLevel level) {
    return static_cast<int>(s_level) >= static_cast<int>(level);
}

void Logger::setEspLogLevel(const char* tag, esp_log_level_t level) {
    esp_log_level_set(tag, level);
}

void Logger::emit(esp_log_level_t esp_level, const char* tag, const char* message) {
    switch (esp_level) {
        case ESP_LOG_ERROR: ESP_LOGE(tag, "%s", message); break;
        case ESP_LOG_WARN:  ESP_LOGW(tag, "%s", message); break;
        case ESP_LOG_INFO:  ESP_LOGI(tag, "%s", message); break;
        case ESP_LOG_DEBUG: ESP_LOGD(tag, "%s", message); break;
        default:            ESP_LOGI(tag, "%s", message); break;
    }
}

void Logger::logFormatted(esp_log_level_t esp_level, LogLevel gate_level, const char* tag, const char* fmt, va_list args) {
    if (!isEnabled(gate_level)) {
        return;
    }
    char buffer[LOGGER_MAX_MESSAGE_LEN];
    int n = vsnprintf(buffer, sizeof(buffer), fmt, args);
    if (n < 0) {
        emit(esp_level, tag, "formatting error");
        return;
    }
    buffer[sizeof(buffer) - 1] = '\0';
    emit(esp_level, tag, buffer);
}

void Logger::hex(const char* tag, const char* label, const uint8_t* data, size_t length) {
    if (!isEnabled(LogLevel::DEBUG)) {
        return;
    }
    // "xx " per byte plus room for the label and the truncation marker
    char buffer[LOGGER_MAX_HEX_BYTES * 3 + 64];
    int off = std::snprintf(buffer, sizeof(buffer), "%s [0x", label);
    size_t shown = (length < LOGGER_MAX_HEX_BYTES) ? length : LOGGER_MAX_HEX_BYTES;
    for (size_t i = 0; i < shown && off > 0 && off < static_cast<int>(sizeof(buffer)); ++i) {
        off += std::snprintf(buffer + off, sizeof(buffer) - off, " %02x", data[i]);
    }
    if (off > 0 && off < static_cast<int>(sizeof(buffer))) {
        std::snprintf(buffer + off, sizeof(buffer) - off, "%s] (%u bytes)",
                      (shown < length) ? " ..." : "", static_cast<unsigned>(length));
    }
    buffer[sizeof(buffer) - 1] = '\0';
    emit(ESP_LOG_DEBUG, tag, buffer);
}

void Logger::error(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(ESP_LOG_ERROR, LogLevel::ERROR, tag, fmt, args);
    va_end(args);
}

void Logger::warn(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(ESP_LOG_WARN, LogLevel::WARN, tag, fmt, args);
    va_end(args);
}

void Logger::info(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(ESP_LOG_INFO, LogLevel::INFO, tag, fmt, args);
    va_end(args);
}

void Logger::debug(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(ESP_LOG_DEBUG, LogLevel::DEBUG, tag, fmt, args);
    va_end(args);
}

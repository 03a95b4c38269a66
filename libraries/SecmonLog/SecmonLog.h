/**
 * SecmonLog.h : leveled logging helpers
 *  - LOGD/LOGI/LOGW/LOGE(tag, fmt, ...)
 *  - one line per call on stderr: [ms][level][tag] message
 */
#ifndef SECMON_LOG_H
#define SECMON_LOG_H

#include <cstdarg>

namespace secmon_log {

enum Level { DEBUG_L = 0, INFO_L = 1, WARN_L = 2, ERROR_L = 3 };

void setLevel(Level lvl);
Level level();

// Accepts "debug", "info", "warn"/"warning", "error" (any case).
bool parseLevel(const char *name, Level &out);

void vlog(Level lvl, const char *tag, const char *fmt, va_list ap);
void log(Level lvl, const char *tag, const char *fmt, ...) __attribute__((format(printf, 3, 4)));

} // namespace secmon_log

#define LOGD(tag, fmt, ...) secmon_log::log(secmon_log::DEBUG_L, tag, fmt, ##__VA_ARGS__)
#define LOGI(tag, fmt, ...) secmon_log::log(secmon_log::INFO_L, tag, fmt, ##__VA_ARGS__)
#define LOGW(tag, fmt, ...) secmon_log::log(secmon_log::WARN_L, tag, fmt, ##__VA_ARGS__)
#define LOGE(tag, fmt, ...) secmon_log::log(secmon_log::ERROR_L, tag, fmt, ##__VA_ARGS__)

#endif

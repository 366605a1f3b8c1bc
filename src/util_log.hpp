#pragma once
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Error = 2 };

// All writers share one mutex; lines go to stderr and to the sink file.
void safe_log(const std::string &s);
void safe_log_debug(const std::string &s);
void safe_log_error(const std::string &s);

void set_log_level(LogLevel lvl);
LogLevel get_log_level();

// Empty path disables the file sink.
void set_log_file(const std::string &path);

// "debug" | "info" | "error"; returns false for anything else
bool parse_log_level(const std::string &name, LogLevel &out);

#ifndef CYCLODRIVE_LOG_H
#define CYCLODRIVE_LOG_H
#include <string>

namespace cyclodrive {

// 0 fatal, 1 error, 2 warning, 3 info, 4 debug, 5 trace
extern void set_logging_level(unsigned int level);
extern unsigned int level_string_to_boost(const std::string& level);
extern std::string  get_string_logging_level(unsigned level);
extern unsigned get_logging_level();
extern void trace(unsigned int level, const char *message);

// smaller level means less log. level=5 means saving all logs.
// An empty file name logs to the console instead of a rotating file.
void set_log_path_and_level(const std::string& file, unsigned int level);
void flush_logs();

}

#endif // CYCLODRIVE_LOG_H

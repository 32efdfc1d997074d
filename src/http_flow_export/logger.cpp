#include "logger.hpp"

// Warnings and errors by default; the front end lowers this with -v
LogLevel Logger::current_level_ = LogLevel::WARNING;
bool Logger::show_timestamp_ = false;
std::ostream* Logger::out_ = &std::cout;
std::ostream* Logger::err_ = &std::cerr;
std::mutex Logger::mutex_;

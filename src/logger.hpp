#pragma once
/*
 * Logging
 *
 * Purpose: one named spdlog logger ("cmdpal") shared by the registry modules.
 * Usage: cmdpal_log()->info(...); front ends call init_file_logging() before
 *        the terminal takes over stdout.
 */
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

std::shared_ptr<spdlog::logger> cmdpal_log();

// Replace the default stderr sink with a file sink. Returns false with msg on failure.
bool init_file_logging(const std::string& path, std::string& msg);

// Accepts spdlog level names (trace, debug, info, warn, error, critical, off).
bool set_log_level(const std::string& level);

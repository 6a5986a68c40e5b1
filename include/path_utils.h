#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion and log file placement
 */

#include <string>

namespace interview_coach {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Creates the directory (and parents) if missing. Returns false if it
 * cannot be created or exists as a non-directory.
 */
bool ensure_directory(const std::string& path);

/**
 * Session log file name: interview_log_<scenario>.json, or
 * interview_log_<session_id>.json when no scenario is given.
 */
std::string session_log_filename(const std::string& scenario, const std::string& session_id);

} // namespace interview_coach

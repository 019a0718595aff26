#pragma once
#include <string>
#include <filesystem>

// ------------------------------------------------------------
// Resource root
// ------------------------------------------------------------

// Root folder for config, models, positions and drills. The first of
// ../resources, ./resources holding a positions/ or training/ folder wins,
// then any existing one, then cwd. With BLINDFOLD_PORTABLE_ONLY only
// resources/ beside the executable is considered.
std::string getResourcePath();

// Override (tests, --resources flag). Empty string restores lookup.
void setResourcePath(const std::string& path);

// Path of a file under the resource root
std::filesystem::path resourceFile(const std::string& relative);

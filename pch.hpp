// pch.hpp: console harness only
#pragma once

// ---------------------------------------------------------
// External libraries
// ---------------------------------------------------------
#include <nlohmann/json.hpp>

// ---------------------------------------------------------
// Standard Library
// ---------------------------------------------------------
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------
// Project headers that rarely change
// ---------------------------------------------------------
#include "logger.hpp"
#include "error_manager.hpp"
#include "voice_constants.hpp"

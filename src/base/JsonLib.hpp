#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Shorthand for `nlohmann::json`, used for the persisted state file.
 */
using json = nlohmann::json;

#pragma once

#include "types.hpp"

#include <nlohmann/json.hpp>

// Output document handed to downstream consumers.
nlohmann::json to_json(const TranscriptionResult& result);
nlohmann::json to_json(const Segment& segment);

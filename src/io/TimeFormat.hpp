#pragma once
#include "models/CoreTypes.hpp"
#include <string>

// ISO-8601 UTC helpers ("2024-12-02T06:05:38Z"), second resolution.
std::string formatIsoUtc(const TimePoint &tp);

// Accepts "YYYY-MM-DDTHH:MM:SS" with optional trailing 'Z'.
// Throws std::runtime_error on anything else.
TimePoint parseIsoUtc(const std::string &iso);

#pragma once
#include <string>
#include <chrono>

namespace pattern_harness {
namespace jsonutil {

// Escapes a string for inclusion between JSON double quotes.
std::string escape(const std::string& s);

// UTC ISO-8601 with second precision; empty string for the epoch (unset) time point.
std::string time_to_iso(std::chrono::system_clock::time_point tp);

}
}

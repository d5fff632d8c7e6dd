#pragma once

#include <string>
#include <vector>

namespace hearth {
namespace events {

// Split "a.b.c" into {"a", "b", "c"}. Empty segments are preserved.
std::vector<std::string> split_topic(const std::string &topic);

// A topic is valid when it is non-empty and has no empty segments.
bool is_valid_topic(const std::string &topic);

// Patterns follow topic rules, with "*" allowed as a whole segment.
bool is_valid_pattern(const std::string &pattern);

/**
 * @brief Match a topic against a subscription pattern
 *
 * "*" matches exactly one segment and the segment counts must agree:
 * "*.device.*" matches "kitchen.device.power" but not "kitchen.sensor.power"
 * or "kitchen.device.power.level".
 */
bool topic_matches(const std::string &pattern, const std::string &topic);

}  // namespace events
}  // namespace hearth

#include "topic_matcher.hpp"

namespace hearth {
namespace events {

std::vector<std::string> split_topic(const std::string &topic) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        size_t dot = topic.find('.', start);
        if (dot == std::string::npos) {
            segments.push_back(topic.substr(start));
            break;
        }
        segments.push_back(topic.substr(start, dot - start));
        start = dot + 1;
    }
    return segments;
}

bool is_valid_topic(const std::string &topic) {
    if (topic.empty()) {
        return false;
    }
    for (const auto &segment : split_topic(topic)) {
        if (segment.empty() || segment.find('*') != std::string::npos) {
            return false;
        }
    }
    return true;
}

bool is_valid_pattern(const std::string &pattern) {
    if (pattern.empty()) {
        return false;
    }
    for (const auto &segment : split_topic(pattern)) {
        if (segment.empty()) {
            return false;
        }
        // Wildcard must be a whole segment ("ki*" is not a pattern)
        if (segment.find('*') != std::string::npos && segment != "*") {
            return false;
        }
    }
    return true;
}

bool topic_matches(const std::string &pattern, const std::string &topic) {
    const auto pattern_segments = split_topic(pattern);
    const auto topic_segments = split_topic(topic);

    if (pattern_segments.size() != topic_segments.size()) {
        return false;
    }

    for (size_t i = 0; i < pattern_segments.size(); ++i) {
        if (pattern_segments[i] == "*") {
            continue;
        }
        if (pattern_segments[i] != topic_segments[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace events
}  // namespace hearth

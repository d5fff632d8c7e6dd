#include "selector.hpp"

#include <cctype>

#include "common/glob.hpp"

namespace hearth {
namespace devices {

namespace {

std::string trim(const std::string &str) {
    size_t begin = 0;
    size_t end = str.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) --end;
    return str.substr(begin, end - begin);
}

}  // namespace

bool Selector::parse(const std::string &expression, Selector &selector, std::string &error) {
    selector = Selector();
    selector.expression_ = trim(expression);

    if (selector.expression_.empty()) {
        error = "Selector must not be empty";
        return false;
    }
    if (selector.expression_ == "*") {
        selector.match_all_ = true;
        return true;
    }

    size_t start = 0;
    while (start <= selector.expression_.size()) {
        size_t comma = selector.expression_.find(',', start);
        const std::string term = trim(selector.expression_.substr(
            start, comma == std::string::npos ? std::string::npos : comma - start));
        start = comma == std::string::npos ? selector.expression_.size() + 1 : comma + 1;

        const size_t eq = term.find('=');
        if (eq == std::string::npos) {
            error = "Selector term '" + term + "' is not key=value";
            return false;
        }
        std::string key = trim(term.substr(0, eq));
        std::string value = trim(term.substr(eq + 1));
        if (key.empty() || value.empty()) {
            error = "Selector term '" + term + "' has an empty key or value";
            return false;
        }
        selector.terms_.emplace_back(std::move(key), std::move(value));
    }
    return true;
}

bool Selector::matches(const Device &device) const {
    if (match_all_) {
        return true;
    }
    if (terms_.empty()) {
        return false;
    }
    for (const auto &[key, pattern] : terms_) {
        if (key == "id") {
            if (!glob_match(pattern, device.id)) {
                return false;
            }
            continue;
        }
        auto it = device.attributes.find(key);
        if (it == device.attributes.end() || !glob_match(pattern, it->second)) {
            return false;
        }
    }
    return true;
}

}  // namespace devices
}  // namespace hearth

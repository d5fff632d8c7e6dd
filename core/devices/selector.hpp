#pragma once

#include <string>
#include <utility>
#include <vector>

#include "device_types.hpp"

namespace hearth {
namespace devices {

/**
 * @brief Parsed binding selector
 *
 * Grammar: comma-separated "key=value" terms, all of which must match.
 * Values are shell globs ("lamp*"). The key "id" matches the device id;
 * any other key matches the device attribute of that name. "*" alone
 * selects every device.
 *
 * Examples: "room=kitchen,kind=lamp*", "id=hall_sensor", "*"
 */
class Selector {
public:
    Selector() = default;

    // Returns false with error set on a malformed expression
    static bool parse(const std::string &expression, Selector &selector, std::string &error);

    bool matches(const Device &device) const;

    const std::string &expression() const { return expression_; }

private:
    std::string expression_;
    bool match_all_ = false;
    std::vector<std::pair<std::string, std::string>> terms_;
};

}  // namespace devices
}  // namespace hearth

#pragma once

#include <cstdint>
#include <string>

namespace sorter {

/**
 * @brief Latest state reported by the microcontroller
 */
struct device_state {
    bool is_moving = false;
    bool is_triggered = false;
    std::string raw_line;
    int64_t observed_at = 0;   // microseconds, 0 until the first valid line
};

/**
 * @brief Parse a "(moving, triggered)" state line
 *
 * Accepts two 0/1 digits separated by a comma or whitespace, optionally
 * wrapped in parentheses: "0,1", "(0,1)", "0 1", " ( 1 , 0 )\r".
 *
 * @param line raw line without the terminator
 * @param is_moving first digit
 * @param is_triggered second digit
 * @return false when the line does not match, outputs untouched
 */
bool parse_state_line(const std::string& line, bool& is_moving, bool& is_triggered);

} // namespace sorter

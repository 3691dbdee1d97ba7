#pragma once

#include <string>

namespace sorter {

/**
 * @brief Sorting categories, the numeric value is the serial command sent to the device
 */
enum class category : int {
    can = 1,
    bottle = 2,
    garbage = 3,
};

/**
 * @brief How the final category was reached by the two classifiers
 */
enum class agreement {
    both_agreed,
    retry_agreed,
    tie_break,
    single_source_only,
    both_failed,
};

int category_id(category c);

/**
 * @brief Backend slug of a category ("can", "bottle", "garbage")
 */
std::string category_slug(category c);

/**
 * @brief Map a numeric id to a category
 *
 * @param id value in {1,2,3}
 * @param out receives the category
 * @return false when id is out of range
 */
bool category_from_id(int id, category& out);

/**
 * @brief Free-text label to category: lowercased substring match,
 *        "can" before "bottle", anything else is garbage
 */
category category_from_label(const std::string& label);

std::string to_string(agreement a);

} // namespace sorter

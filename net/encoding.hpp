#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sorter {

std::string base64_encode(const std::vector<uint8_t>& data);

// RFC 3986 percent-encoding for query parameters (libcurl)
std::string url_escape(const std::string& text);

} // namespace sorter

#pragma once

#include <string>
#include <string_view>

namespace dp {

std::string json_escape(std::string_view s);

} // namespace dp

#pragma once
#include <nlohmann/json.hpp>

namespace relpack
{

using Json = nlohmann::json;

} // namespace relpack

#pragma once

#include <string>

namespace sre_gateway {

/// Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string Iso8601Now();

} // namespace sre_gateway

#pragma once

#include <set>
#include <string>

namespace optick {

// Fresh random UUID. One per connection attempt; never reused.
std::string make_correlation_id();

// {"guid": .., "method": "sub", "data": {"mode": .., "instrumentKeys": [..]}}
std::string build_subscription(const std::string& guid, const std::string& mode,
                               const std::set<std::string>& instrument_ids);

} // namespace optick

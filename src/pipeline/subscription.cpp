#include "src/pipeline/subscription.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>

namespace optick {

std::string make_correlation_id() {
    boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

std::string build_subscription(const std::string& guid, const std::string& mode,
                               const std::set<std::string>& instrument_ids) {
    nlohmann::json msg = {
        {"guid", guid},
        {"method", "sub"},
        {"data", {
            {"mode", mode},
            {"instrumentKeys", instrument_ids}
        }}
    };
    return msg.dump();
}

} // namespace optick

#include "src/registry/instrument_registry.hpp"

#include "common/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace optick {

using json = nlohmann::json;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw RegistryError("cannot open " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool parse_number(const std::string& s, double& out) {
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return !s.empty() && *end == '\0';
}

} // namespace

void InstrumentRegistry::add_chain_json(const std::string& text, const std::string& origin) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw RegistryError(origin + ": " + e.what());
    }
    if (!doc.is_object()) {
        throw RegistryError(origin + ": option chain must be a JSON object keyed by strike");
    }

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string& strike = it.key();
        const json& entry = it.value();
        if (!entry.is_object()) {
            throw RegistryError(origin + ": strike " + strike + " is not an object");
        }

        StrikeLegs& legs = chain_[strike];
        auto take = [&](const char* name, OptionSide side, std::optional<std::string>& slot) {
            auto leg = entry.find(name);
            if (leg == entry.end()) return;
            if (!leg->is_string() || leg->get<std::string>().empty()) {
                throw RegistryError(origin + ": strike " + strike + " has a bad " + name + " id");
            }
            const std::string id = leg->get<std::string>();
            slot = id;
            instruments_.insert(id);
            reverse_[id] = ChainLeg{strike, side};
        };
        take("CE", OptionSide::Call, legs.call);
        take("PE", OptionSide::Put, legs.put);
    }
}

void InstrumentRegistry::add_list(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        const std::string id = trim(line);
        if (!id.empty()) {
            instruments_.insert(id);
        }
    }
}

void InstrumentRegistry::load_chain_file(const std::string& path) {
    add_chain_json(read_file(path), path);
}

void InstrumentRegistry::load_list_file(const std::string& path) {
    add_list(read_file(path));
}

std::optional<ChainLeg> InstrumentRegistry::lookup(const std::string& instrument_id) const {
    auto it = reverse_.find(instrument_id);
    if (it == reverse_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> InstrumentRegistry::strikes() const {
    std::vector<std::string> out;
    out.reserve(chain_.size());
    bool numeric = true;
    for (const auto& kv : chain_) {
        double ignored = 0.0;
        numeric = numeric && parse_number(kv.first, ignored);
        out.push_back(kv.first);
    }
    if (numeric) {
        std::sort(out.begin(), out.end(), [](const std::string& a, const std::string& b) {
            return std::strtod(a.c_str(), nullptr) < std::strtod(b.c_str(), nullptr);
        });
    }
    return out;
}

StrikeLegs InstrumentRegistry::legs(const std::string& strike) const {
    auto it = chain_.find(strike);
    if (it == chain_.end()) return {};
    return it->second;
}

} // namespace optick

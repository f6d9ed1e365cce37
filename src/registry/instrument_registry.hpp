#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace optick {

enum class OptionSide { Call, Put };

struct ChainLeg {
    std::string strike;
    OptionSide side = OptionSide::Call;
};

struct StrikeLegs {
    std::optional<std::string> call;
    std::optional<std::string> put;
};

// Instruments to subscribe to and query by. Fed from option chain files
// ({"<strike>": {"CE": id, "PE": id}}) and/or plain one-id-per-line lists.
class InstrumentRegistry {
public:
    void add_chain_json(const std::string& text, const std::string& origin = "<chain>");
    void add_list(const std::string& text);

    void load_chain_file(const std::string& path);
    void load_list_file(const std::string& path);

    const std::set<std::string>& instruments() const { return instruments_; }
    bool empty() const { return instruments_.empty(); }

    std::optional<ChainLeg> lookup(const std::string& instrument_id) const;

    // Chain strikes in ascending numeric order (textual order if any strike
    // is not a number).
    std::vector<std::string> strikes() const;
    StrikeLegs legs(const std::string& strike) const;

private:
    std::set<std::string> instruments_;
    std::map<std::string, StrikeLegs> chain_;
    std::map<std::string, ChainLeg> reverse_;
};

} // namespace optick

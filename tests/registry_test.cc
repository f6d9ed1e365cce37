#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "src/registry/instrument_registry.hpp"
#include "tests/test_support.hpp"

#include <fstream>

namespace optick {
namespace {

constexpr const char* kChain = R"({
    "22000": {"CE": "NSE_FO|1001", "PE": "NSE_FO|1002"},
    "21950": {"CE": "NSE_FO|1003", "PE": "NSE_FO|1004"},
    "22100": {"CE": "NSE_FO|1005"}
})";

TEST(InstrumentRegistryTest, LoadsChain) {
    InstrumentRegistry reg;
    reg.add_chain_json(kChain);

    EXPECT_EQ(reg.instruments().size(), 5u);
    EXPECT_EQ(reg.strikes(), (std::vector<std::string>{"21950", "22000", "22100"}));

    const StrikeLegs legs = reg.legs("22000");
    EXPECT_EQ(legs.call.value_or(""), "NSE_FO|1001");
    EXPECT_EQ(legs.put.value_or(""), "NSE_FO|1002");
    EXPECT_FALSE(reg.legs("22100").put.has_value());
    EXPECT_FALSE(reg.legs("99999").call.has_value());

    auto leg = reg.lookup("NSE_FO|1004");
    ASSERT_TRUE(leg.has_value());
    EXPECT_EQ(leg->strike, "21950");
    EXPECT_EQ(leg->side, OptionSide::Put);
    EXPECT_FALSE(reg.lookup("NSE_INDEX|Nifty 50").has_value());
}

TEST(InstrumentRegistryTest, StrikesSortNumerically) {
    InstrumentRegistry reg;
    reg.add_chain_json(R"({"950": {"CE": "a"}, "1000": {"CE": "b"}, "99.5": {"PE": "c"}})");
    EXPECT_EQ(reg.strikes(), (std::vector<std::string>{"99.5", "950", "1000"}));
}

TEST(InstrumentRegistryTest, ListSkipsBlankLines) {
    InstrumentRegistry reg;
    reg.add_list("NSE_INDEX|Nifty 50\n\n  NSE_FO|1001 \r\nNSE_FO|1001\n");
    EXPECT_EQ(reg.instruments(), (std::set<std::string>{"NSE_INDEX|Nifty 50", "NSE_FO|1001"}));
    EXPECT_TRUE(reg.strikes().empty());
}

TEST(InstrumentRegistryTest, RejectsMalformedChain) {
    InstrumentRegistry reg;
    EXPECT_THROW(reg.add_chain_json("{not json"), RegistryError);
    EXPECT_THROW(reg.add_chain_json("[1, 2]"), RegistryError);
    EXPECT_THROW(reg.add_chain_json(R"({"100": "x"})"), RegistryError);
    EXPECT_THROW(reg.add_chain_json(R"({"100": {"CE": 7}})"), RegistryError);
    EXPECT_THROW(reg.add_chain_json(R"({"100": {"CE": ""}})"), RegistryError);
}

TEST(InstrumentRegistryTest, LoadsFiles) {
    testing_support::TempDir dir;
    const std::string chain = dir.file("chain.json");
    const std::string list = dir.file("ids.txt");
    std::ofstream(chain) << kChain;
    std::ofstream(list) << "NSE_INDEX|Nifty 50\n";

    InstrumentRegistry reg;
    reg.load_chain_file(chain);
    reg.load_list_file(list);
    EXPECT_EQ(reg.instruments().size(), 6u);

    EXPECT_THROW(reg.load_chain_file(dir.file("missing.json")), RegistryError);
    EXPECT_THROW(reg.load_list_file(dir.file("missing.txt")), RegistryError);
}

}  // namespace
}  // namespace optick

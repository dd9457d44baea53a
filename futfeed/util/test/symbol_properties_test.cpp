#include "symbol_properties.h"
#include "stdio.h"
#include <string>
#include "gtest/gtest.h"
#include <cstdlib>
#include "plcc/PLCC.hpp"

class SymFixture : public testing::Test {
public:
    SymFixture ():
    _cfg_str ( \
        "symbol = {\n"
        "    ES = {\n"
        "        market = cme\n"
        "        description = E-mini S&P 500\n"
        "        currency = USD\n"
        "        contract_multiplier = 50\n"
        "        tick_size = 0.25\n"
        "    }\n"
        "    VX = {\n"
        "        market = cfe\n"
        "        contract_multiplier = 1000\n"
        "        tick_size = 0.05\n"
        "    }\n"
        "    6E = {\n"
        "        market = cme\n"
        "        currency = USD\n"
        "        px_multiplier = 1.0\n"
        "    }\n"
        "}\n"),
    _cfg_file("/tmp/futfeed_symbol_properties.cfg")
    {
        utils::PLCC::ToggleTest();
    }

    void TearDown() {
        remove(_cfg_file.c_str());
    }

protected:
    const std::string _cfg_str;
    const std::string _cfg_file;
};

TEST_F (SymFixture, Read) {
    const utils::SymbolPropertiesDB db(utils::ConfigureReader::fromString(_cfg_str));
    EXPECT_EQ(db.size(), 3u);

    const std::vector<std::string> syms = {"6E", "ES", "VX"};
    EXPECT_EQ(db.listSymbols(), syms);

    const auto* es = db.getBySymbol("ES");
    ASSERT_TRUE(es != nullptr);
    EXPECT_STREQ(es->_symbol.c_str(), "ES");
    EXPECT_STREQ(es->_market.c_str(), "cme");
    EXPECT_STREQ(es->_description.c_str(), "E-mini S&P 500");
    EXPECT_DOUBLE_EQ(es->_contract_multiplier, 50);
    EXPECT_DOUBLE_EQ(es->_tick_size, 0.25);
    EXPECT_DOUBLE_EQ(es->_px_multiplier, 1.0);

    // defaults
    const auto* vx = db.getBySymbol("VX");
    ASSERT_TRUE(vx != nullptr);
    EXPECT_STREQ(vx->_currency.c_str(), "USD");
    EXPECT_STREQ(vx->_description.c_str(), "");

    std::string market;
    EXPECT_TRUE(db.getMarket("VX", market));
    EXPECT_STREQ(market.c_str(), "cfe");
    EXPECT_FALSE(db.getMarket("NQ", market));
    EXPECT_STREQ(market.c_str(), "cfe");

    printf("%s\n", es->toString().c_str());
}

TEST_F (SymFixture, NotFound) {
    const utils::SymbolPropertiesDB db(utils::ConfigureReader::fromString(_cfg_str));
    EXPECT_TRUE(db.getBySymbol("NQ") == nullptr);
    EXPECT_THROW(db.getBySymbol("NQ", false), std::invalid_argument);
    EXPECT_EQ(utils::SymbolPropertiesDB().size(), 0u);
}

TEST_F (SymFixture, File) {
    FILE* fp = fopen(_cfg_file.c_str(), "w");
    ASSERT_TRUE(fp != NULL);
    fprintf(fp, "%s", _cfg_str.c_str());
    fclose(fp);

    const utils::SymbolPropertiesDB db(_cfg_file);
    EXPECT_EQ(db.size(), 3u);
    EXPECT_THROW(utils::SymbolPropertiesDB("/tmp/futfeed_no_such.cfg"), std::runtime_error);
}

TEST_F (SymFixture, BadProperties) {
    // market is required
    const auto cfg = utils::ConfigureReader::fromString(
        "symbol = {\n"
        "    ES = {\n"
        "        tick_size = 0.25\n"
        "    }\n"
        "}\n");
    EXPECT_THROW(utils::SymbolPropertiesDB db(cfg), std::runtime_error);
    EXPECT_THROW(utils::SymbolPropertiesDB db(utils::ConfigureReader::fromString("a = b\n")), std::runtime_error);
}

TEST_F (SymFixture, Default) {
    // no main config, the database is empty
    EXPECT_EQ(utils::SymbolPropertiesDB::get().size(), 0u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

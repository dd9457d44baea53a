#include "plcc/ConfigureReader.hpp"
#include "plcc/PLCC.hpp"
#include "stdio.h"
#include <string>
#include "gtest/gtest.h"
#include <cstdlib>

TEST (ConfigTest, Read) {
    const char* cfgstr =
        "#test\n"
        "k1 = v1\n"
        "    # [ problem ] \n"
        "    # [ #aa #aa ] \n"
        "k2 = [ 2, 3 ]\n"
        "k3 = { \n"
        "       k31 = [2.1] \n"
        "       k32 =  abc  \n"
        "      }\n"
        "# this is a comment\n"
        "k4 = [ { k41 = [ { k411 = v411},{k412=[1,2,3]}]\n"
        "         k42 = 0.2},\n"
        "       { k43 = { k431 = { k4311 = [ { k43111 = 0 }, { k43112 = [2,3]} #comments here\n"
        "           ] } # more comments\n"
        "                 k432 = [ [\\=,\\,],\\[,\\}] }\n"
        "          \n"
        "    # \n"
        "          k44 = \\ abc\\\\d\\  \n"
        "        }]\n"
        "\n"
        "#k1 = [ v1 ]\n"
        "k5 = {\n"
        "  #aaa\n"
        "a=b\n"
        "  #bbb\n"
        "}\n"
        "#kk;";
    const char* cfg = "/tmp/futfeed_cfgtest.cfg";

    FILE* fp = fopen(cfg, "w");
    ASSERT_TRUE(fp != NULL);
    fprintf(fp, "%s", cfgstr);
    fclose(fp);

    utils::ConfigureReader r(cfg);
    EXPECT_STREQ(r.fileName().c_str(), cfg);

    // do some query
    EXPECT_STREQ(r.get<std::string>("k1").c_str(), "v1");
    EXPECT_TRUE(r.get<long long>("k2[1]") == (long long)3);
    EXPECT_DOUBLE_EQ(r.get<double>("k3.k31[0]"), 2.1);
    EXPECT_STREQ(r.get<std::string>("k3.k32").c_str(), "abc");
    EXPECT_TRUE(r.get<int>("k4[0].k41[1].k412[2]") ==  3);
    EXPECT_STREQ(r.get<std::string>("k4[1].k43.k432[ 0][ 1]").c_str(), ",");
    EXPECT_STREQ(r.get<std::string>("k4[1].k43.k432[1]").c_str(), "[");
    EXPECT_STREQ(r.get<std::string>("k4[1].k44").c_str(), " abc\\d ");
    EXPECT_STREQ(r.get<std::string>("k5.a").c_str(), "b");

    const auto v = r.getReader("k4[1].k43");
    const auto ks = v.listKeys();
    ASSERT_EQ(ks.size(), 2u);
    EXPECT_STREQ(ks[0].c_str(), "k431");
    EXPECT_STREQ(ks[1].c_str(), "k432");
    EXPECT_EQ(v.getReader("k431.k4311").arraySize(), 2u);
    EXPECT_EQ(r.getReader("k2").arraySize(), 2u);
    EXPECT_EQ(r.getReader("k3").arraySize(), 0u);

    auto arr = v.getArr<int>("k431.k4311[1].k43112");
    std::vector<int> arr2 = {2, 3};
    EXPECT_EQ(arr, arr2);

    // get non-exist keys
    EXPECT_THROW(r.get<int>("k1"), std::exception);
    EXPECT_THROW(r.get<int>("Q1"), std::runtime_error);
    EXPECT_THROW(r.getReader("Q1"), std::runtime_error);
    bool found = true;
    EXPECT_EQ(r.get<long long>("k2[2]", &found, 1LL), 1LL);
    EXPECT_FALSE(found);
    EXPECT_EQ(r.get<int>("k2[0]", &found, 0), 2);
    EXPECT_TRUE(found);

    remove(cfg);
}

TEST (ConfigTest, FromString) {
    const auto r = utils::ConfigureReader::fromString(
        "multiplier = {\n"
        "    ES = 1.0\n"
        "    VX = 1000\n"
        "}\n"
        "flag = true\n"
        "flag = false\n");
    const auto m = r.getReader("multiplier");
    const auto keys = m.listKeys();
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_STREQ(keys[0].c_str(), "ES");
    EXPECT_DOUBLE_EQ(m.get<double>("VX"), 1000.0);

    // the later one wins
    EXPECT_FALSE(r.get<bool>("flag"));
}

TEST (ConfigTest, Bad) {
    EXPECT_THROW(utils::ConfigureReader::fromString("k = { a = b\n"), std::runtime_error);
    EXPECT_THROW(utils::ConfigureReader::fromString("k = [ 1, 2 }\n"), std::runtime_error);
    EXPECT_THROW(utils::ConfigureReader::fromString("= v\n"), std::runtime_error);
    EXPECT_THROW(utils::ConfigureReader::fromString("k = \\"), std::runtime_error);
    EXPECT_THROW(utils::ConfigureReader("/tmp/futfeed_no_such.cfg"), std::runtime_error);

    // an empty config
    utils::ConfigureReader empty(NULL);
    EXPECT_EQ(empty.listKeys().size(), 0u);
    EXPECT_EQ(empty.get<int>("a", nullptr, 7), 7);
}

TEST (ConfigTest, PLCC) {
    utils::PLCC::ToggleTest();
    EXPECT_TRUE(utils::PLCC::getConfigPath() == nullptr);
    EXPECT_EQ(plcc_getInt("ReferenceYear", nullptr, 0), 0);
    EXPECT_STREQ(utils::PLCC::getLogFileName("stdout").c_str(), "stdout");
    EXPECT_EQ(utils::PLCC::getLogFileName("/tmp/futfeed").find("/tmp/futfeed_"), 0u);
    logInfo("plcc test %d", 1);
    logDebug("plcc debug");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

#include "stream_provider.h"
#include "stdio.h"
#include <string>
#include <fstream>
#include "gtest/gtest.h"
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/bzip2.hpp>

namespace io = boost::iostreams;

class StreamFixture : public testing::Test {
public:
    StreamFixture ():
    _lines( {"Timestamp,Ticker,Type,Side,SecurityID,Quantity,Price",
             "20230615093012123,ESU3,2,,123,5,450000000000",
             "20230615093012124,ESU3,1,B,123,10,449750000000"
            }
          ),
    _plain("/tmp/futfeed_stream_test.csv"),
    _gz("/tmp/futfeed_stream_test.csv.gz"),
    _bz2("/tmp/futfeed_stream_test.csv.bz2")
    {}

    void TearDown() {
        remove(_plain.c_str());
        remove(_gz.c_str());
        remove(_bz2.c_str());
    }

protected:
    std::vector<std::string> _lines;
    std::string _plain, _gz, _bz2;

    template<typename Compressor>
    void write(const std::string& file, const Compressor& comp) {
        io::filtering_ostream out;
        out.push(comp);
        out.push(io::file_sink(file, std::ios_base::out | std::ios_base::binary));
        for (const auto& l : _lines) {
            out << l << "\n";
        }
        out.reset();
    }

    void writePlain(const std::string& file) {
        std::ofstream out(file);
        for (const auto& l : _lines) {
            out << l << "\n";
        }
    }

    std::vector<std::string> readAll(const std::string& file) {
        auto in = utils::StreamProvider::open(file);
        std::vector<std::string> vec;
        std::string line;
        while (std::getline(*in, line)) {
            vec.push_back(line);
        }
        return vec;
    }
};

TEST_F (StreamFixture, Extension) {
    EXPECT_STREQ(utils::StreamProvider::extension("/a/b/c.csv.gz").c_str(), ".gz");
    EXPECT_STREQ(utils::StreamProvider::extension("c.BZ2").c_str(), ".BZ2");
    EXPECT_STREQ(utils::StreamProvider::extension("/a.b/c").c_str(), "");
    EXPECT_STREQ(utils::StreamProvider::extension("c").c_str(), "");
    EXPECT_EQ(utils::StreamProvider::forExtension(".GZ"), utils::StreamProvider::Gzip);
    EXPECT_EQ(utils::StreamProvider::forExtension(".bz2"), utils::StreamProvider::Bzip2);
    EXPECT_EQ(utils::StreamProvider::forExtension(".csv"), utils::StreamProvider::None);
    EXPECT_EQ(utils::StreamProvider::forExtension(""), utils::StreamProvider::None);
}

TEST_F (StreamFixture, Plain) {
    writePlain(_plain);
    EXPECT_EQ(readAll(_plain), _lines);
}

TEST_F (StreamFixture, Gzip) {
    write(_gz, io::gzip_compressor());
    EXPECT_EQ(readAll(_gz), _lines);
}

TEST_F (StreamFixture, Bzip2) {
    write(_bz2, io::bzip2_compressor());
    EXPECT_EQ(readAll(_bz2), _lines);
}

TEST_F (StreamFixture, Missing) {
    EXPECT_THROW(utils::StreamProvider::open("/tmp/futfeed_no_such_file.csv"), std::runtime_error);
}

TEST_F (StreamFixture, Corrupted) {
    // plain text named as gzip
    writePlain(_gz);
    EXPECT_THROW(readAll(_gz), std::exception);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

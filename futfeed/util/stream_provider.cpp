#include "stream_provider.h"
#include "csv_util.h"

#include <stdexcept>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/bzip2.hpp>

namespace utils {

    std::string StreamProvider::extension(const std::string& path) {
        const auto slash = path.find_last_of('/');
        const auto dot = path.find_last_of('.');
        if ((dot == std::string::npos) || ((slash != std::string::npos) && (dot < slash))) {
            return "";
        }
        return path.substr(dot);
    }

    StreamProvider::Compression StreamProvider::forExtension(const std::string& ext) {
        const auto e = CSVUtil::to_upper(ext);
        if (e == ".GZ") {
            return Gzip;
        }
        if (e == ".BZ2") {
            return Bzip2;
        }
        return None;
    }

    std::unique_ptr<std::istream> StreamProvider::open(const std::string& path) {
        return open(path, forExtension(extension(path)));
    }

    std::unique_ptr<std::istream> StreamProvider::open(const std::string& path, Compression compression) {
        namespace io = boost::iostreams;
        io::file_source src(path, std::ios_base::in | std::ios_base::binary);
        if (!src.is_open()) {
            throw std::runtime_error("failed to open " + path + " for reading!");
        }
        std::unique_ptr<io::filtering_istream> in(new io::filtering_istream());
        switch (compression) {
        case Gzip:
            in->push(io::gzip_decompressor());
            break;
        case Bzip2:
            in->push(io::bzip2_decompressor());
            break;
        default:
            break;
        }
        in->push(src);
        in->exceptions(std::ios_base::badbit);
        return std::unique_ptr<std::istream>(in.release());
    }
}

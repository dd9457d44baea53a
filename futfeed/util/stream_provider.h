#pragma once

#include <istream>
#include <memory>
#include <string>

namespace utils {

    /*
     * Opens a data file as an input stream, decompressing on the fly
     * according to the file extension:
     *     .gz   gzip
     *     .bz2  bzip2
     *     other plain text
     *
     * The returned stream has badbit exceptions turned on, so that
     * a corrupted archive throws from the read instead of looking
     * like an end of file.
     */
    class StreamProvider {
    public:
        enum Compression {
            None = 0,
            Gzip = 1,
            Bzip2 = 2
        };

        // the extension including the dot, i.e. ".bz2", empty if none
        static std::string extension(const std::string& path);
        static Compression forExtension(const std::string& ext);

        // throws std::runtime_error if the file cannot be opened
        static std::unique_ptr<std::istream> open(const std::string& path);
        static std::unique_ptr<std::istream> open(const std::string& path, Compression compression);
    };
}

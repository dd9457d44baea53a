#pragma once

#include <istream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include "feed_decoder.h"
#include "future_symbol.h"
#include "tick.h"

namespace md {

/*
 * Reads futures ticks from an AlgoSeek style csv file, one line at a
 * time.  The first line is the header, from which the column positions
 * are resolved.  Each data line either gives a tick or is skipped:
 *   - fewer fields than the header requires
 *   - option or spread tickers (with space or '-')
 *   - tickers not resolved, or whose root has no multiplier
 *   - roots not in the symbol filter, if one is given
 *   - message types other than trade, quote and open interest
 *   - quotes with side other than B or S
 *   - unparsable fields, which are also logged
 * Failing to open or read the stream throws.
 *
 * Usage:
 *   FuturesTickReader reader(file, multipliers);
 *   while (const auto* tick = reader.current()) {
 *       ...
 *       reader.moveNext();
 *   }
 */
class FuturesTickReader {
public:
    using MultiplierMap = std::map<std::string, double>;
    using SymbolFilter = std::set<std::string>;

    struct Options {
        // throws at construction if the header misses any column,
        // otherwise a bad header makes every line fail
        bool _strict_header;
        Options(): _strict_header(true) {};
        explicit Options(bool strict_header): _strict_header(strict_header) {};
    };

    struct Stats {
        long long _lines;   // data lines read
        long long _ticks;   // ticks produced
        long long _errors;  // lines skipped on an exception
        Stats(): _lines(0), _ticks(0), _errors(0) {};

        // lines skipped by a filter
        long long rejected() const { return _lines - _ticks - _errors; };
        std::string toString() const;
    };

    // opens the file through StreamProvider, decompressing .gz and .bz2.
    // resolver defaults to FutureSymbolParser on the configured symbol properties
    FuturesTickReader(const std::string& data_file,
                      const MultiplierMap& multipliers,
                      const SymbolFilter* filter = nullptr,
                      std::shared_ptr<const SymbolResolver> resolver = nullptr,
                      const Options& opt = Options());

    FuturesTickReader(std::unique_ptr<std::istream> stream,
                      const MultiplierMap& multipliers,
                      const SymbolFilter* filter = nullptr,
                      std::shared_ptr<const SymbolResolver> resolver = nullptr,
                      const Options& opt = Options());

    ~FuturesTickReader();

    FuturesTickReader(const FuturesTickReader&) = delete;
    FuturesTickReader& operator=(const FuturesTickReader&) = delete;

    // advances to the next tick, false if the stream is exhausted or closed
    bool moveNext();

    // the current tick, nullptr once exhausted
    const Tick* current() const { return m_has_tick? &m_tick : nullptr; };

    // releases the stream, safe to be called multiple times
    void close();
    bool isClosed() const { return !m_stream; };

    const HeaderColumns& columns() const { return m_columns; };
    const Stats& stats() const { return m_stats; };

private:
    std::unique_ptr<std::istream> m_stream;
    const HeaderColumns m_columns;
    const MultiplierMap m_multipliers;
    const bool m_has_filter;
    const SymbolFilter m_filter;  // upper case
    const std::shared_ptr<const SymbolResolver> m_resolver;
    const Options m_opt;

    Tick m_tick;
    bool m_has_tick;
    Stats m_stats;

    // decodes a data line into tick, false if the line is skipped,
    // errors are counted and logged
    bool parse(const std::string& line, Tick& tick);

    static HeaderColumns readHeader(std::istream* stream, const Options& opt);
    static SymbolFilter toUpper(const SymbolFilter* filter);
    static std::shared_ptr<const SymbolResolver> defaultResolver();
    bool decode(const utils::CSVUtil::LineTokens& tokens, Tick& tick) const;
};
}

#include "futures_reader.h"
#include "stream_provider.h"
#include "symbol_properties.h"
#include "plcc/PLCC.hpp"
#include <boost/lexical_cast.hpp>
#include <stdexcept>

#define ReferenceYearConfig "ReferenceYear"

namespace md {

std::string FuturesTickReader::Stats::toString() const {
    char buf[256];
    snprintf(buf, sizeof(buf), "lines(%lld), ticks(%lld), rejected(%lld), errors(%lld)",
            _lines, _ticks, rejected(), _errors);
    return std::string(buf);
}

FuturesTickReader::FuturesTickReader(const std::string& data_file,
                                     const MultiplierMap& multipliers,
                                     const SymbolFilter* filter,
                                     std::shared_ptr<const SymbolResolver> resolver,
                                     const Options& opt)
: FuturesTickReader(utils::StreamProvider::open(data_file), multipliers, filter, resolver, opt)
{}

FuturesTickReader::FuturesTickReader(std::unique_ptr<std::istream> stream,
                                     const MultiplierMap& multipliers,
                                     const SymbolFilter* filter,
                                     std::shared_ptr<const SymbolResolver> resolver,
                                     const Options& opt)
: m_stream(std::move(stream)),
  m_columns(readHeader(m_stream.get(), opt)),
  m_multipliers(multipliers),
  m_has_filter(filter != nullptr),
  m_filter(toUpper(filter)),
  m_resolver(resolver? resolver : defaultResolver()),
  m_opt(opt),
  m_has_tick(false)
{
    moveNext();
}

FuturesTickReader::~FuturesTickReader() {
    close();
}

void FuturesTickReader::close() {
    if (m_stream) {
        m_stream.reset();
        logDebug("Reader closed: %s", m_stats.toString().c_str());
    }
}

bool FuturesTickReader::moveNext() {
    m_has_tick = false;
    if (!m_stream) {
        return false;
    }
    std::string line;
    while (std::getline(*m_stream, line)) {
        ++m_stats._lines;
        if (parse(line, m_tick)) {
            ++m_stats._ticks;
            m_has_tick = true;
            return true;
        }
    }
    // exhausted
    close();
    return false;
}

bool FuturesTickReader::parse(const std::string& line, Tick& tick) {
    try {
        return decode(utils::CSVUtil::read_line(line, ',', false), tick);
    } catch (const std::exception& e) {
        ++m_stats._errors;
        logError("Failed to parse line: %s", e.what());
        logTrace("Line: %s", line.c_str());
    }
    return false;
}

bool FuturesTickReader::decode(const utils::CSVUtil::LineTokens& tokens, Tick& tick) const {
    if ((int)tokens.size() - 1 < m_columns._columns_required) {
        return false;
    }

    // options and spreads
    const std::string& raw_ticker = tokens.at(m_columns._ticker);
    if (raw_ticker.find_first_of(" -") != std::string::npos) {
        return false;
    }
    const std::string ticker = utils::CSVUtil::trim_char(raw_ticker, '"');
    if (ticker.size() == 0) {
        return false;
    }

    const auto symbol = m_resolver->resolve(ticker);
    if (!symbol) {
        return false;
    }
    const auto iter = m_multipliers.find(symbol->_symbol);
    if (iter == m_multipliers.end()) {
        return false;
    }
    if (m_has_filter && (m_filter.count(utils::CSVUtil::to_upper(symbol->_symbol)) == 0)) {
        return false;
    }

    const long long time_milli = utils::TimeUtil::fixed_string_to_milli(tokens.at(m_columns._timestamp));
    const int type_code = boost::lexical_cast<int>(utils::CSVUtil::trim(tokens.at(m_columns._type)));

    // side is only read for quotes
    TickType type;
    const std::string* side = nullptr;
    if (FeedDecoder::classifyType(type_code, type) && (type == Quote)) {
        side = &tokens.at(m_columns._side);
    }
    MessageClass mc;
    if (!FeedDecoder::classify(type_code, side, mc)) {
        return false;
    }

    tick = FeedDecoder::assemble(*symbol, time_milli, mc,
                                 utils::CSVUtil::trim(tokens.at(m_columns._price)),
                                 utils::CSVUtil::trim(tokens.at(m_columns._quantity)),
                                 iter->second);
    return true;
}

HeaderColumns FuturesTickReader::readHeader(std::istream* stream, const Options& opt) {
    if (!stream) {
        throw std::invalid_argument("FuturesTickReader: null input stream");
    }
    std::string line;
    if (!std::getline(*stream, line)) {
        line.clear();
    }
    // utf-8 byte order mark
    if (line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        line.erase(0, 3);
    }
    const HeaderColumns hc = HeaderColumns::resolve(line);
    if (!hc.isComplete()) {
        if (opt._strict_header) {
            logError("Bad header, missing columns %s: %s", hc.missing().c_str(), line.c_str());
            throw std::runtime_error("FuturesTickReader: header missing columns " + hc.missing());
        }
        logError("Bad header, missing columns %s, lines could all be skipped", hc.missing().c_str());
    }
    logDebug("Header columns: %s", hc.toString().c_str());
    return hc;
}

FuturesTickReader::SymbolFilter FuturesTickReader::toUpper(const SymbolFilter* filter) {
    SymbolFilter upper;
    if (filter) {
        for (const auto& s : *filter) {
            upper.insert(utils::CSVUtil::to_upper(s));
        }
    }
    return upper;
}

std::shared_ptr<const SymbolResolver> FuturesTickReader::defaultResolver() {
    const int reference_year = plcc_getInt(ReferenceYearConfig, nullptr, 0);
    return std::make_shared<const FutureSymbolParser>(utils::SymbolPropertiesDB::get(), reference_year);
}
}

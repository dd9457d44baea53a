#include "future_symbol.h"
#include "time_util.h"
#include <ctype.h>

namespace md {

    const char* FutureSymbolParser::DefaultMarket = "cme";

    FutureSymbolParser::FutureSymbolParser(const utils::SymbolPropertiesDB& properties, int reference_year)
    : m_properties(properties),
      m_reference_year(reference_year > 0 ? reference_year : utils::TimeUtil::cur_year())
    {}

    int FutureSymbolParser::monthFromCode(char code) {
        switch (code) {
        case 'F': return 1;
        case 'G': return 2;
        case 'H': return 3;
        case 'J': return 4;
        case 'K': return 5;
        case 'M': return 6;
        case 'N': return 7;
        case 'Q': return 8;
        case 'U': return 9;
        case 'V': return 10;
        case 'X': return 11;
        case 'Z': return 12;
        default:  return 0;
        }
    }

    bool FutureSymbolParser::parseTicker(const std::string& ticker, std::string& root, int& month, int& year, int& year_digits) {
        const int sz = (int) ticker.size();
        int pos = sz;
        while ((pos > 0) && isdigit((unsigned char)ticker[pos-1])) {
            --pos;
        }
        year_digits = sz - pos;
        if ((year_digits < 1) || (year_digits > 2)) {
            return false;
        }
        // a month code and at least one char of root
        if (pos < 2) {
            return false;
        }
        month = monthFromCode(ticker[pos-1]);
        if (month == 0) {
            return false;
        }
        root = ticker.substr(0, pos-1);
        for (const char c : root) {
            if (!isalnum((unsigned char)c)) {
                return false;
            }
        }
        year = std::stoi(ticker.substr(pos));
        return true;
    }

    int FutureSymbolParser::resolveYear(int year, int year_digits) const {
        if (year_digits == 2) {
            return 2000 + year;
        }
        int y = m_reference_year - (m_reference_year % 10) + year;
        if (y > m_reference_year + 5) {
            y -= 10;
        }
        return y;
    }

    std::shared_ptr<const FutureSymbol> FutureSymbolParser::resolve(const std::string& ticker) const {
        std::string root;
        int month, year, year_digits;
        if (!parseTicker(ticker, root, month, year, year_digits)) {
            return nullptr;
        }
        std::string market;
        if (!m_properties.getMarket(root, market)) {
            market = DefaultMarket;
        }
        return std::make_shared<const FutureSymbol>(root, market, ticker,
                resolveYear(year, year_digits)*100 + month);
    }
}

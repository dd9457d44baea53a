#pragma once

#include <string>
#include <memory>
#include "symbol_properties.h"

namespace md {

    // canonical identity of a future contract
    struct FutureSymbol {
        std::string _symbol;    // root symbol, i.e. ES
        std::string _market;    // i.e. cme
        std::string _ticker;    // the ticker it is parsed from, i.e. ESU3
        int _contract_month;    // yyyymm, i.e. 202309

        FutureSymbol(): _contract_month(0) {};
        FutureSymbol(const std::string& symbol, const std::string& market,
                     const std::string& ticker, int contract_month)
        : _symbol(symbol), _market(market), _ticker(ticker), _contract_month(contract_month) {};

        bool operator==(const FutureSymbol& sym) const {
            return (_symbol == sym._symbol) &&
                   (_market == sym._market) &&
                   (_contract_month == sym._contract_month);
        }
        bool operator!=(const FutureSymbol& sym) const { return !(*this == sym); };

        // i.e. ES_202309.cme
        std::string toString() const {
            return _symbol + "_" + std::to_string(_contract_month) + "." + _market;
        }
    };

    // maps a raw ticker to a canonical future symbol
    class SymbolResolver {
    public:
        virtual ~SymbolResolver() {};

        // returns nullptr if the ticker cannot be parsed
        virtual std::shared_ptr<const FutureSymbol> resolve(const std::string& ticker) const = 0;
    };

    /*
     * Parses tickers of ROOT + month code + year, i.e.
     *     ESU3   ES, Sep of the decade around the reference year
     *     ESZ23  ES, Dec 2023
     *     6EH24  6E, Mar 2024
     * Month codes are F G H J K M N Q U V X Z for Jan to Dec.
     * A single digit year is taken within the decade of the reference
     * year, rolled back 10 years if it is more than 5 years ahead.
     * The market is looked up from the symbol properties, DefaultMarket
     * if the root is not there.
     */
    class FutureSymbolParser : public SymbolResolver {
    public:
        static const char* DefaultMarket;

        // reference_year 0 uses the current year
        explicit FutureSymbolParser(const utils::SymbolPropertiesDB& properties, int reference_year = 0);

        std::shared_ptr<const FutureSymbol> resolve(const std::string& ticker) const override;

        // splits the ticker, false if it is not a future ticker
        static bool parseTicker(const std::string& ticker, std::string& root, int& month, int& year, int& year_digits);

        // month from the month code, 0 if not a month code
        static int monthFromCode(char code);

        int resolveYear(int year, int year_digits) const;
        int referenceYear() const { return m_reference_year; };

    private:
        const utils::SymbolPropertiesDB m_properties;
        const int m_reference_year;
    };
}

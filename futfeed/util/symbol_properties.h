#pragma once
#include "plcc/ConfigureReader.hpp"
#include <unordered_map>
#include <vector>
#include <string>

namespace utils {
    // reference data of a future root symbol
    struct InstrumentProperties {
        std::string _symbol;     // root symbol, i.e. ES
        std::string _market;     // listing market, i.e. cme
        std::string _description;
        std::string _currency;

        double _contract_multiplier;
        double _tick_size;
        double _px_multiplier;

        InstrumentProperties();
        InstrumentProperties(const std::string& symbol,
                             const std::string& market,
                             const std::string& description,
                             const std::string& currency,
                             double contract_multiplier,
                             double tick_size,
                             double px_multiplier);

        // create from a key-value config
        InstrumentProperties(const std::string& symbol, const ConfigureReader& kv);

        std::string toString() const;
    };

    class SymbolPropertiesDB {
    public:
        // the path to the properties file is defined in main.cfg
        // with the key "SymbolProperties", an empty database is used
        // if the key is not there
        static const SymbolPropertiesDB& get();

        // load from a file, throws if the file cannot be read
        explicit SymbolPropertiesDB(const std::string& cfg_file);
        explicit SymbolPropertiesDB(const ConfigureReader& cfg);
        SymbolPropertiesDB();

        // returns nullptr if not found and return_null is set, otherwise throws
        const InstrumentProperties* getBySymbol(const std::string& symbol, bool return_null=true) const;

        // gets the market of the root symbol, false if unknown
        bool getMarket(const std::string& symbol, std::string& market) const;

        std::vector<std::string> listSymbols() const;
        size_t size() const { return m_properties.size(); };

    private:
        void load(const ConfigureReader& cfg);
        std::unordered_map<std::string, InstrumentProperties> m_properties;
    };

    //
    // inline implementations
    //

    inline
    InstrumentProperties::InstrumentProperties(const std::string &symbol, const ConfigureReader& kv)
    : _symbol(symbol),
      _market(kv.get<std::string>("market")),
      _description(kv.get<std::string>("description", nullptr, "")),
      _currency(kv.get<std::string>("currency", nullptr, "USD")),
      _contract_multiplier(kv.get<double>("contract_multiplier", nullptr, 1.0)),
      _tick_size(kv.get<double>("tick_size", nullptr, 0.0)),
      _px_multiplier(kv.get<double>("px_multiplier", nullptr, 1.0))
    {}

    inline
    bool SymbolPropertiesDB::getMarket(const std::string& symbol, std::string& market) const {
        const auto* ip = getBySymbol(symbol, true);
        if (!ip) {
            return false;
        }
        market = ip->_market;
        return true;
    }
}

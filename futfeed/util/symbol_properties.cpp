#include "symbol_properties.h"
#include "plcc/PLCC.hpp"
#include <algorithm>

#define SymbolPropertiesConfig "SymbolProperties"

namespace utils {

    InstrumentProperties::InstrumentProperties()
    : _contract_multiplier(1.0), _tick_size(0), _px_multiplier(1.0) {}

    InstrumentProperties::InstrumentProperties(
            const std::string& symbol,
            const std::string& market,
            const std::string& description,
            const std::string& currency,
            double contract_multiplier,
            double tick_size,
            double px_multiplier)
    : _symbol(symbol), _market(market), _description(description),
      _currency(currency), _contract_multiplier(contract_multiplier),
      _tick_size(tick_size), _px_multiplier(px_multiplier) {};

    std::string InstrumentProperties::toString() const {
        char buf[512];
        snprintf(buf, sizeof(buf), "%s, %s, %s, %s, %.7lf, %.7lf, %.7lf",
                _symbol.c_str(), _market.c_str(), _description.c_str(), _currency.c_str(),
                _contract_multiplier, _tick_size, _px_multiplier);
        return std::string(buf);
    }

    SymbolPropertiesDB::SymbolPropertiesDB() {}

    SymbolPropertiesDB::SymbolPropertiesDB(const std::string& cfg_file) {
        try {
            load(utils::ConfigureReader(cfg_file.c_str()));
        } catch (const std::exception& e) {
            logError("Error loading symbol properties from %s: %s", cfg_file.c_str(), e.what());
            throw;
        }
    }

    SymbolPropertiesDB::SymbolPropertiesDB(const ConfigureReader& cfg) {
        load(cfg);
    }

    void SymbolPropertiesDB::load(const ConfigureReader& cfg) {
        m_properties.clear();
        const auto& symbols = cfg.getReader("symbol");
        for (const auto& k : symbols.listKeys()) {
            m_properties.emplace(k, InstrumentProperties(k, symbols.getReader(k)));
        }
    }

    const SymbolPropertiesDB& SymbolPropertiesDB::get() {
        static const SymbolPropertiesDB db = [] () {
            bool found = false;
            const auto cfg_file = utils::PLCC::instance().get<std::string>(SymbolPropertiesConfig, &found, "");
            if (!found) {
                logInfo("%s not configured, using empty symbol properties", SymbolPropertiesConfig);
                return SymbolPropertiesDB();
            }
            return SymbolPropertiesDB(cfg_file);
        }();
        return db;
    }

    const InstrumentProperties* SymbolPropertiesDB::getBySymbol(const std::string& symbol, bool return_null) const {
        const auto iter = m_properties.find(symbol);
        if (iter == m_properties.end()) {
            if (return_null) return nullptr;
            logError("No symbol properties found for %s!", symbol.c_str());
            throw std::invalid_argument("symbol properties not found for " + symbol);
        }
        return &(iter->second);
    }

    std::vector<std::string> SymbolPropertiesDB::listSymbols() const {
        std::vector<std::string> vec;
        for (const auto& kv : m_properties) {
            vec.push_back(kv.first);
        }
        std::sort(vec.begin(), vec.end());
        return vec;
    }
}

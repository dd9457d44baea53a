#include "feed_decoder.h"
#include <algorithm>
#include <boost/lexical_cast.hpp>

namespace md {

    const char* HeaderColumns::TimestampName = "Timestamp";
    const char* HeaderColumns::TickerName = "Ticker";
    const char* HeaderColumns::TypeName = "Type";
    const char* HeaderColumns::SideName = "Side";
    const char* HeaderColumns::SecurityIDName = "SecurityID";
    const char* HeaderColumns::QuantityName = "Quantity";
    const char* HeaderColumns::PriceName = "Price";

    const char* FeedDecoder::VolatilitySymbol = "VX";
    const double FeedDecoder::PriceScale = 10000000000.0;

    static int findColumn(const utils::CSVUtil::LineTokens& header, const char* name) {
        const auto iter = std::find(header.begin(), header.end(), std::string(name));
        if (iter == header.end()) {
            return -1;
        }
        return (int)(iter - header.begin());
    }

    HeaderColumns::HeaderColumns()
    : _timestamp(-1), _ticker(-1), _type(-1), _side(-1),
      _security_id(-1), _quantity(-1), _price(-1), _columns_required(-1)
    {}

    HeaderColumns HeaderColumns::resolve(const utils::CSVUtil::LineTokens& header) {
        HeaderColumns hc;
        if (header.size() == 0) {
            return hc;
        }
        hc._timestamp = findColumn(header, TimestampName);
        hc._ticker = findColumn(header, TickerName);
        hc._type = findColumn(header, TypeName);
        hc._side = findColumn(header, SideName);
        hc._security_id = findColumn(header, SecurityIDName);
        hc._quantity = findColumn(header, QuantityName);
        hc._price = findColumn(header, PriceName);
        hc._columns_required = std::max({hc._timestamp, hc._ticker, hc._type, hc._side,
                                         hc._security_id, hc._quantity, hc._price});
        return hc;
    }

    HeaderColumns HeaderColumns::resolve(const std::string& header_line) {
        return resolve(utils::CSVUtil::read_line(header_line, ',', false));
    }

    bool HeaderColumns::isComplete() const {
        return (_timestamp >= 0) && (_ticker >= 0) && (_type >= 0) && (_side >= 0) &&
               (_security_id >= 0) && (_quantity >= 0) && (_price >= 0);
    }

    std::string HeaderColumns::missing() const {
        const std::vector<std::pair<int, const char*>> cols = {
            {_timestamp, TimestampName}, {_ticker, TickerName}, {_type, TypeName},
            {_side, SideName}, {_security_id, SecurityIDName},
            {_quantity, QuantityName}, {_price, PriceName} };
        std::string ret;
        for (const auto& c : cols) {
            if (c.first < 0) {
                ret += (ret.size()? ",":"");
                ret += c.second;
            }
        }
        return ret;
    }

    std::string HeaderColumns::toString() const {
        char buf[256];
        snprintf(buf, sizeof(buf), "%s(%d), %s(%d), %s(%d), %s(%d), %s(%d), %s(%d), %s(%d), required(%d)",
                TimestampName, _timestamp, TickerName, _ticker, TypeName, _type, SideName, _side,
                SecurityIDName, _security_id, QuantityName, _quantity, PriceName, _price,
                _columns_required);
        return std::string(buf);
    }

    bool FeedDecoder::classifyType(int type_code, TickType& type) {
        switch (type_code & MessageTypeMask) {
        case TradeCode:
            type = Trade;
            return true;
        case OpenInterestCode:
            type = OpenInterest;
            return true;
        case QuoteCode:
            type = Quote;
            return true;
        default:
            return false;
        }
    }

    bool FeedDecoder::classifySide(const std::string& side, bool& is_ask) {
        if (side == "B") {
            is_ask = false;
            return true;
        }
        if (side == "S") {
            is_ask = true;
            return true;
        }
        return false;
    }

    bool FeedDecoder::classify(int type_code, const std::string* side, MessageClass& mc) {
        TickType type;
        if (!classifyType(type_code, type)) {
            return false;
        }
        bool is_ask = false;
        if (type == Quote) {
            if (!side || !classifySide(*side, is_ask)) {
                return false;
            }
        }
        mc = MessageClass(type, is_ask);
        return true;
    }

    double FeedDecoder::scaleFactor(const std::string& symbol) {
        return (symbol == VolatilitySymbol)? 1.0 : PriceScale;
    }

    Tick FeedDecoder::assemble(const FutureSymbol& symbol,
                               long long time_milli,
                               const MessageClass& mc,
                               const std::string& raw_price,
                               const std::string& raw_quantity,
                               double px_multiplier) {
        double price = boost::lexical_cast<double>(raw_price) / scaleFactor(symbol._symbol);
        const long long quantity = boost::lexical_cast<long long>(raw_quantity);
        price *= px_multiplier;

        Tick tick;
        tick._symbol = symbol;
        tick._time_milli = time_milli;
        tick._type = mc._type;
        switch (mc._type) {
        case Quote:
            tick._value = price;
            if (mc._is_ask) {
                tick._ask_price = price;
                tick._ask_size = quantity;
                tick._ask_set = true;
            } else {
                tick._bid_price = price;
                tick._bid_size = quantity;
                tick._bid_set = true;
            }
            break;
        case Trade:
            tick._value = price;
            tick._quantity = quantity;
            break;
        case OpenInterest:
            tick._value = (double) quantity;
            tick._exchange = symbol._market;
            break;
        }
        return tick;
    }
}

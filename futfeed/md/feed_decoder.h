#pragma once

#include <string>
#include <vector>
#include "tick.h"
#include "csv_util.h"

namespace md {

    /*
     * Column positions of a data file, discovered from its header row.
     * A column not in the header is -1.  _columns_required is the largest
     * of the indexes, -1 if the header is empty, so that a data line needs
     * at least _columns_required+1 fields.
     */
    struct HeaderColumns {
        static const char* TimestampName;
        static const char* TickerName;
        static const char* TypeName;
        static const char* SideName;
        static const char* SecurityIDName;
        static const char* QuantityName;
        static const char* PriceName;

        int _timestamp;
        int _ticker;
        int _type;
        int _side;
        int _security_id;
        int _quantity;
        int _price;
        int _columns_required;

        HeaderColumns();

        // names are matched case sensitively, the first match is taken
        static HeaderColumns resolve(const utils::CSVUtil::LineTokens& header);
        static HeaderColumns resolve(const std::string& header_line);

        // true if all of the columns are found
        bool isComplete() const;

        // comma separated names of the columns not found
        std::string missing() const;
        std::string toString() const;
    };

    // the decoded message type of a line
    struct MessageClass {
        TickType _type;
        bool _is_ask;  // quote side, only for Quote

        MessageClass(): _type(Trade), _is_ask(false) {};
        MessageClass(TickType type, bool is_ask): _type(type), _is_ask(is_ask) {};
    };

    class FeedDecoder {
    public:
        // the low 4 bits of the type field
        static const int MessageTypeMask = 0xF;
        static const int QuoteCode = 1;
        static const int TradeCode = 2;
        static const int OpenInterestCode = 11;

        // all but the volatility future carry 10 implied decimals
        static const char* VolatilitySymbol;
        static const double PriceScale;

        // type field to tick type, false for message types not producing ticks
        static bool classifyType(int type_code, TickType& type);

        // "B" is bid, "S" is ask, false otherwise
        static bool classifySide(const std::string& side, bool& is_ask);

        // both of the above, side is only read for a quote and could be
        // nullptr for other types
        static bool classify(int type_code, const std::string* side, MessageClass& mc);

        static double scaleFactor(const std::string& symbol);

        // builds the tick from the raw price and quantity fields,
        // throws if they cannot be parsed
        static Tick assemble(const FutureSymbol& symbol,
                             long long time_milli,
                             const MessageClass& mc,
                             const std::string& raw_price,
                             const std::string& raw_quantity,
                             double px_multiplier);
    };
}

#pragma once

#include <stdio.h>
#include <stdlib.h>
#include <string>
#include <stdexcept>
#include <vector>
#include <map>
#include <type_traits>

/* ----------------------------------
 * A configuration File Reader
 * ----------------------------------
 *
 * Config file in the format:
 *
 * key = value \n                     (1)
 * key = { key1 = value1 \n ... } \n  (2)
 * key = [ value, ... , value ] \n    (3)
 *
 * (1): basic form, a new line is needed for each kv pair
 *      * key and value are allowed to have white-space char in the middle,
 *      * key is taken as white-space stripped string between last '\n', or '{' and '='
 *      * value is taken as white-space stripped string between '=' and '\n'
 * (2): composite form with '{' and '}'
 *      * each key/value pair in each line
 * (3): array defined within '[' and ']', with ',' as delimiter
 *      * values are white-space and new-line stripped strings between
 *        previous ',' (or '[') and the next ',' (or ']')
 * (4): comment is allowed after '#' until a new-line.
 * (5): special charactors '=', '{', '}', '[', ']', ',', '#' are escaped
 *      with '\'.  Charactor '\' is escaped by itself, "\n" is a new line and
 *      "\ " is a space that is not stripped.
 * (6): value/array at root level without a key is illegal.
 *
 * When querying, use the '.' to navigate tree and '[]' for array elements.
 * For example:
 * Query: 'symbol.ES.market'
 * Query: 'roots[1]'
 */

namespace utils {

class ConfigureReader {
public:
    // Value object which could hold one of three types: a map, an array or a simple value
    class Value;
    using ConfigMapType = std::map<std::string, Value>;
    class Value {
    public:
        ConfigMapType _kv;
        std::vector<Value> _array;
        std::string _value;

        // gets simple value or array value from current Value object,
        // and convert to the given data types.
        // allowed types for simple values are int/long long/double/bool and string
        template<typename T> T get() const;
        template<typename T> std::vector<T> getArr() const;
        size_t arraySize() const;

        // The key could have '.' or '[]' to suggest the composite or arrays
        // returns NULL if not found
        const Value* query(const std::string& key) const;

        void clear();
        bool isEmpty() const;
        bool isMap() const { return _kv.size() > 0; };

    protected:
        struct KeyItem {
            std::string _key;
            int _idx;
            KeyItem(const std::string& k, int ix): _key(k), _idx(ix) {};
        };

        // this disects a query string "key" to a vector of KeyItems
        // for example: a.b.c[2].d to
        // [ {"a",0}, {"b",0}, {"c",0}, {"",2}, {"d",0} ]
        static bool getKeyItems(const std::string& key,  std::vector<KeyItem>& ki);

        void assertArray() const;
        void assertValue() const;
    };

    // reads the config file, a NULL file name gives an empty config
    // throws std::runtime_error if the file cannot be read or parsed
    explicit ConfigureReader(const char* configFileName);

    // parses the config from a string
    static ConfigureReader fromString(const std::string& cfg);

    // clear everything and reload, returns an error string, empty if ok
    std::string reset(const std::string& configFileName = "");

    // retrieve for simple values or array
    // this would throw if key not found
    // Example: symbol.ES.market
    template<typename T> T              get(const char* key) const;
    template<typename T> std::vector<T> getArr(const char* key) const;

    // retrieve simple value or array with default value
    template<typename T> T              get(const char* key, bool* found, const T& defaultVal) const;
    template<typename T> std::vector<T> getArr(const char* key, bool* found, const std::vector<T>& defaultVal) const;

    // retrieve the value of the key as a reader, a map or an array, throws if not found
    ConfigureReader getReader(const std::string& key) const;

    // lists all keys if current Value object is a map
    std::vector<std::string> listKeys() const;

    // return size of array if current Value object is an array
    size_t arraySize() const;

    const std::string& fileName() const { return m_configFileName; };

protected:
    std::string m_configFileName;

    // root value, key/value in m_value._kv
    Value m_value;

    // structural charactors are encoded by scan(), so that escaped ones
    // are kept as part of a key or value
    enum {
        EQ = 16, // =
        OC = 17, // {
        CC = 18, // }
        OB = 19, // [
        CB = 20, // ]
        CM = 21, // ,
        NL = 22, // \n
        WS = 23, // escaped space, restored in toConfigString()
    };

    ConfigureReader() {};
    explicit ConfigureReader(const Value& value);

    static bool readFile(const char* file_path, std::string& content);
    static bool scan(const std::string& raw, std::string& encoded);
    static bool isSpace(char c);
    static void strip(const char*& ks, const char*& ke);
    static const char* match(const char* s, const char* e, char match_char);
    static std::string toConfigString(const char* ks, const char* ke);
    static bool parseValue(const char* s, const char* e, Value& val);
    static bool parseKeyValue(const char* s, const char* e, ConfigMapType& kv);
    void parse(const std::string& raw);
};

/*
 * Template Implementations
 */

// these would throw if conversion fails
template<typename T>
T ConfigureReader::Value::get() const {
    static_assert ((std::is_same<T, int>::value) ||
                   (std::is_same<T, long long>::value) ||
                   (std::is_same<T, double>::value)  ||
                   (std::is_same<T, bool>::value)  ||
                   (std::is_same<T, std::string>::value), "unsupported config value type");
};

template<> inline int  ConfigureReader::Value::get<int>() const                { assertValue(); return std::stoi(_value); };
template<> inline long long ConfigureReader::Value::get<long long>() const     { assertValue(); return std::stoll(_value); };
template<> inline double ConfigureReader::Value::get<double>() const           { assertValue(); return std::stod(_value); };
template<> inline bool ConfigureReader::Value::get<bool>() const               { assertValue(); return (_value == "true") || (_value == "1"); };
template<> inline std::string ConfigureReader::Value::get<std::string>() const { assertValue(); return _value; };

template<typename T>
inline std::vector<T> ConfigureReader::Value::getArr() const {
    assertArray();
    std::vector<T> vec;
    for (const auto& v : _array) {
        vec.push_back(v.get<T>());
    }
    return vec;
}

template<typename T>
inline T ConfigureReader::get(const char* key) const {
    // this throws if key doesn't exist
    bool found = false;
    T ret = get(key, &found, T());
    if (!found) {
        throw std::runtime_error(key + std::string(" not found in config ") + m_configFileName);
    }
    return ret;
}

template<typename T>
T ConfigureReader::get(const char* key, bool* found, const T& defaultVal) const {
    // this doesn't throw, but returns found and use default value
    bool fnd;
    if (!found) found = &fnd;

    *found = false;
    try {
        const auto* v = m_value.query(key);
        if (!v) {
            return defaultVal;
        }
        T ret = v->get<T>();
        *found = true;
        return ret;
    } catch (const std::exception& e) {
        *found = false;
        return defaultVal;
    }
}

template<typename T>
std::vector<T> ConfigureReader::getArr(const char* key) const {
    bool found = false;
    auto ret = getArr(key, &found, std::vector<T>());
    if (!found) {
        throw std::runtime_error(key + std::string(" not found in config ") + m_configFileName);
    }
    return ret;
}

template<typename T>
std::vector<T> ConfigureReader::getArr(const char* key, bool* found, const std::vector<T>& defaultVal) const {
    bool fnd;
    if (!found) found = &fnd;

    *found = false;
    try {
        const auto* v = m_value.query(key);
        if (!v) {
            return defaultVal;
        }
        auto ret = v->getArr<T>();
        *found = true;
        return ret;
    } catch (const std::exception& e) {
        *found = false;
        return defaultVal;
    }
}

inline
std::vector<std::string> ConfigureReader::listKeys() const {
    std::vector<std::string> vec;
    for (const auto& kv : m_value._kv) {
        vec.push_back(kv.first);
    }
    return vec;
}

inline
size_t ConfigureReader::arraySize() const {
    return m_value.arraySize();
}

inline
size_t ConfigureReader::Value::arraySize() const {
    return _array.size();
}

inline
void ConfigureReader::Value::assertArray() const {
    if ( (_array.size() == 0) &&
         ((_kv.size() > 0) || (_value.size() > 0))
       ) {
       throw std::runtime_error("Not an array!");
    };
}

inline
void ConfigureReader::Value::assertValue() const {
    if ( (_array.size() > 0) || (_kv.size() > 0) ) {
       throw std::runtime_error("Not a simple value!");
    };
}

inline
void ConfigureReader::Value::clear() {
    _value.clear();
    _array.clear();
    _kv.clear();
}

inline
bool ConfigureReader::Value::isEmpty() const {
    return _kv.size()==0 && _value.size()==0 && _array.size()==0;
}

inline
bool ConfigureReader::isSpace(char c) {
    return (c == ' ') || (c == '\t') || (c == '\n') || (c==NL) ;
}

inline
ConfigureReader::ConfigureReader(const char* configFileName)
: m_configFileName(configFileName?configFileName:"")
{
    if (!configFileName) {
        return;
    }
    std::string response = reset();
    if (response != "") {
        throw std::runtime_error(response);
    }
}

inline
ConfigureReader::ConfigureReader(const ConfigureReader::Value& value)
: m_value(value)
{}

inline
ConfigureReader ConfigureReader::getReader(const std::string& key) const {
    const Value* v = m_value.query(key);
    if (v) {
        ConfigureReader reader(*v);
        reader.m_configFileName = m_configFileName;
        return reader;
    }
    throw std::runtime_error("Failed to query " + key + " from config " + m_configFileName);
}

}

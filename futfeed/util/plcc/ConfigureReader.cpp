#include "ConfigureReader.hpp"
#include <string.h>

namespace utils {

bool ConfigureReader::readFile(const char* file_path, std::string& content) {
    FILE* fp = fopen(file_path, "r");
    if (!fp) {
        fprintf(stderr, "ConfigureReader failed to open %s\n", file_path);
        return false;
    }
    char buf[4096];
    size_t n;
    content.clear();
    while ((n = fread(buf, 1, sizeof(buf), fp)) > 0) {
        content.append(buf, n);
    }
    bool ok = (ferror(fp) == 0);
    fclose(fp);
    content.push_back('\n');
    return ok;
}

bool ConfigureReader::scan(const std::string& raw, std::string& encoded) {
    // 1. remove comments
    // 2. encode the structural charactors
    // 3. remove escape slash, keeping the escaped charactor as is
    //
    // state: 0: normal
    //        1: comments
    //        2: escape
    int state = 0;
    encoded.clear();
    encoded.reserve(raw.size());
    for (size_t i=0; i<raw.size(); ++i) {
        const char ch = raw[i];
        if (ch == '\r') {
            continue;
        }
        if (((int)(unsigned char)ch < 32) && (ch != '\n') && (ch != '\t')) {
            fprintf(stderr, "unrecognized char with ascii code %d\n", (int) ch);
            return false;
        }
        if (state == 1) {
            // comments, remove until a new line
            if (ch == '\n') {
                encoded.push_back(NL);
                state = 0;
            }
            continue;
        }
        if (state == 2) {
            switch (ch) {
            case 'n' : encoded.push_back('\n'); break;
            case ' ' : encoded.push_back(WS); break;
            case '\n':
                fprintf(stderr, "escape at the end of a line\n");
                return false;
            default  : encoded.push_back(ch);
            }
            state = 0;
            continue;
        }
        switch (ch) {
        case '#' : state = 1; break;
        case '\\': state = 2; break;
        case '=' : encoded.push_back(EQ); break;
        case '{' : encoded.push_back(OC); break;
        case '}' : encoded.push_back(CC); break;
        case '[' : encoded.push_back(OB); break;
        case ']' : encoded.push_back(CB); break;
        case ',' : encoded.push_back(CM); break;
        case '\n': encoded.push_back(NL); break;
        default  : encoded.push_back(ch);
        }
    }
    if (state == 2) {
        fprintf(stderr, "escape at the end of config\n");
        return false;
    }
    return true;
}

void ConfigureReader::strip(const char*& ks, const char*& ke) {
    // skip space, tab and newlines, escaped spaces are kept
    while (ks <= ke) {
        if (isSpace(*ks))
            ++ks;
        else
            break;
    }
    while (ks <= ke) {
        if (isSpace(*ke))
            --ke;
        else
            break;
    }
}

const char* ConfigureReader::match(const char* s, const char* e, char match_char) {
    // matches the next 'match_char' with open/close brackets matched in the middle
    // return the position of the matching charactor, or NULL if not found
    const char* p = s;
    while (p <= e) {
        if (*p == match_char) {
            return p;
        };
        if (*p == OC) {
            p = match(p+1, e, CC);
        } else if (*p == OB) {
            p = match(p+1, e, CB);
        } else if ((*p == CB) || (*p == CC)) {
            fprintf(stderr, "Closing (squre/curly) bracket unexpected at %s\n", toConfigString(s, p).c_str());
            return NULL;
        }
        if (!p) {
            return NULL;
        }
        ++p;
    }
    // a ',' for the last array element, or a new line for the last value
    // is allowed to be missing
    if ((match_char == CM) || (match_char == NL)) {
        return e+1;
    }
    return NULL;
}

std::string ConfigureReader::toConfigString(const char* ks, const char* ke) {
    std::string ret;
    for (; ks<=ke; ++ks) {
        char c = *ks;
        switch (c) {
        case WS: c = ' '; break;
        case EQ: c = '='; break;
        case CM: c = ','; break;
        case NL: c = '\n'; break;
        case OC: c = '{'; break;
        case CC: c = '}'; break;
        case OB: c = '['; break;
        case CB: c = ']'; break;
        default: break;
        }
        ret.push_back(c);
    }
    return ret;
}

bool ConfigureReader::parseValue(const char* s, const char* e, ConfigureReader::Value& val) {
    // string between [s, e] already been stripped with white spaces. it represents a simple value or,
    // if *s starts with '{', parse composition in val as _kv
    // if *s starts with '[', recursively parse each value delimitered by ',' into val as _array
    // empty string is not allowed
    val.clear();
    if (s>e) {
        fprintf(stderr, "Got an empty value!\n");
        return false;
    }

    switch (*s) {
    case OC :
    {
        if (*e != CC) {
            fprintf(stderr, "composite value not closed: %s\n", toConfigString(s,e).c_str());
            return false;
        }
        return parseKeyValue(s+1, e-1, val._kv);
    }
    case OB :
    {
        if (*e != CB) {
            fprintf(stderr, "array not closed: %s\n", toConfigString(s,e).c_str());
            return false;
        }
        const char* p = s+1;
        const char* end = e-1;
        const char *ks = p, *ke = end;
        strip(ks, ke);
        if (ks > ke) {
            // empty array
            return true;
        }
        while (true) {
            const char* ce = match(p, end, CM);
            if (!ce) {
                return false;
            }
            ks = p; ke = ce-1;
            strip(ks, ke);
            val._array.emplace_back();
            if (!parseValue(ks, ke, val._array.back())) {
                fprintf(stderr, "failed to parse an array element of %s\n", toConfigString(s,e).c_str());
                return false;
            }
            if (ce > end) {
                break;
            }
            p = ce+1;
        }
        return true;
    }
    default :
    {
        val._value = toConfigString(s, e);
        return true;
    }
    }
}

bool ConfigureReader::parseKeyValue(const char* s, const char* e, ConfigMapType& kv) {
    // iteratively gets key, and value
    while (s <= e) {
        if (isSpace(*s)) {
            ++s;
            continue;
        }
        const char* eq = match(s, e, EQ);
        if (!eq) {
            fprintf(stderr,"failed to find the key from %s\n", toConfigString(s, e).c_str());
            return false;
        }
        const char *ks = s, *ke = eq-1;
        strip(ks, ke);
        if (ks > ke) {
            fprintf(stderr, "empty key is found before %s\n", toConfigString(eq, e).c_str());
            return false;
        }
        for (const char* kp = ks; kp <= ke; ++kp) {
            if (*kp == NL) {
                fprintf(stderr, "ill-formed key %s\n", toConfigString(ks, ke).c_str());
                return false;
            }
        }
        const std::string key = toConfigString(ks, ke);

        const char* vend = match(eq+1, e, NL);
        if (!vend) {
            return false;
        }
        const char *vs = eq+1, *ve = vend-1;
        strip(vs, ve);
        Value v;
        if (!parseValue(vs, ve, v)) {
            fprintf(stderr, "failed to parse value of key %s\n", key.c_str());
            return false;
        }
        kv[key] = v;
        s = vend+1;
    }
    return true;
}

void ConfigureReader::parse(const std::string& raw) {
    std::string cfg;
    if (!scan(raw, cfg)) {
        throw std::runtime_error("Failed to scan config " + m_configFileName);
    }
    m_value.clear();
    if (cfg.size() == 0) {
        return;
    }
    const char* ps = cfg.c_str();
    const char* pe = ps + cfg.size() - 1;
    if (!parseKeyValue(ps, pe, m_value._kv)) {
        throw std::runtime_error("Failed to parse config " + m_configFileName);
    }
}

ConfigureReader ConfigureReader::fromString(const std::string& cfg) {
    ConfigureReader reader;
    reader.parse(cfg);
    return reader;
}

std::string ConfigureReader::reset(const std::string& configFileName) {
    if (configFileName.size() == 0) {
        if (m_configFileName.size() == 0) {
            // an empty config, subsequent get will fail if its an error situation.
            m_value.clear();
            return "";
        };
    } else {
        m_configFileName = configFileName;
    }
    std::string content;
    if (!readFile(m_configFileName.c_str(), content)) {
        return "config file read error: " + m_configFileName;
    }
    try {
        parse(content);
    } catch (const std::exception& e) {
        return std::string("Exception Received: ") + e.what();
    }
    return "";
}

/*
 * Query related functions at ConfigureReader::Value
 */
bool ConfigureReader::Value::getKeyItems(const std::string& key, std::vector<ConfigureReader::Value::KeyItem>& ki) {
    if (key.size()==0) {
        return true;
    }
    switch (key[0]) {
    case '.' :
        return getKeyItems(key.substr(1), ki);
    case '[' :
    {
        // get the index
        const auto cbp = key.find(']');
        if (cbp == std::string::npos) {
            return false;
        }
        int idx;
        try {
            size_t pos;
            const std::string idx_str = key.substr(1, cbp-1);
            idx = std::stoi(idx_str, &pos);
            for (; pos < idx_str.size(); ++pos) {
                if (idx_str[pos] != ' ') {
                    return false;
                }
            }
        } catch (const std::exception& e) {
            return false;
        }
        if (idx < 0) {
            return false;
        }
        ki.emplace_back("", idx);
        return getKeyItems(key.substr(cbp+1), ki);
    }
    default :
    {
        // if . or [ found, get down the tree
        const auto dotp = key.find('.');
        const auto sbp = key.find('[');
        const auto np = (dotp < sbp)? dotp:sbp;
        ki.emplace_back(key.substr(0, np), 0);
        if (np == std::string::npos) {
            return true;
        }
        return getKeyItems(key.substr(np), ki);
    }
    }
}

const ConfigureReader::Value*  ConfigureReader::Value::query(const std::string& key) const {
    std::vector<KeyItem> ki;
    if (!getKeyItems(key, ki)) {
        return NULL;
    }

    const auto* v = this;
    for (const auto& it: ki) {
        const auto& k(it._key);
        const auto& i(it._idx);
        if (k.size()>0) {
            const auto iter = v->_kv.find(k);
            if (iter == v->_kv.end()) {
                return NULL;
            }
            v = &(iter->second);
        } else {
            if (i >=(int) v->_array.size()) {
                return NULL;
            }
            v = &(v->_array[i]);
        }
    }
    return v;
}

}

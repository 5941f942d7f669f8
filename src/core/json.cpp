#include <agentmem/core/json.hpp>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace agentmem {

namespace {
const int MAX_DEPTH = 256;

std::string parse_error(const std::string& what, size_t pos) {
    return "JSON parse error: " + what + " at position " + std::to_string(pos);
}
} // namespace

// Type checks
Json::Type Json::type() const { return type_; }
bool Json::is_null() const { return type_ == NUL; }
bool Json::is_bool() const { return type_ == BOOL; }
bool Json::is_number() const { return type_ == NUMBER; }
bool Json::is_string() const { return type_ == STRING; }
bool Json::is_array() const { return type_ == ARRAY; }
bool Json::is_object() const { return type_ == OBJECT; }

// Value accessors
bool Json::as_bool(bool def) const { 
    return type_ == BOOL ? bool_ : def; 
}

double Json::as_number(double def) const { 
    return type_ == NUMBER ? number_ : def; 
}

int64_t Json::as_int(int64_t def) const { 
    return type_ == NUMBER ? static_cast<int64_t>(std::llround(number_)) : def; 
}

std::string Json::as_string(const std::string& def) const { 
    return type_ == STRING ? string_ : def; 
}

const std::vector<Json>& Json::as_array() const {
    static const std::vector<Json> empty;
    return type_ == ARRAY ? array_ : empty;
}

const std::map<std::string, Json>& Json::as_object() const {
    static const std::map<std::string, Json> empty;
    return type_ == OBJECT ? object_ : empty;
}

// Object access
const Json& Json::operator[](const std::string& key) const {
    static const Json null_json;
    if (type_ != OBJECT) return null_json;
    std::map<std::string, Json>::const_iterator it = object_.find(key);
    return it != object_.end() ? it->second : null_json;
}

const Json& Json::operator[](size_t idx) const {
    static const Json null_json;
    if (type_ != ARRAY || idx >= array_.size()) return null_json;
    return array_[idx];
}

bool Json::has(const std::string& key) const {
    return type_ == OBJECT && object_.find(key) != object_.end();
}

size_t Json::size() const {
    if (type_ == ARRAY) return array_.size();
    if (type_ == OBJECT) return object_.size();
    return 0;
}

// Modifiers
void Json::set(const std::string& key, const Json& value) {
    if (type_ != OBJECT) {
        type_ = OBJECT;
        object_.clear();
    }
    object_[key] = value;
}

void Json::push(const Json& value) {
    if (type_ != ARRAY) {
        type_ = ARRAY;
        array_.clear();
    }
    array_.push_back(value);
}

bool Json::erase(const std::string& key) {
    if (type_ != OBJECT) return false;
    return object_.erase(key) > 0;
}

// Helper getters with defaults
std::string Json::get_string(const std::string& key, const std::string& def) const {
    const Json& v = (*this)[key];
    return v.is_string() ? v.string_ : def;
}

int Json::get_int(const std::string& key, int def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? static_cast<int>(v.as_int()) : def;
}

int64_t Json::get_int64(const std::string& key, int64_t def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? v.as_int() : def;
}

double Json::get_double(const std::string& key, double def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? v.number_ : def;
}

bool Json::get_bool(const std::string& key, bool def) const {
    const Json& v = (*this)[key];
    return v.is_bool() ? v.bool_ : def;
}

std::vector<std::string> Json::as_string_list() const {
    std::vector<std::string> out;
    if (type_ != ARRAY) return out;
    for (size_t i = 0; i < array_.size(); ++i) {
        if (array_[i].is_string()) out.push_back(array_[i].string_);
    }
    return out;
}

std::vector<float> Json::as_float_list() const {
    std::vector<float> out;
    if (type_ != ARRAY) return out;
    out.reserve(array_.size());
    for (size_t i = 0; i < array_.size(); ++i) {
        if (array_[i].is_number()) out.push_back(static_cast<float>(array_[i].number_));
    }
    return out;
}

Json Json::from_strings(const std::vector<std::string>& values) {
    Json j = array();
    for (size_t i = 0; i < values.size(); ++i) j.push(Json(values[i]));
    return j;
}

// Static constructors
Json Json::object() {
    Json j;
    j.type_ = OBJECT;
    return j;
}

Json Json::array() {
    Json j;
    j.type_ = ARRAY;
    return j;
}

bool Json::operator==(const Json& other) const {
    if (type_ != other.type_) return false;
    switch (type_) {
        case NUL: return true;
        case BOOL: return bool_ == other.bool_;
        case NUMBER: return number_ == other.number_;
        case STRING: return string_ == other.string_;
        case ARRAY: return array_ == other.array_;
        case OBJECT: return object_ == other.object_;
    }
    return false;
}

// Serialization
std::string Json::dump(int indent) const {
    std::ostringstream ss;
    dump_impl(ss, indent, 0);
    return ss.str();
}

void Json::dump_impl(std::ostringstream& ss, int indent, int depth) const {
    std::string pad_inner = indent > 0 ? std::string(static_cast<size_t>(indent * (depth + 1)), ' ') : "";
    std::string pad_outer = indent > 0 ? std::string(static_cast<size_t>(indent * depth), ' ') : "";
    const char* nl = indent > 0 ? "\n" : "";
    
    switch (type_) {
        case NUL:
            ss << "null";
            break;
        case BOOL:
            ss << (bool_ ? "true" : "false");
            break;
        case NUMBER: {
            if (!std::isfinite(number_)) {
                ss << "null";
                break;
            }
            double integral = 0;
            if (std::modf(number_, &integral) == 0.0 && std::fabs(number_) < 9.0e15) {
                ss << static_cast<int64_t>(number_);
            } else {
                char buf[32];
                snprintf(buf, sizeof(buf), "%.17g", number_);
                ss << buf;
            }
            break;
        }
        case STRING:
            ss << '"';
            escape_string(ss, string_);
            ss << '"';
            break;
        case ARRAY:
            if (array_.empty()) {
                ss << "[]";
                break;
            }
            ss << '[' << nl;
            for (size_t i = 0; i < array_.size(); ++i) {
                if (i > 0) ss << ',' << nl;
                ss << pad_inner;
                array_[i].dump_impl(ss, indent, depth + 1);
            }
            ss << nl << pad_outer << ']';
            break;
        case OBJECT: {
            if (object_.empty()) {
                ss << "{}";
                break;
            }
            ss << '{' << nl;
            bool first = true;
            for (std::map<std::string, Json>::const_iterator it = object_.begin();
                 it != object_.end(); ++it) {
                if (!first) ss << ',' << nl;
                first = false;
                ss << pad_inner << '"';
                escape_string(ss, it->first);
                ss << (indent > 0 ? "\": " : "\":");
                it->second.dump_impl(ss, indent, depth + 1);
            }
            ss << nl << pad_outer << '}';
            break;
        }
    }
}

void Json::escape_string(std::ostringstream& ss, const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    ss << buf;
                } else {
                    ss << c;
                }
        }
    }
}

void Json::append_utf8(std::string& out, uint32_t code) {
    if (code < 0x80) {
        out += static_cast<char>(code);
    } else if (code < 0x800) {
        out += static_cast<char>(0xC0 | (code >> 6));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else if (code < 0x10000) {
        out += static_cast<char>(0xE0 | (code >> 12));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code >> 18));
        out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    }
}

// Parsing
Json Json::parse(const std::string& str) {
    size_t pos = 0;
    Json result = parse_value(str, pos, 0);
    skip_ws(str, pos);
    if (pos != str.size()) {
        throw std::runtime_error(parse_error("trailing characters", pos));
    }
    return result;
}

void Json::skip_ws(const std::string& s, size_t& pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) pos++;
}

Json Json::parse_value(const std::string& s, size_t& pos, int depth) {
    if (depth > MAX_DEPTH) {
        throw std::runtime_error(parse_error("nesting too deep", pos));
    }
    skip_ws(s, pos);
    if (pos >= s.size()) {
        throw std::runtime_error(parse_error("unexpected end of input", pos));
    }
    
    char c = s[pos];
    if (c == 'n' || c == 't' || c == 'f') return parse_literal(s, pos);
    if (c == '"') return parse_string(s, pos);
    if (c == '[') return parse_array(s, pos, depth);
    if (c == '{') return parse_object(s, pos, depth);
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number(s, pos);
    
    throw std::runtime_error(parse_error(std::string("unexpected '") + c + "'", pos));
}

Json Json::parse_literal(const std::string& s, size_t& pos) {
    if (s.compare(pos, 4, "null") == 0) {
        pos += 4;
        return Json();
    }
    if (s.compare(pos, 4, "true") == 0) {
        pos += 4;
        return Json(true);
    }
    if (s.compare(pos, 5, "false") == 0) {
        pos += 5;
        return Json(false);
    }
    throw std::runtime_error(parse_error("invalid literal", pos));
}

Json Json::parse_number(const std::string& s, size_t& pos) {
    size_t start = pos;
    if (s[pos] == '-') pos++;
    size_t digits = pos;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    if (pos == digits) {
        throw std::runtime_error(parse_error("expected digit", pos));
    }
    if (pos < s.size() && s[pos] == '.') {
        pos++;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    }
    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
        pos++;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) pos++;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    }
    return Json(std::strtod(s.substr(start, pos - start).c_str(), NULL));
}

Json Json::parse_string(const std::string& s, size_t& pos) {
    size_t start = pos;
    pos++; // skip opening quote
    std::string result;
    while (pos < s.size() && s[pos] != '"') {
        if (s[pos] == '\\') {
            pos++;
            if (pos >= s.size()) break;
            switch (s[pos]) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    if (pos + 4 >= s.size()) {
                        throw std::runtime_error(parse_error("truncated \\u escape", pos));
                    }
                    uint32_t code = static_cast<uint32_t>(std::strtoul(s.substr(pos + 1, 4).c_str(), NULL, 16));
                    pos += 4;
                    // Surrogate pair
                    if (code >= 0xD800 && code <= 0xDBFF && pos + 6 < s.size() &&
                        s[pos + 1] == '\\' && s[pos + 2] == 'u') {
                        uint32_t low = static_cast<uint32_t>(std::strtoul(s.substr(pos + 3, 4).c_str(), NULL, 16));
                        if (low >= 0xDC00 && low <= 0xDFFF) {
                            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                            pos += 6;
                        }
                    }
                    append_utf8(result, code);
                    break;
                }
                default: result += s[pos];
            }
        } else {
            result += s[pos];
        }
        pos++;
    }
    if (pos >= s.size()) {
        throw std::runtime_error(parse_error("unterminated string", start));
    }
    pos++; // skip closing quote
    return Json(result);
}

Json Json::parse_array(const std::string& s, size_t& pos, int depth) {
    pos++; // skip [
    Json arr = array();
    skip_ws(s, pos);
    if (pos < s.size() && s[pos] == ']') {
        pos++;
        return arr;
    }
    while (true) {
        arr.array_.push_back(parse_value(s, pos, depth + 1));
        skip_ws(s, pos);
        if (pos >= s.size()) {
            throw std::runtime_error(parse_error("unterminated array", pos));
        }
        if (s[pos] == ']') {
            pos++;
            return arr;
        }
        if (s[pos] != ',') {
            throw std::runtime_error(parse_error("expected ',' or ']'", pos));
        }
        pos++;
    }
}

Json Json::parse_object(const std::string& s, size_t& pos, int depth) {
    pos++; // skip {
    Json obj = object();
    skip_ws(s, pos);
    if (pos < s.size() && s[pos] == '}') {
        pos++;
        return obj;
    }
    while (true) {
        skip_ws(s, pos);
        if (pos >= s.size() || s[pos] != '"') {
            throw std::runtime_error(parse_error("expected object key", pos));
        }
        Json key = parse_string(s, pos);
        skip_ws(s, pos);
        if (pos >= s.size() || s[pos] != ':') {
            throw std::runtime_error(parse_error("expected ':'", pos));
        }
        pos++; // skip :
        obj.object_[key.string_] = parse_value(s, pos, depth + 1);
        skip_ws(s, pos);
        if (pos >= s.size()) {
            throw std::runtime_error(parse_error("unterminated object", pos));
        }
        if (s[pos] == '}') {
            pos++;
            return obj;
        }
        if (s[pos] != ',') {
            throw std::runtime_error(parse_error("expected ',' or '}'", pos));
        }
        pos++;
    }
}

} // namespace agentmem

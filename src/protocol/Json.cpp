#include "wormhole/protocol/Json.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>
#include <utility>

namespace wormhole::protocol::json {

namespace {

constexpr std::size_t kMaxDepth = 64;

void append_utf8(std::string& out, std::uint32_t code_point) {
    if (code_point <= 0x7F) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code_point >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code_point >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code_point >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

class Parser {
public:
    explicit Parser(std::string_view text) : text_(text) {}

    Value parse_document() {
        skip_whitespace();
        Value value = parse_value(0);
        skip_whitespace();
        if (!at_end()) {
            throw JsonError("Unexpected trailing content after JSON document");
        }
        return value;
    }

private:
    std::string_view text_;
    std::size_t position_{0};

    bool at_end() const { return position_ >= text_.size(); }

    char peek() const { return at_end() ? '\0' : text_[position_]; }

    char get() { return at_end() ? '\0' : text_[position_++]; }

    void skip_whitespace() {
        while (!at_end()) {
            const char ch = peek();
            if (ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t') {
                ++position_;
            } else {
                break;
            }
        }
    }

    Value parse_value(std::size_t depth) {
        if (depth > kMaxDepth) {
            throw JsonError("JSON document nested too deeply");
        }
        skip_whitespace();
        if (at_end()) {
            throw JsonError("Unexpected end of JSON while parsing value");
        }

        const char ch = peek();
        if (ch == '{') {
            return parse_object(depth);
        }
        if (ch == '[') {
            return parse_array(depth);
        }
        if (ch == '"') {
            return Value(parse_string());
        }
        if (ch == 't' || ch == 'f') {
            return Value(parse_boolean());
        }
        if (ch == 'n') {
            parse_null();
            return Value();
        }
        if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch))) {
            return parse_number();
        }
        throw JsonError("Unexpected token in JSON value");
    }

    Value parse_object(std::size_t depth) {
        Value object = Value::make_object();
        get();  // consume '{'
        skip_whitespace();
        if (peek() == '}') {
            get();
            return object;
        }

        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                throw JsonError("Expected string key in JSON object");
            }

            std::string key = parse_string();
            skip_whitespace();
            if (get() != ':') {
                throw JsonError("Expected ':' after key in JSON object");
            }

            Value value = parse_value(depth + 1);
            object.object_value.insert_or_assign(std::move(key), std::move(value));

            skip_whitespace();
            if (at_end()) {
                throw JsonError("Unexpected end of JSON while parsing object");
            }
            const char ch = get();
            if (ch == '}') {
                break;
            }
            if (ch != ',') {
                throw JsonError("Expected ',' or '}' in JSON object");
            }
        }
        return object;
    }

    Value parse_array(std::size_t depth) {
        Value array = Value::make_array();
        get();  // consume '['
        skip_whitespace();
        if (peek() == ']') {
            get();
            return array;
        }

        while (true) {
            array.array_value.push_back(parse_value(depth + 1));
            skip_whitespace();
            if (at_end()) {
                throw JsonError("Unexpected end of JSON while parsing array");
            }
            const char ch = get();
            if (ch == ']') {
                break;
            }
            if (ch != ',') {
                throw JsonError("Expected ',' or ']' in JSON array");
            }
        }
        return array;
    }

    std::string parse_string() {
        if (get() != '"') {
            throw JsonError("Expected opening quote for JSON string");
        }

        std::string result;
        while (!at_end()) {
            const char ch = get();
            if (ch == '"') {
                return result;
            }

            if (ch == '\\') {
                if (at_end()) {
                    throw JsonError("Incomplete escape sequence in JSON string");
                }

                const char esc = get();
                switch (esc) {
                case '"':
                case '\\':
                case '/':
                    result.push_back(esc);
                    break;
                case 'b':
                    result.push_back('\b');
                    break;
                case 'f':
                    result.push_back('\f');
                    break;
                case 'n':
                    result.push_back('\n');
                    break;
                case 'r':
                    result.push_back('\r');
                    break;
                case 't':
                    result.push_back('\t');
                    break;
                case 'u':
                    parse_unicode_escape(result);
                    break;
                default:
                    throw JsonError("Unsupported escape sequence in JSON string");
                }
            } else {
                if (static_cast<unsigned char>(ch) < 0x20) {
                    throw JsonError("Control characters must be escaped in JSON strings");
                }
                result.push_back(ch);
            }
        }

        throw JsonError("Unterminated JSON string literal");
    }

    std::uint32_t read_hex4() {
        if (position_ + 4 > text_.size()) {
            throw JsonError("Incomplete unicode escape in JSON string");
        }
        std::uint32_t code_unit = 0;
        for (int i = 0; i < 4; ++i) {
            const char ch = text_[position_++];
            code_unit <<= 4;
            if (ch >= '0' && ch <= '9') {
                code_unit += static_cast<std::uint32_t>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                code_unit += 10u + static_cast<std::uint32_t>(ch - 'a');
            } else if (ch >= 'A' && ch <= 'F') {
                code_unit += 10u + static_cast<std::uint32_t>(ch - 'A');
            } else {
                throw JsonError("Invalid hex digit in unicode escape");
            }
        }
        return code_unit;
    }

    void parse_unicode_escape(std::string& out) {
        std::uint32_t code_point = read_hex4();
        if (code_point >= 0xD800 && code_point <= 0xDBFF) {
            if (position_ + 2 > text_.size() || text_[position_] != '\\' || text_[position_ + 1] != 'u') {
                throw JsonError("Unpaired surrogate in unicode escape");
            }
            position_ += 2;
            const auto low = read_hex4();
            if (low < 0xDC00 || low > 0xDFFF) {
                throw JsonError("Invalid low surrogate in unicode escape");
            }
            code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
        } else if (code_point >= 0xDC00 && code_point <= 0xDFFF) {
            throw JsonError("Unpaired surrogate in unicode escape");
        }
        append_utf8(out, code_point);
    }

    Value parse_number() {
        const std::size_t start = position_;
        if (peek() == '-') {
            ++position_;
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            ++position_;
        }
        bool is_fractional = false;
        if (peek() == '.') {
            is_fractional = true;
            ++position_;
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                ++position_;
            }
        }
        if (peek() == 'e' || peek() == 'E') {
            is_fractional = true;
            ++position_;
            if (peek() == '+' || peek() == '-') {
                ++position_;
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                ++position_;
            }
        }
        const std::string token(text_.substr(start, position_ - start));
        if (is_fractional) {
            std::istringstream iss(token);
            iss.imbue(std::locale::classic());
            double value{};
            iss >> value;
            if (iss.fail() || !iss.eof()) {
                throw JsonError("Invalid floating point number in JSON");
            }
            return Value(value);
        }
        std::int64_t int_value{};
        const auto result = std::from_chars(token.data(), token.data() + token.size(), int_value);
        if (result.ec != std::errc{} || result.ptr != token.data() + token.size()) {
            throw JsonError("Invalid integer number in JSON");
        }
        return Value(int_value);
    }

    bool parse_boolean() {
        if (text_.substr(position_, 4) == "true") {
            position_ += 4;
            return true;
        }
        if (text_.substr(position_, 5) == "false") {
            position_ += 5;
            return false;
        }
        throw JsonError("Invalid boolean literal in JSON");
    }

    void parse_null() {
        if (text_.substr(position_, 4) != "null") {
            throw JsonError("Invalid null literal in JSON");
        }
        position_ += 4;
    }
};

void write_value(std::ostringstream& oss, const Value& value) {
    switch (value.type) {
        case ValueType::Null:
            oss << "null";
            break;
        case ValueType::Boolean:
            oss << (value.boolean_value ? "true" : "false");
            break;
        case ValueType::Integer:
            oss << value.integer_value;
            break;
        case ValueType::Double:
            if (std::isfinite(value.double_value)) {
                oss << std::setprecision(17) << value.double_value;
            } else {
                oss << "null";
            }
            break;
        case ValueType::String:
            oss << '"' << escape(value.string_value) << '"';
            break;
        case ValueType::Object: {
            oss << '{';
            bool first = true;
            for (const auto& [key, child] : value.object_value) {
                if (!first) {
                    oss << ',';
                }
                first = false;
                oss << '"' << escape(key) << "\":";
                write_value(oss, child);
            }
            oss << '}';
            break;
        }
        case ValueType::Array: {
            oss << '[';
            for (std::size_t i = 0; i < value.array_value.size(); ++i) {
                if (i > 0) {
                    oss << ',';
                }
                write_value(oss, value.array_value[i]);
            }
            oss << ']';
            break;
        }
    }
}

}  // namespace

const Value* Value::find(std::string_view key) const {
    if (!is_object()) {
        return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    if (it == object_value.end()) {
        return nullptr;
    }
    return &it->second;
}

Value& Value::set(std::string key, Value value) {
    if (type != ValueType::Object) {
        *this = make_object();
    }
    object_value.insert_or_assign(std::move(key), std::move(value));
    return *this;
}

Value& Value::push(Value value) {
    if (type != ValueType::Array) {
        *this = make_array();
    }
    array_value.push_back(std::move(value));
    return *this;
}

const std::map<std::string, Value>& Value::as_object() const {
    static const std::map<std::string, Value> empty{};
    return type == ValueType::Object ? object_value : empty;
}

const std::vector<Value>& Value::as_array() const {
    static const std::vector<Value> empty{};
    return type == ValueType::Array ? array_value : empty;
}

Value parse(std::string_view text) {
    Parser parser(text);
    return parser.parse_document();
}

std::string serialize(const Value& value) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    write_value(oss, value);
    return oss.str();
}

std::string escape(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (const unsigned char ch : text) {
        switch (ch) {
            case '"':
                escaped.append("\\\"");
                break;
            case '\\':
                escaped.append("\\\\");
                break;
            case '\b':
                escaped.append("\\b");
                break;
            case '\f':
                escaped.append("\\f");
                break;
            case '\n':
                escaped.append("\\n");
                break;
            case '\r':
                escaped.append("\\r");
                break;
            case '\t':
                escaped.append("\\t");
                break;
            default:
                if (ch < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::nouppercase << std::setw(4) << std::setfill('0')
                        << static_cast<int>(ch);
                    escaped.append(oss.str());
                } else {
                    escaped.push_back(static_cast<char>(ch));
                }
                break;
        }
    }
    return escaped;
}

}  // namespace wormhole::protocol::json

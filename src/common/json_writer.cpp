// ---------------------------------------------------------------------------
// json_writer.cpp
// ---------------------------------------------------------------------------

#include "common/json_writer.hpp"

#include <cstdio>
#include <string>
#include <string_view>

std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (unsigned char ch : str) {
        switch (ch) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}

// ---------------------------------------------------------------------------
// 컨테이너
// ---------------------------------------------------------------------------
JsonWriter& JsonWriter::begin_object() { return open('{', '}'); }
JsonWriter& JsonWriter::end_object()   { return close(); }
JsonWriter& JsonWriter::begin_array()  { return open('[', ']'); }
JsonWriter& JsonWriter::end_array()    { return close(); }

JsonWriter& JsonWriter::open(char open_ch, char close_ch) {
    before_value();
    out_.push_back(open_ch);
    stack_.push_back(Frame{close_ch, false});
    return *this;
}

JsonWriter& JsonWriter::close() {
    if (stack_.empty()) {
        return *this;
    }
    const Frame frame = stack_.back();
    stack_.pop_back();
    // 빈 컨테이너는 "{}" / "[]" 로 붙여 쓴다.
    if (frame.has_items) {
        newline();
    }
    out_.push_back(frame.close);
    return *this;
}

// ---------------------------------------------------------------------------
// 키/값
// ---------------------------------------------------------------------------
JsonWriter& JsonWriter::key(std::string_view name) {
    before_value();
    out_.push_back('"');
    out_ += escape_json_string(name);
    out_ += indent_ > 0 ? "\": " : "\":";
    after_key_ = true;
    return *this;
}

JsonWriter& JsonWriter::value(std::string_view str) {
    before_value();
    out_.push_back('"');
    out_ += escape_json_string(str);
    out_.push_back('"');
    return *this;
}

JsonWriter& JsonWriter::value(std::int64_t number) {
    before_value();
    out_ += std::to_string(number);
    return *this;
}

JsonWriter& JsonWriter::null_value() {
    before_value();
    out_ += "null";
    return *this;
}

JsonWriter& JsonWriter::bool_value(bool flag) {
    before_value();
    out_ += flag ? "true" : "false";
    return *this;
}

JsonWriter& JsonWriter::value_or_null(const std::optional<std::int64_t>& number) {
    return number ? value(*number) : null_value();
}

// 값 앞의 구분자(',')와 들여쓰기를 처리한다. key() 직후의 값은 같은 줄에 쓴다.
void JsonWriter::before_value() {
    if (after_key_) {
        after_key_ = false;
        return;
    }
    if (stack_.empty()) {
        return;
    }
    if (stack_.back().has_items) {
        out_.push_back(',');
    }
    stack_.back().has_items = true;
    newline();
}

void JsonWriter::newline() {
    if (indent_ <= 0) {
        return;
    }
    out_.push_back('\n');
    out_.append(static_cast<std::size_t>(indent_) * stack_.size(), ' ');
}

#pragma once

// ---------------------------------------------------------------------------
// json_writer.hpp
//
// 의존성 없는 최소 JSON 직렬화기.
// 리포트(JSON/SARIF)와 구조화 이벤트 로그가 같은 이스케이프 규칙을 쓰도록
// 한 곳에 둔다.
//
// [사용 예]
//   JsonWriter w(2);
//   w.begin_object().key("version").value("2.1.0").end_object();
//   std::string out = w.str();
//
// [제약]
// - 호출 순서(key → value, begin/end 짝)는 호출자가 지킨다. 잘못된 순서를
//   검증하지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// escape_json_string
//   JSON 문자열 값으로 쓸 수 있게 이스케이프한다 (따옴표는 붙이지 않는다).
[[nodiscard]] std::string escape_json_string(std::string_view str);

class JsonWriter {
public:
    // indent: 0 이면 한 줄(compact), 양수면 해당 칸 수로 들여쓰기
    explicit JsonWriter(int indent = 0)
        : indent_(indent) {}

    JsonWriter& begin_object();
    JsonWriter& end_object();
    JsonWriter& begin_array();
    JsonWriter& end_array();

    JsonWriter& key(std::string_view name);

    JsonWriter& value(std::string_view str);
    JsonWriter& value(std::int64_t number);
    JsonWriter& null_value();
    JsonWriter& bool_value(bool flag);

    // nullopt 이면 null, 아니면 숫자
    JsonWriter& value_or_null(const std::optional<std::int64_t>& number);

    [[nodiscard]] const std::string& str() const noexcept { return out_; }

private:
    struct Frame {
        char close{'}'};
        bool has_items{false};
    };

    JsonWriter& open(char open_ch, char close_ch);
    JsonWriter& close();
    void before_value();
    void newline();

    std::string        out_{};
    std::vector<Frame> stack_{};
    int                indent_{0};
    bool               after_key_{false};
};

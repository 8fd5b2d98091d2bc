#pragma once

// ---------------------------------------------------------------------------
// statement_splitter.hpp
//
// 마이그레이션 스크립트를 ';' 기준으로 잘라 (정규화된 구문, 시작 줄 번호)
// 쌍의 시퀀스로 만든다. 규칙 매칭은 한 번에 한 구문 단위로 수행된다.
//
// [분할 규칙]
// - ';' 에서 자른다. 마지막 ';' 뒤에 남은 텍스트도 하나의 구문으로 본다.
// - 앞뒤 공백 제거 후 비어 있거나 "--" 로 시작하는 조각은 버린다.
// - 구문 내부 공백 덩어리(개행 포함)는 공백 한 칸으로 접는다.
//   규칙 패턴은 이 정규화된 한 줄 문자열에 대해 매칭된다.
// - 줄 번호는 원문(정규화/trim 이전)에서 조각이 시작하는 offset 앞의
//   '\n' 개수 + 1 이다. 조각은 직전 ';' 바로 다음에서 시작하므로
//   "a;\nb;" 의 b 는 1번 줄로 보고된다.
//
// [설계 한계 / 알려진 오분할]
// 1. 문자열 리터럴 내부 ';' ('a;b'), 인용 식별자, $$ 함수 본문 내부의
//    ';' 도 구분자로 취급한다. SQL 토크나이저가 아니다.
// 2. 구문 앞에 "--" 주석 줄이 붙어 있으면 해당 조각 전체가 버려진다.
//    (주석과 구문 사이에 ';' 가 없는 경우)
// 3. 블록 주석 /* */ 은 제거하지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// Statement
//   분할 결과 하나. text 는 공백이 정규화된 한 줄 문자열.
// ---------------------------------------------------------------------------
struct Statement {
    std::string text{};   // 정규화된 구문 (';' 미포함)
    std::size_t line{1};  // 원문 기준 1-based 조각 시작 줄

    bool operator==(const Statement&) const = default;
};

// ---------------------------------------------------------------------------
// StatementSplitter
//   지연(lazy) 평가 range. begin() 을 다시 호출하면 처음부터 다시 순회한다.
//
//   [수명 주의]
//   입력을 std::string_view 로 보관하므로 원본 문자열이 splitter 와
//   모든 iterator 보다 오래 살아 있어야 한다.
// ---------------------------------------------------------------------------
class StatementSplitter {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = Statement;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const Statement*;
        using reference         = const Statement&;

        Iterator() = default;

        reference operator*() const noexcept { return current_; }
        pointer operator->() const noexcept { return &current_; }

        Iterator& operator++();
        Iterator operator++(int);

        bool operator==(const Iterator& other) const noexcept;

    private:
        friend class StatementSplitter;

        explicit Iterator(std::string_view sql);

        // 다음으로 유지되는 조각까지 전진한다. 없으면 end 상태가 된다.
        void advance();

        std::string_view sql_{};
        std::size_t      next_segment_{0};  // 아직 읽지 않은 조각의 시작 offset
        std::size_t      counted_until_{0}; // 줄 번호 계산이 끝난 offset
        std::size_t      line_{1};          // counted_until_ 위치의 줄 번호
        Statement        current_{};
        bool             at_end_{true};
    };

    explicit StatementSplitter(std::string_view sql) noexcept
        : sql_(sql) {}

    [[nodiscard]] Iterator begin() const;
    [[nodiscard]] Iterator end() const noexcept { return Iterator{}; }

private:
    std::string_view sql_;
};

// split_statements
//   StatementSplitter 를 끝까지 순회하여 벡터로 반환한다.
[[nodiscard]] std::vector<Statement> split_statements(std::string_view sql);

// normalize_whitespace
//   앞뒤 공백을 제거하고 내부 공백 덩어리를 ' ' 하나로 접는다.
[[nodiscard]] std::string normalize_whitespace(std::string_view text);

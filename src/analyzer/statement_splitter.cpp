// ---------------------------------------------------------------------------
// statement_splitter.cpp
//
// ';' 기반 구문 분할 구현.
//
// [줄 번호 계산]
// 조각마다 원문 앞부분을 다시 세지 않고, 직전 조각 시작 위치부터
// 현재 조각 시작 위치까지의 '\n' 만 누적해서 센다 (전체 O(N)).
// ---------------------------------------------------------------------------

#include "analyzer/statement_splitter.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace {

bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

// ---------------------------------------------------------------------------
// normalize_whitespace
// ---------------------------------------------------------------------------
std::string normalize_whitespace(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    bool pending_space = false;
    for (const char c : text) {
        if (is_space(c)) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(c);
    }
    return result;
}

// ---------------------------------------------------------------------------
// Iterator
// ---------------------------------------------------------------------------
StatementSplitter::Iterator::Iterator(std::string_view sql)
    : sql_(sql)
    , at_end_(false)
{
    advance();
}

StatementSplitter::Iterator& StatementSplitter::Iterator::operator++() {
    advance();
    return *this;
}

StatementSplitter::Iterator StatementSplitter::Iterator::operator++(int) {
    Iterator prev = *this;
    advance();
    return prev;
}

bool StatementSplitter::Iterator::operator==(const Iterator& other) const noexcept {
    if (at_end_ || other.at_end_) {
        return at_end_ == other.at_end_;
    }
    return sql_.data() == other.sql_.data()
        && sql_.size() == other.sql_.size()
        && next_segment_ == other.next_segment_;
}

void StatementSplitter::Iterator::advance() {
    // next_segment_ == size() 인 경우도 "마지막 ';' 뒤의 빈 조각" 으로 한 번 본다.
    while (next_segment_ <= sql_.size()) {
        const std::size_t seg_begin = next_segment_;
        std::size_t       seg_end   = sql_.find(';', seg_begin);
        if (seg_end == std::string_view::npos) {
            seg_end = sql_.size();
        }
        next_segment_ = seg_end + 1;

        const std::string_view segment = sql_.substr(seg_begin, seg_end - seg_begin);

        const auto first = std::find_if_not(segment.begin(), segment.end(), is_space);
        if (first == segment.end()) {
            continue;  // 공백뿐
        }

        const auto offset_in_segment = static_cast<std::size_t>(first - segment.begin());
        const std::string_view body  = segment.substr(offset_in_segment);
        if (body.starts_with("--")) {
            continue;  // 주석으로 시작하는 조각
        }

        // 줄 번호: 원문에서 조각 시작 offset(trim 이전) 앞의 개행 수 + 1
        line_ += static_cast<std::size_t>(std::count(
            sql_.begin() + static_cast<std::ptrdiff_t>(counted_until_),
            sql_.begin() + static_cast<std::ptrdiff_t>(seg_begin),
            '\n'));
        counted_until_ = seg_begin;

        current_.text = normalize_whitespace(body);
        current_.line = line_;
        return;
    }

    at_end_  = true;
    current_ = Statement{};
}

// ---------------------------------------------------------------------------
// StatementSplitter
// ---------------------------------------------------------------------------
StatementSplitter::Iterator StatementSplitter::begin() const {
    return Iterator{sql_};
}

std::vector<Statement> split_statements(std::string_view sql) {
    const StatementSplitter splitter{sql};
    return std::vector<Statement>(splitter.begin(), splitter.end());
}

// Redis 风格的 glob 匹配，用于进程内代理的模式订阅
//   *      任意长度字符
//   ?      单个字符
//   [abc]  集合，[a-z] 区间，[^...] / [!...] 取反
//   \x     转义

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace broker {

class GlobPattern {
public:
    // 模式非法（比如 [ 未闭合）抛出 std::invalid_argument
    explicit GlobPattern(std::string pattern);

    bool match(std::string_view text) const;

    const std::string& pattern() const { return pattern_; }

private:
    enum class SegmentType { Literal, Star, Question, CharClass };

    struct Segment {
        SegmentType type{SegmentType::Literal};
        char literal{0};
        std::string chars;
        std::vector<std::pair<char, char>> ranges;
        bool negate{false};
    };

    void compile();
    std::size_t parseCharClass(std::size_t i, Segment& seg) const;
    bool classMatches(const Segment& seg, char c) const;

    std::string pattern_;
    std::vector<Segment> segments_;
};

} // namespace broker

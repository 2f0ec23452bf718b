#include "broker/glob_pattern.hpp"

#include <stdexcept>

namespace broker {

GlobPattern::GlobPattern(std::string pattern)
    : pattern_(std::move(pattern)) {
    compile();
}

void GlobPattern::compile()
{
    segments_.clear();
    for (std::size_t i = 0; i < pattern_.size(); ++i)
    {
        char c = pattern_[i];
        Segment seg;
        if (c == '*') {
            // 连续的 * 等价于一个
            if (!segments_.empty() && segments_.back().type == SegmentType::Star) {
                continue;
            }
            seg.type = SegmentType::Star;
        } else if (c == '?') {
            seg.type = SegmentType::Question;
        } else if (c == '[') {
            i = parseCharClass(i, seg);
        } else if (c == '\\' && i + 1 < pattern_.size()) {
            seg.literal = pattern_[++i];
        } else {
            seg.literal = c;
        }
        segments_.push_back(std::move(seg));
    }
}

// 返回 ']' 的位置
std::size_t GlobPattern::parseCharClass(std::size_t i, Segment& seg) const
{
    seg.type = SegmentType::CharClass;
    ++i;
    if (i < pattern_.size() && (pattern_[i] == '^' || pattern_[i] == '!')) {
        seg.negate = true;
        ++i;
    }

    while (i < pattern_.size() && pattern_[i] != ']')
    {
        char c = pattern_[i];
        if (c == '\\' && i + 1 < pattern_.size()) {
            seg.chars.push_back(pattern_[i + 1]);
            i += 2;
        } else if (i + 2 < pattern_.size() && pattern_[i + 1] == '-' && pattern_[i + 2] != ']') {
            char lo = c;
            char hi = pattern_[i + 2];
            if (lo > hi) {
                throw std::invalid_argument("invalid character range in pattern: " + pattern_);
            }
            seg.ranges.emplace_back(lo, hi);
            i += 3;
        } else {
            seg.chars.push_back(c);
            ++i;
        }
    }

    if (i >= pattern_.size()) {
        throw std::invalid_argument("unterminated character class in pattern: " + pattern_);
    }
    return i;
}

bool GlobPattern::classMatches(const Segment& seg, char c) const
{
    bool hit = seg.chars.find(c) != std::string::npos;
    for (const auto& [lo, hi] : seg.ranges) {
        if (c >= lo && c <= hi) {
            hit = true;
            break;
        }
    }
    return seg.negate ? !hit : hit;
}

// 单星号回溯：记住最后一个 * 的位置，失配时让它多吞一个字符
bool GlobPattern::match(std::string_view text) const
{
    std::size_t s = 0;
    std::size_t t = 0;
    std::size_t starSeg = std::string::npos;
    std::size_t starText = 0;

    while (t < text.size())
    {
        if (s < segments_.size())
        {
            const auto& seg = segments_[s];
            bool matched = false;
            switch (seg.type)
            {
            case SegmentType::Star:
                starSeg = s++;
                starText = t;
                continue;
            case SegmentType::Question:
                matched = true;
                break;
            case SegmentType::Literal:
                matched = seg.literal == text[t];
                break;
            case SegmentType::CharClass:
                matched = classMatches(seg, text[t]);
                break;
            }
            if (matched) {
                ++s;
                ++t;
                continue;
            }
        }

        if (starSeg == std::string::npos) {
            return false;
        }
        s = starSeg + 1;
        t = ++starText;
    }

    while (s < segments_.size() && segments_[s].type == SegmentType::Star) {
        ++s;
    }
    return s == segments_.size();
}

} // namespace broker

#include "metrics_calculator.hpp"
#include <algorithm>
#include <limits>

namespace {

// Byte length of the Unicode White_Space code point starting at `pos`, 0 for anything
// else. The source is valid UTF-8, so a lead byte is followed by its continuation bytes.
size_t whitespaceLength(const std::string& source, size_t pos, size_t end) {
    const auto byteAt = [&source](size_t index) { return static_cast<unsigned char>(source[index]); };
    const unsigned char lead = byteAt(pos);

    if (lead < 0x80) {
        return (lead == ' ' || (lead >= 0x09 && lead <= 0x0D)) ? 1 : 0;
    }

    uint32_t codePoint;
    size_t length;
    if (lead >= 0xC2 && lead <= 0xDF) {
        codePoint = lead & 0x1F;
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        codePoint = lead & 0x0F;
        length = 3;
    } else {
        // Four-byte sequences hold no whitespace
        return 0;
    }
    if (pos + length > end) {
        return 0;
    }
    for (size_t k = 1; k < length; ++k) {
        codePoint = (codePoint << 6) | (byteAt(pos + k) & 0x3F);
    }

    switch (codePoint) {
        case 0x0085: case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return length;
        default:
            return (codePoint >= 0x2000 && codePoint <= 0x200A) ? length : 0;
    }
}

// Portion of one row covered by a comment: [begin, end) in byte columns
struct Span {
    uint32_t begin;
    uint32_t end;
};

// True if the row holds a non-whitespace character outside every covered span
bool lineHasCode(const std::string& source, size_t lineStart, size_t lineEnd,
                 std::vector<Span>& covered) {
    std::sort(covered.begin(), covered.end(), [](const Span& a, const Span& b) {
        return a.begin < b.begin;
    });

    size_t spanIndex = 0;
    const size_t length = lineEnd - lineStart;

    for (size_t column = 0; column < length; ++column) {
        const size_t blank = whitespaceLength(source, lineStart + column, lineEnd);
        if (blank > 0) {
            column += blank - 1;
            continue;
        }

        // Skip spans that end before this column
        while (spanIndex < covered.size() && covered[spanIndex].end <= column) {
            ++spanIndex;
        }

        if (spanIndex < covered.size() && covered[spanIndex].begin <= column) {
            // Inside a comment: resume scanning where it ends
            const uint32_t end = covered[spanIndex].end;
            if (end >= length) {
                return false;
            }
            column = end - 1;
            continue;
        }

        return true;
    }

    return false;
}

} // namespace

FileMetrics MetricsCalculator::calculate(const std::string& path,
                                         const std::string& source,
                                         fs::file_time_type lastModified,
                                         const LanguageParser& parser) const {
    SyntaxTree tree(nullptr);
    try {
        tree = parser.parse(source, parseTimeout_);
    } catch (const ParseError& e) {
        const auto kind = e.kind() == ParseError::Kind::Timeout
            ? MetricsError::Kind::Timeout
            : MetricsError::Kind::ParseFailed;
        throw MetricsError(kind, std::string("Parse failed: ") + e.what());
    }

    FileMetrics metrics;
    metrics.path = path;
    metrics.language = parser.language();
    metrics.loc = countLinesOfCode(source, parser.commentRanges(tree));
    metrics.sizeBytes = source.size();
    metrics.functionCount = parser.functionCount(tree);
    metrics.lastModified = lastModified;
    return metrics;
}

size_t MetricsCalculator::countLinesOfCode(const std::string& source,
                                           const std::vector<SourceRange>& commentRanges) {
    // Comments never overlap, so a sweep over ranges sorted by start position
    // finds every range touching the current row.
    std::vector<SourceRange> ranges(commentRanges);
    std::sort(ranges.begin(), ranges.end(), [](const SourceRange& a, const SourceRange& b) {
        if (a.startRow != b.startRow) {
            return a.startRow < b.startRow;
        }
        return a.startColumn < b.startColumn;
    });

    size_t loc = 0;
    size_t firstActive = 0;
    std::vector<Span> covered;

    size_t lineStart = 0;
    uint32_t row = 0;
    while (lineStart <= source.size()) {
        size_t lineEnd = source.find('\n', lineStart);
        if (lineEnd == std::string::npos) {
            lineEnd = source.size();
        }

        while (firstActive < ranges.size() && ranges[firstActive].endRow < row) {
            ++firstActive;
        }

        covered.clear();
        for (size_t i = firstActive; i < ranges.size() && ranges[i].startRow <= row; ++i) {
            const SourceRange& range = ranges[i];
            if (range.endRow < row) {
                continue;
            }
            const uint32_t begin = range.startRow == row ? range.startColumn : 0;
            const uint32_t end = range.endRow == row ? range.endColumn
                                                     : std::numeric_limits<uint32_t>::max();
            if (end > begin) {
                covered.push_back({begin, end});
            }
        }

        if (lineHasCode(source, lineStart, lineEnd, covered)) {
            ++loc;
        }

        if (lineEnd == source.size()) {
            break;
        }
        lineStart = lineEnd + 1;
        ++row;
    }

    return loc;
}

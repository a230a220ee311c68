#pragma once

#include "mdnav/parse_options.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mdnav
{

enum class LineKind
{
    Blank,
    Heading,
    ListItem,
    Blockquote,
    FenceOpen,
    FenceClose,
    FencedCode,
    MathOpen,
    MathClose,
    MathContent,
    TableSeparator,
    TableRow,
    HorizontalRule,
    Paragraph
};

struct ClassifiedLine
{
    LineKind kind = LineKind::Paragraph;
    std::size_t index = 0;
    std::size_t start = 0;        // first byte of the line
    std::size_t end = 0;          // end of the line, line break excluded
    std::size_t next = 0;         // start of the following line
    std::size_t markerStart = 0;  // first non-whitespace byte
    std::size_t contentStart = 0; // where inline content begins
    std::size_t contentEnd = 0;   // past the last non-whitespace byte
    std::size_t indent = 0;       // leading columns, tab = 4
    int headingLevel = 0;
    int quoteDepth = 0;
    bool ordered = false;
    bool isTask = false;
    bool taskChecked = false;
    std::size_t taskStart = 0;
    bool isTableHeader = false;
    std::string language;

    bool isCode() const noexcept
    {
        return kind == LineKind::FenceOpen || kind == LineKind::FenceClose || kind == LineKind::FencedCode;
    }
    bool isMath() const noexcept
    {
        return kind == LineKind::MathOpen || kind == LineKind::MathClose || kind == LineKind::MathContent;
    }
};

struct ClassifierState
{
    bool inFence = false;
    char fenceChar = '`';
    std::size_t fenceLength = 0;
    bool inMath = false;
    bool headerCandidate = false;
    bool tableActive = false;
};

class LineClassifier
{
public:
    explicit LineClassifier(ParseOptions options = {});

    const ParseOptions &options() const noexcept { return parseOptions; }

    // Classifies the line occupying [start, end) of text. `next` is left untouched.
    ClassifiedLine classifyLine(std::string_view text, std::size_t start, std::size_t end,
                                ClassifierState &state) const;
    std::vector<ClassifiedLine> classify(std::string_view text) const;

    static bool isHorizontalRule(std::string_view trimmed) noexcept;
    static bool isTableSeparator(std::string_view trimmed) noexcept;
    static bool hasUnescapedPipe(std::string_view line) noexcept;

private:
    ClassifiedLine classifyFenced(std::string_view trimmed, ClassifiedLine info, ClassifierState &state) const;
    ClassifiedLine classifyMath(std::string_view trimmed, ClassifiedLine info, ClassifierState &state) const;
    bool openFence(std::string_view trimmed, ClassifiedLine &info, ClassifierState &state) const;
    bool classifyListItem(std::string_view line, ClassifiedLine &info) const;

    ParseOptions parseOptions;
};

// Yields classified lines one at a time.
class LineReader
{
public:
    LineReader(std::string_view text, const LineClassifier &classifier);

    bool next(ClassifiedLine &line);
    const ClassifierState &state() const noexcept { return classifierState; }

private:
    std::string_view text;
    const LineClassifier &classifier;
    ClassifierState classifierState;
    std::size_t offset = 0;
    std::size_t lineIndex = 0;
    bool finished = false;
};

// Finds the end of the line starting at `start` and the start of the one after it.
// Recognizes "\n", "\r\n" and a lone "\r".
std::size_t findLineEnd(std::string_view text, std::size_t start, std::size_t &next) noexcept;

} // namespace mdnav

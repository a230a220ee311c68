#include "mdnav/line_classifier.hpp"

#include <cctype>

namespace mdnav
{
namespace
{
bool isWhitespace(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '\f' || ch == '\v';
}

bool isDigit(char ch) noexcept
{
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

std::string_view trim(std::string_view view) noexcept
{
    std::size_t start = 0;
    std::size_t end = view.size();
    while (start < end && isWhitespace(view[start]))
        ++start;
    while (end > start && isWhitespace(view[end - 1]))
        --end;
    return view.substr(start, end - start);
}

std::size_t countRun(std::string_view view, std::size_t pos, char ch) noexcept
{
    std::size_t count = 0;
    while (pos + count < view.size() && view[pos + count] == ch)
        ++count;
    return count;
}

} // namespace

std::size_t findLineEnd(std::string_view text, std::size_t start, std::size_t &next) noexcept
{
    std::size_t pos = text.find_first_of("\r\n", start);
    if (pos == std::string_view::npos)
    {
        next = text.size();
        return text.size();
    }
    if (text[pos] == '\r' && pos + 1 < text.size() && text[pos + 1] == '\n')
        next = pos + 2;
    else
        next = pos + 1;
    return pos;
}

LineClassifier::LineClassifier(ParseOptions options)
    : parseOptions(options)
{
}

ClassifiedLine LineClassifier::classifyLine(std::string_view text, std::size_t start, std::size_t end,
                                            ClassifierState &state) const
{
    ClassifiedLine info;
    info.start = start;
    info.end = end;
    info.next = end;

    std::string_view line = text.substr(start, end - start);
    std::size_t pos = 0;
    std::size_t columns = 0;
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t'))
    {
        columns += line[pos] == '\t' ? 4 : 1;
        ++pos;
    }
    std::size_t last = line.size();
    while (last > pos && isWhitespace(line[last - 1]))
        --last;

    info.indent = columns;
    info.markerStart = start + pos;
    info.contentStart = info.markerStart;
    info.contentEnd = start + last;
    std::string_view trimmed = line.substr(pos, last - pos);

    if (state.inFence)
        return classifyFenced(trimmed, info, state);
    if (state.inMath)
        return classifyMath(trimmed, info, state);

    const bool afterHeaderCandidate = state.headerCandidate;
    auto resetTable = [&]() {
        state.headerCandidate = false;
        state.tableActive = false;
    };

    if (trimmed.empty())
    {
        info.kind = LineKind::Blank;
        resetTable();
        return info;
    }

    if (openFence(trimmed, info, state))
    {
        resetTable();
        return info;
    }

    if (parseOptions.mathDelimiters && trimmed == "$$")
    {
        info.kind = LineKind::MathOpen;
        state.inMath = true;
        resetTable();
        return info;
    }

    if (trimmed.front() == '>')
    {
        std::size_t i = 0;
        int depth = 0;
        while (i < trimmed.size() && trimmed[i] == '>')
        {
            ++depth;
            ++i;
            while (i < trimmed.size() && (trimmed[i] == ' ' || trimmed[i] == '\t'))
                ++i;
        }
        info.kind = LineKind::Blockquote;
        info.quoteDepth = depth;
        info.contentStart = info.markerStart + i;
        resetTable();
        return info;
    }

    if (trimmed.front() == '#')
    {
        std::size_t level = countRun(trimmed, 0, '#');
        if (level <= 6 && (level == trimmed.size() || trimmed[level] == ' ' || trimmed[level] == '\t'))
        {
            std::size_t content = level;
            while (content < trimmed.size() && (trimmed[content] == ' ' || trimmed[content] == '\t'))
                ++content;
            info.kind = LineKind::Heading;
            info.headingLevel = static_cast<int>(level);
            info.contentStart = info.markerStart + content;
            resetTable();
            return info;
        }
    }

    if (isHorizontalRule(trimmed))
    {
        info.kind = LineKind::HorizontalRule;
        resetTable();
        return info;
    }

    if (afterHeaderCandidate && isTableSeparator(trimmed))
    {
        info.kind = LineKind::TableSeparator;
        state.headerCandidate = false;
        state.tableActive = true;
        return info;
    }

    if (classifyListItem(line, info))
    {
        resetTable();
        return info;
    }

    if (hasUnescapedPipe(trimmed) && (!parseOptions.tableRequiresLeadingPipe || trimmed.front() == '|'))
    {
        info.kind = LineKind::TableRow;
        if (state.tableActive)
        {
            state.headerCandidate = false;
        }
        else
        {
            info.isTableHeader = true;
            state.headerCandidate = true;
        }
        return info;
    }

    info.kind = LineKind::Paragraph;
    resetTable();
    return info;
}

std::vector<ClassifiedLine> LineClassifier::classify(std::string_view text) const
{
    std::vector<ClassifiedLine> lines;
    LineReader reader(text, *this);
    ClassifiedLine line;
    while (reader.next(line))
        lines.push_back(line);
    return lines;
}

bool LineClassifier::isHorizontalRule(std::string_view trimmed) noexcept
{
    if (trimmed.size() < 3)
        return false;
    char first = trimmed.front();
    if (first != '-' && first != '*' && first != '_')
        return false;
    int count = 0;
    for (char ch : trimmed)
    {
        if (ch == first)
            ++count;
        else if (!isWhitespace(ch))
            return false;
    }
    return count >= 3;
}

bool LineClassifier::isTableSeparator(std::string_view trimmed) noexcept
{
    if (trimmed.find('|') == std::string_view::npos)
        return false;
    bool sawDash = false;
    std::size_t start = 0;
    while (start <= trimmed.size())
    {
        std::size_t end = trimmed.find('|', start);
        if (end == std::string_view::npos)
            end = trimmed.size();
        std::string_view cell = trim(trimmed.substr(start, end - start));
        if (!cell.empty())
        {
            std::size_t i = 0;
            if (cell[i] == ':')
                ++i;
            std::size_t dashes = countRun(cell, i, '-');
            if (dashes == 0)
                return false;
            i += dashes;
            if (i < cell.size() && cell[i] == ':')
                ++i;
            if (i != cell.size())
                return false;
            sawDash = true;
        }
        start = end + 1;
    }
    return sawDash;
}

bool LineClassifier::hasUnescapedPipe(std::string_view line) noexcept
{
    bool escape = false;
    for (char ch : line)
    {
        if (escape)
        {
            escape = false;
            continue;
        }
        if (ch == '\\')
            escape = true;
        else if (ch == '|')
            return true;
    }
    return false;
}

ClassifiedLine LineClassifier::classifyFenced(std::string_view trimmed, ClassifiedLine info,
                                              ClassifierState &state) const
{
    state.headerCandidate = false;
    state.tableActive = false;
    std::size_t run = countRun(trimmed, 0, state.fenceChar);
    if (run >= state.fenceLength && run == trimmed.size())
    {
        info.kind = LineKind::FenceClose;
        state.inFence = false;
        state.fenceLength = 0;
    }
    else
    {
        info.kind = LineKind::FencedCode;
    }
    return info;
}

ClassifiedLine LineClassifier::classifyMath(std::string_view trimmed, ClassifiedLine info,
                                            ClassifierState &state) const
{
    state.headerCandidate = false;
    state.tableActive = false;
    if (trimmed.size() >= 2 && trimmed.substr(trimmed.size() - 2) == "$$")
    {
        info.kind = LineKind::MathClose;
        state.inMath = false;
    }
    else
    {
        info.kind = LineKind::MathContent;
    }
    return info;
}

bool LineClassifier::openFence(std::string_view trimmed, ClassifiedLine &info, ClassifierState &state) const
{
    char c = trimmed.front();
    if (c != '`' && !(c == '~' && parseOptions.tildeFences))
        return false;
    std::size_t count = countRun(trimmed, 0, c);
    if (count < 3)
        return false;
    std::string_view rest = trim(trimmed.substr(count));
    if (c == '`' && rest.find('`') != std::string_view::npos)
        return false;

    info.kind = LineKind::FenceOpen;
    std::size_t word = 0;
    while (word < rest.size() && !isWhitespace(rest[word]))
        ++word;
    info.language = std::string(rest.substr(0, word));
    state.inFence = true;
    state.fenceChar = c;
    state.fenceLength = count;
    return true;
}

bool LineClassifier::classifyListItem(std::string_view line, ClassifiedLine &info) const
{
    std::size_t pos = info.markerStart - info.start;
    if (pos >= line.size())
        return false;

    std::size_t markerEnd = 0;
    bool ordered = false;
    char first = line[pos];
    if (first == '-' || first == '*' || first == '+')
    {
        markerEnd = pos + 1;
    }
    else if (isDigit(first))
    {
        std::size_t digits = pos;
        while (digits < line.size() && isDigit(line[digits]))
            ++digits;
        if (digits - pos > 9 || digits >= line.size() || (line[digits] != '.' && line[digits] != ')'))
            return false;
        markerEnd = digits + 1;
        ordered = true;
    }
    else
    {
        return false;
    }

    if (markerEnd >= line.size() || (line[markerEnd] != ' ' && line[markerEnd] != '\t'))
        return false;

    std::size_t content = markerEnd;
    while (content < line.size() && (line[content] == ' ' || line[content] == '\t'))
        ++content;

    info.kind = LineKind::ListItem;
    info.ordered = ordered;
    info.contentStart = info.start + content;

    if (content + 3 <= line.size() && line[content] == '[' && line[content + 2] == ']' &&
        (line[content + 1] == ' ' || line[content + 1] == 'x' || line[content + 1] == 'X') &&
        (content + 3 == line.size() || line[content + 3] == ' ' || line[content + 3] == '\t'))
    {
        info.isTask = true;
        info.taskChecked = line[content + 1] != ' ';
        info.taskStart = info.start + content;
        std::size_t after = content + 3;
        while (after < line.size() && (line[after] == ' ' || line[after] == '\t'))
            ++after;
        info.contentStart = info.start + after;
    }
    if (info.contentStart > info.contentEnd)
        info.contentStart = info.contentEnd;
    return true;
}

LineReader::LineReader(std::string_view text, const LineClassifier &classifier)
    : text(text),
      classifier(classifier)
{
}

bool LineReader::next(ClassifiedLine &line)
{
    if (finished)
        return false;
    std::size_t start = offset;
    std::size_t following = 0;
    std::size_t end = findLineEnd(text, start, following);
    line = classifier.classifyLine(text, start, end, classifierState);
    line.index = lineIndex++;
    line.next = following;
    if (following == end)
        finished = true;
    offset = following;
    return true;
}

} // namespace mdnav

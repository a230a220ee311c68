#include "inline_scanner.hpp"

#include <array>
#include <cctype>

namespace mdnav::detail
{
namespace
{
constexpr std::size_t npos = static_cast<std::size_t>(-1);

bool isWhitespace(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
}

bool isBlankOrNone(char ch) noexcept
{
    return ch == '\0' || isWhitespace(ch);
}

bool isAlphaNumeric(char ch) noexcept
{
    return std::isalnum(static_cast<unsigned char>(ch)) != 0;
}

bool isDigit(char ch) noexcept
{
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool isPunctuation(char ch) noexcept
{
    return std::ispunct(static_cast<unsigned char>(ch)) != 0;
}

std::string destination(std::string_view inner)
{
    std::size_t start = 0;
    while (start < inner.size() && isWhitespace(inner[start]))
        ++start;
    inner.remove_prefix(start);
    if (!inner.empty() && inner.front() == '<')
    {
        std::size_t close = inner.find('>');
        if (close != std::string_view::npos)
            return std::string(inner.substr(1, close - 1));
    }
    std::size_t end = 0;
    while (end < inner.size() && !isWhitespace(inner[end]))
        ++end;
    return std::string(inner.substr(0, end));
}

Element makeElement(Category category, std::size_t start, std::size_t end)
{
    Element element;
    element.category = category;
    element.span = Span{start, end};
    return element;
}

} // namespace

InlineScanner::InlineScanner(ParseOptions options)
    : options(options)
{
}

void InlineScanner::scan(std::string_view text, std::size_t from, std::size_t to, std::vector<Element> &out)
{
    if (from >= to || to > text.size())
        return;
    line = text;
    base = from;
    limit = to;
    mask.assign(to - from, 0);
    escaped.assign(to - from, 0);

    markEscapes();
    scanCodeSpans(out);
    if (options.mathDelimiters)
        scanMath(out);
    scanBrackets(out);
    scanDelimiterRuns(out);
}

void InlineScanner::protect(std::size_t start, std::size_t end) noexcept
{
    for (std::size_t i = start; i < end && i < limit; ++i)
        mask[i - base] = 1;
}

char InlineScanner::at(std::size_t offset) const noexcept
{
    if (offset < base || offset >= limit)
        return '\0';
    return line[offset];
}

void InlineScanner::markEscapes()
{
    for (std::size_t i = base; i + 1 < limit; ++i)
    {
        if (line[i] == '\\' && isPunctuation(line[i + 1]))
        {
            escaped[i + 1 - base] = 1;
            ++i;
        }
    }
}

void InlineScanner::scanCodeSpans(std::vector<Element> &out)
{
    std::size_t i = base;
    while (i < limit)
    {
        if (line[i] != '`' || isEscaped(i))
        {
            ++i;
            continue;
        }
        std::size_t fenceLength = 0;
        while (i + fenceLength < limit && line[i + fenceLength] == '`')
            ++fenceLength;

        std::size_t close = npos;
        std::size_t j = i + fenceLength;
        while (j < limit)
        {
            if (line[j] != '`')
            {
                ++j;
                continue;
            }
            std::size_t run = 0;
            while (j + run < limit && line[j + run] == '`')
                ++run;
            if (run == fenceLength)
            {
                close = j;
                break;
            }
            j += run;
        }

        if (close == npos)
        {
            i += fenceLength;
            continue;
        }
        out.push_back(makeElement(Category::InlineCode, i, close + fenceLength));
        protect(i, close + fenceLength);
        i = close + fenceLength;
    }
}

void InlineScanner::scanMath(std::vector<Element> &out)
{
    auto usable = [&](std::size_t pos) { return at(pos) == '$' && !isEscaped(pos) && !isProtected(pos); };

    // closers[k - base]: the inline closing `$` an opener just before k would reach, or npos.
    std::vector<std::size_t> closers(limit - base + 1, npos);
    for (std::size_t k = limit; k-- > base;)
    {
        std::size_t next = closers[k + 1 - base];
        if (isProtected(k))
            next = npos;
        else if (usable(k) && at(k + 1) == '$')
            next = npos;
        else if (usable(k) && !isWhitespace(at(k - 1)) && !isDigit(at(k + 1)))
            next = k;
        closers[k - base] = next;
    }

    std::size_t i = base;
    while (i < limit)
    {
        if (!usable(i))
        {
            ++i;
            continue;
        }

        if (at(i + 1) == '$')
        {
            std::size_t close = npos;
            for (std::size_t j = i + 2; j + 1 < limit; ++j)
            {
                if (isProtected(j))
                    break;
                if (usable(j) && usable(j + 1))
                {
                    close = j;
                    break;
                }
            }
            if (close != npos && close > i + 2)
            {
                Element math = makeElement(Category::Math, i, close + 2);
                math.display = true;
                out.push_back(std::move(math));
                protect(i, close + 2);
                i = close + 2;
            }
            else
            {
                i += 2;
            }
            continue;
        }

        if (isBlankOrNone(at(i + 1)))
        {
            ++i;
            continue;
        }

        std::size_t close = closers[i + 1 - base];
        if (close == npos)
        {
            ++i;
            continue;
        }
        out.push_back(makeElement(Category::Math, i, close + 1));
        protect(i, close + 1);
        i = close + 1;
    }
}

void InlineScanner::pairBrackets()
{
    bracketPartner.assign(limit - base, npos);
    parenPartner.assign(limit - base, npos);
    std::vector<std::size_t> brackets;
    std::vector<std::size_t> parens;
    for (std::size_t k = base; k < limit; ++k)
    {
        if (isEscaped(k))
            continue;
        char ch = line[k];
        if (ch == '(')
        {
            parens.push_back(k);
        }
        else if (ch == ')' && !parens.empty())
        {
            parenPartner[parens.back() - base] = k;
            parens.pop_back();
        }
        else if (isProtected(k))
        {
            continue;
        }
        else if (ch == '[')
        {
            brackets.push_back(k);
        }
        else if (ch == ']' && !brackets.empty())
        {
            bracketPartner[brackets.back() - base] = k;
            brackets.pop_back();
        }
    }
}

std::size_t InlineScanner::matchBracket(std::size_t open) const noexcept
{
    std::size_t close = bracketPartner[open - base];
    if (close == npos || isProtected(close))
        return npos;
    return close;
}

std::size_t InlineScanner::matchParen(std::size_t open) const noexcept
{
    return parenPartner[open - base];
}

void InlineScanner::scanBrackets(std::vector<Element> &out)
{
    pairBrackets();
    std::size_t linkGuard = base;
    std::size_t imageGuard = base;

    std::size_t i = base;
    while (i < limit)
    {
        if (isProtected(i) || isEscaped(i))
        {
            ++i;
            continue;
        }

        if (line[i] == '!' && at(i + 1) == '[' && !isProtected(i + 1))
        {
            if (i >= imageGuard)
            {
                std::size_t close = matchBracket(i + 1);
                if (close != npos && at(close + 1) == '(')
                {
                    std::size_t paren = matchParen(close + 1);
                    if (paren != npos)
                    {
                        Element image = makeElement(Category::Image, i, paren + 1);
                        image.info = destination(line.substr(close + 2, paren - close - 2));
                        out.push_back(std::move(image));
                        protect(close + 1, paren + 1);
                        imageGuard = close;
                    }
                }
            }
            i += 2;
            continue;
        }

        if (line[i] != '[')
        {
            ++i;
            continue;
        }

        if (at(i + 1) == '^')
        {
            std::size_t j = i + 2;
            while (j < limit && line[j] != ']' && line[j] != '[' && !isWhitespace(line[j]))
                ++j;
            if (j < limit && line[j] == ']' && j > i + 2)
            {
                std::size_t end = j + 1;
                bool definition = i == base && at(end) == ':';
                if (definition)
                    ++end;
                Element footnote = makeElement(Category::Footnote, i, end);
                footnote.definition = definition;
                footnote.info = std::string(line.substr(i + 2, j - i - 2));
                out.push_back(std::move(footnote));
                protect(i, end);
                i = end;
                continue;
            }
        }

        if (i >= linkGuard)
        {
            std::size_t close = matchBracket(i);
            if (close != npos && close > i + 1 && at(close + 1) == '(')
            {
                std::size_t paren = matchParen(close + 1);
                if (paren != npos)
                {
                    Element link = makeElement(Category::Link, i, paren + 1);
                    link.info = destination(line.substr(close + 2, paren - close - 2));
                    out.push_back(std::move(link));
                    protect(close + 1, paren + 1);
                    linkGuard = paren + 1;
                }
            }
        }
        ++i;
    }
}

void InlineScanner::scanDelimiterRuns(std::vector<Element> &out)
{
    std::vector<Delimiter> stack;
    // Open delimiters per character, so a closer with nothing to match skips the stack walk.
    std::array<std::size_t, 3> pending{};
    auto slot = [](char ch) -> std::size_t { return ch == '*' ? 0 : (ch == '_' ? 1 : 2); };

    std::size_t i = base;
    while (i < limit)
    {
        char ch = line[i];
        bool candidate = ch == '*' || ch == '~' || (ch == '_' && options.underscoreEmphasis);
        if (!candidate || isProtected(i) || isEscaped(i))
        {
            ++i;
            continue;
        }

        std::size_t j = i;
        while (j < limit && line[j] == ch && !isProtected(j) && !isEscaped(j))
            ++j;
        std::size_t count = j - i;

        char before = at(i - 1);
        if (i == base)
            before = '\0';
        char after = at(j);
        bool canOpen = !isBlankOrNone(after);
        bool canClose = !isBlankOrNone(before);
        if (ch == '_')
        {
            canOpen = canOpen && !isAlphaNumeric(before);
            canClose = canClose && !isAlphaNumeric(after);
        }
        if (ch == '~' && count != 2)
        {
            i = j;
            continue;
        }

        std::size_t position = i;
        std::size_t remaining = count;
        while (canClose && remaining > 0 && pending[slot(ch)] > 0)
        {
            std::size_t match = stack.size();
            for (std::size_t k = stack.size(); k > 0; --k)
            {
                if (stack[k - 1].ch == ch)
                {
                    match = k - 1;
                    break;
                }
            }
            if (match == stack.size())
                break;

            Delimiter &opener = stack[match];
            std::size_t use = 1;
            if (ch == '~' || (opener.count >= 2 && remaining >= 2))
                use = 2;

            Category category = Category::Emphasis;
            if (ch == '~')
                category = Category::Strikethrough;
            else if (use == 2)
                category = Category::Bold;
            out.push_back(makeElement(category, opener.position + opener.count - use, position + use));

            opener.count -= use;
            position += use;
            remaining -= use;
            for (std::size_t k = match + 1; k < stack.size(); ++k)
                --pending[slot(stack[k].ch)];
            stack.erase(stack.begin() + static_cast<std::ptrdiff_t>(match) + 1, stack.end());
            if (stack.back().count == 0)
            {
                --pending[slot(ch)];
                stack.pop_back();
            }
        }

        if (remaining > 0 && canOpen)
        {
            stack.push_back(Delimiter{ch, position, remaining});
            ++pending[slot(ch)];
        }
        i = j;
    }
}

} // namespace mdnav::detail

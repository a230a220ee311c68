#include <gtest/gtest.h>

#include "mdnav/line_classifier.hpp"

#include <string>
#include <vector>

using mdnav::ClassifiedLine;
using mdnav::ClassifierState;
using mdnav::LineClassifier;
using mdnav::LineKind;
using mdnav::LineReader;
using mdnav::ParseOptions;

namespace
{

std::vector<LineKind> kinds(const std::vector<ClassifiedLine> &lines)
{
    std::vector<LineKind> result;
    for (const auto &line : lines)
        result.push_back(line.kind);
    return result;
}

ClassifiedLine classifySingle(const std::string &text, const ParseOptions &options = {})
{
    LineClassifier classifier(options);
    auto lines = classifier.classify(text);
    return lines.front();
}

} // namespace

TEST(LineClassifier, LineCountMatchesBreaks)
{
    LineClassifier classifier;
    EXPECT_EQ(classifier.classify("").size(), 1u);
    EXPECT_EQ(classifier.classify("a").size(), 1u);
    EXPECT_EQ(classifier.classify("a\n").size(), 2u);
    EXPECT_EQ(classifier.classify("a\r\nb\rc\n").size(), 4u);
}

TEST(LineClassifier, LineOffsetsExcludeBreaks)
{
    LineClassifier classifier;
    auto lines = classifier.classify("ab\r\ncd");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].start, 0u);
    EXPECT_EQ(lines[0].end, 2u);
    EXPECT_EQ(lines[0].next, 4u);
    EXPECT_EQ(lines[1].start, 4u);
    EXPECT_EQ(lines[1].end, 6u);
    EXPECT_EQ(lines[1].index, 1u);
}

TEST(LineClassifier, DetectsHeadings)
{
    ClassifiedLine heading = classifySingle("### Setup  ");
    EXPECT_EQ(heading.kind, LineKind::Heading);
    EXPECT_EQ(heading.headingLevel, 3);
    EXPECT_EQ(heading.contentStart, 4u);
    EXPECT_EQ(heading.contentEnd, 9u);

    EXPECT_EQ(classifySingle("#").kind, LineKind::Heading);
    EXPECT_EQ(classifySingle("#hashtag").kind, LineKind::Paragraph);
    EXPECT_EQ(classifySingle("####### seven").kind, LineKind::Paragraph);
}

TEST(LineClassifier, DetectsListItemsAndTasks)
{
    ClassifiedLine bullet = classifySingle("  - item");
    EXPECT_EQ(bullet.kind, LineKind::ListItem);
    EXPECT_FALSE(bullet.ordered);
    EXPECT_EQ(bullet.indent, 2u);
    EXPECT_EQ(bullet.markerStart, 2u);
    EXPECT_EQ(bullet.contentStart, 4u);

    ClassifiedLine ordered = classifySingle("12) twelfth");
    EXPECT_EQ(ordered.kind, LineKind::ListItem);
    EXPECT_TRUE(ordered.ordered);

    ClassifiedLine task = classifySingle("- [X] done");
    EXPECT_TRUE(task.isTask);
    EXPECT_TRUE(task.taskChecked);
    EXPECT_EQ(task.taskStart, 2u);
    EXPECT_EQ(task.contentStart, 6u);

    EXPECT_EQ(classifySingle("-not a list").kind, LineKind::Paragraph);
    EXPECT_EQ(classifySingle("1.5 million").kind, LineKind::Paragraph);
}

TEST(LineClassifier, RulesWinOverListItems)
{
    EXPECT_EQ(classifySingle("* * *").kind, LineKind::HorizontalRule);
    EXPECT_EQ(classifySingle("---").kind, LineKind::HorizontalRule);
    EXPECT_EQ(classifySingle("___").kind, LineKind::HorizontalRule);
    EXPECT_EQ(classifySingle("- -").kind, LineKind::ListItem);
}

TEST(LineClassifier, CountsBlockquoteDepth)
{
    ClassifiedLine nested = classifySingle("> > quoted");
    EXPECT_EQ(nested.kind, LineKind::Blockquote);
    EXPECT_EQ(nested.quoteDepth, 2);
    EXPECT_EQ(nested.contentStart, 4u);

    EXPECT_EQ(classifySingle(">>tight").quoteDepth, 2);
}

TEST(LineClassifier, TracksFencesAcrossLines)
{
    LineClassifier classifier;
    auto lines = classifier.classify("```cpp\n# not a heading\n``\n```\ntext");
    EXPECT_EQ(kinds(lines), (std::vector<LineKind>{LineKind::FenceOpen, LineKind::FencedCode, LineKind::FencedCode,
                                                   LineKind::FenceClose, LineKind::Paragraph}));
    EXPECT_EQ(lines[0].language, "cpp");
}

TEST(LineClassifier, ClosingFenceMustMatchCharacterAndLength)
{
    LineClassifier classifier;
    auto lines = classifier.classify("~~~~\n~~~\n```\n~~~~~");
    EXPECT_EQ(kinds(lines), (std::vector<LineKind>{LineKind::FenceOpen, LineKind::FencedCode, LineKind::FencedCode,
                                                   LineKind::FenceClose}));
}

TEST(LineClassifier, TildeFencesCanBeDisabled)
{
    ParseOptions options;
    options.tildeFences = false;
    EXPECT_EQ(classifySingle("~~~", options).kind, LineKind::Paragraph);
}

TEST(LineClassifier, BacktickInInfoStringIsNotAFence)
{
    EXPECT_EQ(classifySingle("``` a`b").kind, LineKind::Paragraph);
}

TEST(LineClassifier, UnclosedFenceSwallowsTheRest)
{
    LineClassifier classifier;
    auto lines = classifier.classify("```\n# heading\n- item\n| a | b |");
    EXPECT_EQ(kinds(lines), (std::vector<LineKind>{LineKind::FenceOpen, LineKind::FencedCode, LineKind::FencedCode,
                                                   LineKind::FencedCode}));
}

TEST(LineClassifier, TracksDisplayMathBlocks)
{
    LineClassifier classifier;
    auto lines = classifier.classify("$$\nx^2\n$$\n");
    EXPECT_EQ(kinds(lines), (std::vector<LineKind>{LineKind::MathOpen, LineKind::MathContent, LineKind::MathClose,
                                                   LineKind::Blank}));

    ParseOptions options;
    options.mathDelimiters = false;
    EXPECT_EQ(classifySingle("$$", options).kind, LineKind::Paragraph);
}

TEST(LineClassifier, RecognizesTablesOnlyWithSeparator)
{
    LineClassifier classifier;
    auto lines = classifier.classify("| A | B |\n|:--|--:|\n| 1 | 2 |\n\na | b\nplain");
    EXPECT_EQ(kinds(lines), (std::vector<LineKind>{LineKind::TableRow, LineKind::TableSeparator, LineKind::TableRow,
                                                   LineKind::Blank, LineKind::TableRow, LineKind::Paragraph}));
    EXPECT_TRUE(lines[0].isTableHeader);
    EXPECT_FALSE(lines[2].isTableHeader);
    EXPECT_TRUE(lines[4].isTableHeader);
}

TEST(LineClassifier, SeparatorWithoutHeaderIsNotATableSeparator)
{
    LineClassifier classifier;
    auto lines = classifier.classify("text\n|---|---|");
    EXPECT_EQ(lines[1].kind, LineKind::TableRow);
}

TEST(LineClassifier, EscapedPipesDoNotMakeRows)
{
    EXPECT_EQ(classifySingle("a \\| b").kind, LineKind::Paragraph);
    EXPECT_TRUE(LineClassifier::hasUnescapedPipe("a \\| b | c"));
}

TEST(LineClassifier, LeadingPipeRequirementIsConfigurable)
{
    ParseOptions options;
    options.tableRequiresLeadingPipe = true;
    EXPECT_EQ(classifySingle("a | b", options).kind, LineKind::Paragraph);
    EXPECT_EQ(classifySingle("| a | b", options).kind, LineKind::TableRow);
}

TEST(LineClassifier, SeparatorCellsNeedDashes)
{
    EXPECT_TRUE(LineClassifier::isTableSeparator("|---|:-:|"));
    EXPECT_TRUE(LineClassifier::isTableSeparator("--- | ---"));
    EXPECT_FALSE(LineClassifier::isTableSeparator("|:::|---|"));
    EXPECT_FALSE(LineClassifier::isTableSeparator("---"));
}

TEST(LineClassifier, ReaderYieldsLinesLazily)
{
    LineClassifier classifier;
    LineReader reader("```\ncode", classifier);
    ClassifiedLine line;
    ASSERT_TRUE(reader.next(line));
    EXPECT_EQ(line.kind, LineKind::FenceOpen);
    EXPECT_TRUE(reader.state().inFence);
    ASSERT_TRUE(reader.next(line));
    EXPECT_EQ(line.kind, LineKind::FencedCode);
    EXPECT_FALSE(reader.next(line));
}

TEST(LineClassifier, MalformedInputNeverThrows)
{
    LineClassifier classifier;
    const std::string samples[] = {"[", "![](", "***", "|", "```\n```\n```", "> \n>", "- [", "1.", "\r\r\n\n"};
    for (const auto &sample : samples)
        EXPECT_NO_THROW(classifier.classify(sample)) << sample;
}

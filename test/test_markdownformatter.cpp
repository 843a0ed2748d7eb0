#include <gtest/gtest.h>

#include "markdown/markdownformatter.h"
#include "testhelpers.h"

class MarkdownFormatterTest : public ::testing::Test
{
protected:
    MarkdownFormatter formatter;
};

TEST_F(MarkdownFormatterTest, HeadingLevelIsClamped)
{
    EXPECT_EQ(str(formatter.heading(md("Title"))), "# Title\n");
    EXPECT_EQ(str(formatter.heading(md("Deep"), 9)), "###### Deep\n");
    EXPECT_EQ(str(formatter.heading(md("Top"), 0)), "# Top\n");
}

TEST_F(MarkdownFormatterTest, Emphasis)
{
    EXPECT_EQ(str(formatter.bold(md("a*b"))), "**a\\*b**");
    EXPECT_EQ(str(formatter.italic(md("x"))), "*x*");
}

TEST_F(MarkdownFormatterTest, InlineCodeBecomesBlockWhenMultiLine)
{
    EXPECT_EQ(str(formatter.inlineCode(md("id"))), "`id`");
    EXPECT_EQ(str(formatter.inlineCode(md("a\nb"))), "```text\na\nb\n```\n");
    EXPECT_EQ(str(formatter.code(md("x"), md("yaml"))), "```yaml\nx\n```\n");
}

TEST_F(MarkdownFormatterTest, Links)
{
    EXPECT_EQ(str(formatter.link(md("a [b]"), md("https://x.io/(y)"))),
              "[a \\[b\\]](https://x.io/(y\\))");
    const Content badge = formatter.badge(md("CI"), md("https://img.io/ci.svg"));
    EXPECT_EQ(str(badge), "![CI](https://img.io/ci.svg)");
    EXPECT_EQ(str(formatter.link(badge, md("https://ci.io"))),
              "[![CI](https://img.io/ci.svg)](https://ci.io)");
}

TEST_F(MarkdownFormatterTest, Images)
{
    EXPECT_EQ(str(formatter.image(md("logo.png"), md("Logo"))), "![Logo](logo.png)");
    EXPECT_EQ(str(formatter.image(md("logo.png"), md("Logo"), {QStringLiteral("80"), QString()})),
              "<img src=\"logo.png\" width=\"80\" alt=\"Logo\" />");
}

TEST_F(MarkdownFormatterTest, Lists)
{
    EXPECT_EQ(str(formatter.list({md("a"), md("b")})), "- a\n- b\n");
    EXPECT_EQ(str(formatter.list({md("a"), md("b")}, true)), "1. a\n2. b\n");
}

TEST_F(MarkdownFormatterTest, ParagraphIndentsListContinuations)
{
    EXPECT_EQ(str(formatter.paragraph(md("- item\ncontinued\n\nafter"))),
              "- item\n  continued\n\nafter\n");
    EXPECT_EQ(str(formatter.paragraph(md("- item\n```\ncode\n```"))),
              "- item\n```\ncode\n```\n");
    EXPECT_EQ(str(formatter.paragraph(md("- item\n~~~\ncode\n~~~"))),
              "- item\n~~~\ncode\n~~~\n");
}

TEST_F(MarkdownFormatterTest, ParagraphLinksBareUrls)
{
    formatter.setLinkFormat(LinkFormat::Full);
    EXPECT_EQ(str(formatter.paragraph(md("at https://a.io"))), "at [https://a.io](https://a.io)\n");
}

TEST_F(MarkdownFormatterTest, CenterAndComment)
{
    EXPECT_EQ(str(formatter.center(md("\n one \n\n two\n"))),
              "<div align=\"center\">\n  one\n  two\n</div>\n");
    EXPECT_EQ(str(formatter.comment(md(" a <b> "))), "<!-- a &lt;b&gt; -->\n");
    EXPECT_EQ(str(formatter.horizontalRule()), "---\n");
}

TEST_F(MarkdownFormatterTest, TableErrorsPropagate)
{
    const TableLayout::Result result = formatter.table({md("A")}, {{md("1"), md("2")}});
    EXPECT_FALSE(result.valid);
}

TEST_F(MarkdownFormatterTest, SectionMarkers)
{
    EXPECT_EQ(str(formatter.sectionStart(SectionIdentifier::Inputs)), "<!-- inputs:start -->");
    EXPECT_EQ(str(formatter.sectionEnd(SectionIdentifier::Inputs)), "<!-- inputs:end -->");
    EXPECT_EQ(str(formatter.section(SectionIdentifier::Usage, md("\nbody\n"))),
              "<!-- usage:start -->\n\nbody\n\n<!-- usage:end -->\n");
}

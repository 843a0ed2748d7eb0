#include <gtest/gtest.h>

#include "section/sectionidentifier.h"
#include "section/sectionmarkers.h"
#include "testhelpers.h"

using SectionMarkers::Marker;

TEST(SectionIdentifierTest, CanonicalOrderAndNames)
{
    const QList<SectionIdentifier> &all = SectionIdentifiers::all();
    ASSERT_EQ(all.size(), 13);
    EXPECT_EQ(all.first(), SectionIdentifier::Header);
    EXPECT_EQ(all.last(), SectionIdentifier::Generated);
    EXPECT_LT(all.indexOf(SectionIdentifier::Outputs), all.indexOf(SectionIdentifier::License));
    for (const SectionIdentifier id : all)
        EXPECT_EQ(SectionIdentifiers::fromName(SectionIdentifiers::name(id)), id);
    EXPECT_EQ(SectionIdentifiers::fromName(u"  Inputs "), SectionIdentifier::Inputs);
    EXPECT_FALSE(SectionIdentifiers::fromName(u"changelog").has_value());
}

TEST(SectionMarkersTest, RenderedSection)
{
    EXPECT_EQ(str(SectionMarkers::section(SectionIdentifier::Inputs, md("  table  "))),
              "<!-- inputs:start -->\n\ntable\n\n<!-- inputs:end -->\n");
    EXPECT_EQ(str(SectionMarkers::section(SectionIdentifier::License, md(" \n "))),
              "<!-- license:start -->\n<!-- license:end -->\n");
}

TEST(SectionMarkersTest, FindsMarkersTolerantly)
{
    const Content doc = md("x <!--inputs:start--> y <!--  Outputs:end   --> <!-- other:start --> "
                           "<!-- usage:middle -->");
    const QList<Marker> markers = SectionMarkers::findMarkers(doc);
    ASSERT_EQ(markers.size(), 2);
    EXPECT_EQ(markers.at(0).id, SectionIdentifier::Inputs);
    EXPECT_EQ(markers.at(0).kind, Marker::Start);
    EXPECT_EQ(markers.at(0).start, 2);
    EXPECT_EQ(str(doc.slice(markers.at(0).start, markers.at(0).end)), "<!--inputs:start-->");
    EXPECT_EQ(markers.at(1).id, SectionIdentifier::Outputs);
    EXPECT_EQ(markers.at(1).kind, Marker::End);
}

TEST(SectionMarkersTest, ReplacesExistingSection)
{
    const Content doc = md("# Title\n\n<!-- usage:start -->\nold\nlines\n<!-- usage:end -->\n\nTail\n");
    EXPECT_EQ(str(SectionMarkers::applySection(doc, SectionIdentifier::Usage, md("new"))),
              "# Title\n\n<!-- usage:start -->\n\nnew\n\n<!-- usage:end -->\n\nTail\n");
}

TEST(SectionMarkersTest, ApplyingTwiceIsIdempotent)
{
    const Content doc = md("# Title\n\n<!-- usage:start -->\nold\n<!-- usage:end -->\n");
    const Content once = SectionMarkers::applySection(doc, SectionIdentifier::Usage, md("body"));
    const Content twice = SectionMarkers::applySection(once, SectionIdentifier::Usage, md("body"));
    EXPECT_EQ(str(twice), str(once));
}

TEST(SectionMarkersTest, AppendsMissingSection)
{
    EXPECT_EQ(str(SectionMarkers::applySection(md("# Title"), SectionIdentifier::License, md("MIT"))),
              "# Title\n\n<!-- license:start -->\n\nMIT\n\n<!-- license:end -->\n");
    EXPECT_EQ(str(SectionMarkers::applySection(md("# Title\n\n"), SectionIdentifier::License, md("MIT"))),
              "# Title\n\n<!-- license:start -->\n\nMIT\n\n<!-- license:end -->\n");
    EXPECT_EQ(str(SectionMarkers::applySection(Content(), SectionIdentifier::License, md("MIT"))),
              "<!-- license:start -->\n\nMIT\n\n<!-- license:end -->\n");
}

TEST(SectionMarkersTest, UnterminatedSectionKeepsOriginalLines)
{
    const Content doc = md("<!-- usage:start -->\nkeep me\n");
    EXPECT_EQ(str(SectionMarkers::applySection(doc, SectionIdentifier::Usage, md("new"))),
              "<!-- usage:start -->\n\nnew\n\n<!-- usage:end -->\n<!-- usage:start -->\nkeep me\n");
}

TEST(SectionMarkersTest, DuplicateSectionIsDropped)
{
    const Content doc = md("<!-- usage:start -->\na\n<!-- usage:end -->\nmid\n"
                           "<!-- usage:start -->\nb\n<!-- usage:end -->\nend\n");
    EXPECT_EQ(str(SectionMarkers::applySection(doc, SectionIdentifier::Usage, md("new"))),
              "<!-- usage:start -->\n\nnew\n\n<!-- usage:end -->\nmid\nend\n");
}

TEST(SectionMarkersTest, OtherSectionsAreUntouched)
{
    const Content doc = md("<!-- inputs:start -->\nx\n<!-- inputs:end -->\n");
    EXPECT_EQ(str(SectionMarkers::applySection(doc, SectionIdentifier::Outputs, md("o"))),
              "<!-- inputs:start -->\nx\n<!-- inputs:end -->\n\n"
              "<!-- outputs:start -->\n\no\n\n<!-- outputs:end -->\n");
}

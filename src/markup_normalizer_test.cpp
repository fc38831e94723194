#include <gtest/gtest.h>

#include "markup_normalizer.hpp"

TEST(MarkupNormalizer, ConvertsHtmlOnlyWhenFlagged)
{
    EXPECT_EQ(markup_normalizer::normalizeText("<p>A &amp; B</p>", true),
              "A & B");
    EXPECT_EQ(markup_normalizer::normalizeText("<p>A &amp; B</p>", false),
              "<p>A &amp; B</p>");
}

TEST(MarkupNormalizer, HeaderOnlyUnescapesEntities)
{
    // Tags survive; entities do not.
    EXPECT_EQ(markup_normalizer::normalizeHeader("<p>Copyright &lt;year&gt;</p>"),
              "<p>Copyright <year></p>");
}

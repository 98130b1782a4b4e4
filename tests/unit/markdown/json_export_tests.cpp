#include <gtest/gtest.h>

#include "mt/markdown/json_export.hpp"
#include "mt/markdown/parser.hpp"

#include <string>
#include <vector>

using namespace mt::markdown;

TEST(JsonExport, DescribesHeadingAndText)
{
    nlohmann::json tree = toJson(parse("# Hi\n"));
    EXPECT_EQ(tree["type"], "document");
    EXPECT_EQ(tree["location"]["end"]["line"], 2);

    const auto &heading = tree["children"][0];
    EXPECT_EQ(heading["type"], "heading");
    EXPECT_EQ(heading["level"], 1);

    const auto &text = heading["children"][0];
    EXPECT_EQ(text["type"], "text");
    EXPECT_EQ(text["value"], "Hi");
    EXPECT_EQ(text["location"]["start"], (nlohmann::json{{"line", 1}, {"column", 3}, {"offset", 2}}));
}

TEST(JsonExport, UsesSnakeCaseTypeNames)
{
    nlohmann::json tree = toJson(parse("---\n\n```c\nx\n```\n> q\n- a\n1. b\n"));
    const auto &children = tree["children"];
    ASSERT_EQ(children.size(), 6u);
    EXPECT_EQ(children[0]["type"], "thematic_break");
    EXPECT_EQ(children[1]["type"], "blank_line");
    EXPECT_EQ(children[2]["type"], "code_block");
    EXPECT_EQ(children[2]["info"], "c");
    EXPECT_EQ(children[2]["value"], "x\n");
    EXPECT_EQ(children[3]["type"], "block_quote");
    EXPECT_EQ(children[4]["type"], "list");
    EXPECT_EQ(children[4]["ordered"], false);
    EXPECT_FALSE(children[4].contains("start"));
    EXPECT_EQ(children[4]["children"][0]["type"], "list_item");
    EXPECT_EQ(children[4]["children"][0]["marker"], "-");
    EXPECT_EQ(children[5]["ordered"], true);
    EXPECT_EQ(children[5]["start"], 1);
}

TEST(JsonExport, DescribesInlineNodes)
{
    nlohmann::json tree = toJson(parse("*a* **b** `c` [d](/e)\\\nf\ng"));
    const auto &inlines = tree["children"][0]["children"];
    std::vector<std::string> types;
    for (const auto &node : inlines)
        types.push_back(node["type"].get<std::string>());

    const std::vector<std::string> expected = {"emphasis", "text",      "strong", "text", "code_span", "text",
                                               "link",     "hardbreak", "text",   "softbreak", "text"};
    EXPECT_EQ(types, expected);
    EXPECT_EQ(inlines[4]["value"], "c");
    EXPECT_EQ(inlines[6]["destination"], "/e");
    EXPECT_TRUE(inlines[6]["title"].is_null());
    EXPECT_EQ(inlines[6]["children"][0]["value"], "d");
}

TEST(JsonExport, DocumentOffsetsTranslateContainerLocations)
{
    Document document = parse("> hello\n");

    nlohmann::json local = toJson(document);
    const auto &localParagraph = local["children"][0]["children"][0];
    EXPECT_EQ(localParagraph["location"]["start"]["offset"], 0);

    JsonExportOptions options;
    options.documentOffsets = true;
    nlohmann::json global = toJson(document, options);
    const auto &quote = global["children"][0];
    EXPECT_EQ(quote["location"]["start"]["offset"], 0);
    const auto &paragraph = quote["children"][0];
    EXPECT_EQ(paragraph["location"]["start"]["offset"], 2);
    EXPECT_EQ(paragraph["location"]["start"]["column"], 3);
    EXPECT_EQ(paragraph["children"][0]["location"]["end"]["offset"], 7);
}

TEST(JsonExport, DocumentOffsetsInsideNestedItems)
{
    JsonExportOptions options;
    options.documentOffsets = true;
    nlohmann::json tree = toJson(parse("- a\n  - b\n"), options);

    const auto &outerItem = tree["children"][0]["children"][0];
    const auto &innerItem = outerItem["children"][1]["children"][0];
    EXPECT_EQ(innerItem["location"]["start"]["offset"], 6);
    const auto &text = innerItem["children"][0]["children"][0];
    EXPECT_EQ(text["location"]["start"]["offset"], 8);
    EXPECT_EQ(text["location"]["start"]["column"], 5);
}

#include <gtest/gtest.h>
#include "stepview/config/step_record_loader.hpp"
#include "stepview/render/diagram_assembler.hpp"
#include "stepview/render/step_renderer.hpp"

using namespace stepview;

namespace
{

EdgeRef edge(const std::string& step, const std::string& port)
{
    return EdgeRef{StepId{step}, port};
}

size_t count_lines_containing(const std::vector<std::string>& lines, char c)
{
    size_t count = 0;
    for (const auto& line : lines)
    {
        if (line.find(c) != std::string::npos)
        {
            ++count;
        }
    }
    return count;
}

} // namespace

class DiagramAssemblerTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        record.name = "10-step";
        record.inputs = {"a", "b", "c"};
        record.outputs = {"x", "y"};
        record.edges_i["a"] = {edge("S1", "a")};
        record.edges_i["c"] = {edge("S2", "c")};
        record.edges_o["x"] = {edge("6-bar", "x"), edge("5-foo", "x")};
        record.source = "/steps/step";
    }

    StepRecord record;
};

TEST_F(DiagramAssemblerTests, Detailed_FullDiagram)
{
    std::vector<std::string> expected{
        "  +           S1",
        "  +           a",
        "  |          ",
        "  |       +   S2",
        "  |       +   c",
        "  |       |  ",
        "  V       V  ",
        "-------------",
        "| a | b | c |",
        "-------------",
        "|           |",
        "|  10-step  |",
        "|           |",
        "-------------",
        "|  x  |  y  |",
        "-------------",
        "   V         ",
        "   +          5-foo",
        "   +          x",
        "   |         ",
        "   +          6-bar",
        "   +          x",
    };
    EXPECT_EQ(render_diagram_lines(record, RenderOptions{}), expected);
}

TEST_F(DiagramAssemblerTests, Detailed_TextEndsEveryLineWithNewline)
{
    std::string text = render_diagram(record, RenderOptions{});
    ASSERT_FALSE(text.empty());
    EXPECT_EQ(text.back(), '\n');
    EXPECT_EQ(text.rfind("  +           S1\n", 0), 0u);
}

TEST_F(DiagramAssemblerTests, Simple_TwoRowsPerSideRegardlessOfEdges)
{
    RenderOptions options;
    options.simple = true;

    auto with_edges = render_diagram_lines(record, options);
    record.edges_i.clear();
    record.edges_o.clear();
    auto without_edges = render_diagram_lines(record, options);

    EXPECT_EQ(with_edges, without_edges);
    ASSERT_EQ(with_edges.size(), 2u + 9u + 2u);
    EXPECT_EQ(with_edges[0], "  |   |   |  ");
    EXPECT_EQ(with_edges[1], "  V   V   V  ");
    EXPECT_EQ(with_edges[11], "   |     |   ");
    EXPECT_EQ(with_edges[12], "   V     V   ");
}

TEST_F(DiagramAssemblerTests, Simple_EmptyInputList)
{
    record.name = "3-info";
    record.inputs.clear();
    record.outputs = {"out"};
    RenderOptions options;
    options.simple = true;

    std::vector<std::string> expected{
        "",
        "",
        "----------",
        "|        |",
        "----------",
        "|        |",
        "| 3-info |",
        "|        |",
        "----------",
        "|  out   |",
        "----------",
        "    |     ",
        "    V     ",
    };
    EXPECT_EQ(render_diagram_lines(record, options), expected);
}

TEST_F(DiagramAssemblerTests, MissingEdges_BoxOnly)
{
    record.edges_i.clear();
    record.edges_o.clear();

    auto lines = render_diagram_lines(record, RenderOptions{});
    // Blank arrow row, then the nine box rows.
    ASSERT_EQ(lines.size(), 10u);
    EXPECT_EQ(lines[0], "             ");
    EXPECT_EQ(count_lines_containing(lines, '+'), 0u);
    EXPECT_EQ(lines.back(), "-------------");
}

TEST_F(DiagramAssemblerTests, Determinism_IdenticalOutput)
{
    EXPECT_EQ(render_step(record, RenderOptions{}), render_step(record, RenderOptions{}));
}

TEST(StepRendererTests, RenderStep_DiagramThenListing)
{
    StepRecord record = load_step_record_from_string(
        "name: 3-info\n"
        "inputs: [in]\n"
        "edges_i:\n"
        "  in:\n"
        "    - {f: o, step: 1-a}\n"
        "parameters:\n"
        "  order: [main.tcl]\n"
        "source: /steps/info\n");

    std::string expected =
        "    +      1-a\n"
        "    +      o\n"
        "    |     \n"
        "    V     \n"
        "----------\n"
        "|   in   |\n"
        "----------\n"
        "|        |\n"
        "| 3-info |\n"
        "|        |\n"
        "----------\n"
        "|        |\n"
        "----------\n"
        "\n"
        "Parameters\n"
        "\n"
        "- order :\n"
        "    - main.tcl\n"
        "\n"
        "Source: /steps/info\n";
    EXPECT_EQ(render_step(record, RenderOptions{}), expected);
}

TEST(StepRendererTests, RenderStep_MissingCollectionsNoError)
{
    StepRecord record = load_step_record_from_string("name: 2-lonely\nsource: /steps/lonely\n");
    std::string text;
    EXPECT_NO_THROW(text = render_step(record, RenderOptions{}));
    EXPECT_EQ(text.find("Parameters"), std::string::npos);
    EXPECT_EQ(text.find("Flags"), std::string::npos);
    EXPECT_NE(text.find("Source: /steps/lonely\n"), std::string::npos);
}

TEST(StepRendererTests, RenderDiagram_MultiByteNamesStayAligned)
{
    StepRecord record;
    record.name = "s";
    record.inputs = {"d\xC3\xA9sign"};
    record.outputs = {"x"};
    record.edges_i["d\xC3\xA9sign"] = {EdgeRef{StepId{"1-a"}, "o"}};
    record.source = "/s";

    std::vector<std::string> expected{
        "    +      1-a",
        "    +      o",
        "    |     ",
        "    V     ",
        "----------",
        "| d\xC3\xA9sign |",
        "----------",
        "|        |",
        "|   s    |",
        "|        |",
        "----------",
        "|   x    |",
        "----------",
    };
    EXPECT_EQ(render_diagram_lines(record, RenderOptions{}), expected);
}

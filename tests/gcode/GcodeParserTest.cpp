// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "gcode/GcodeParser.h" // The file under test.

#include <memory>
#include <sstream>

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>

#include "Fixtures.h"
#include "LogCapture.h"
#include "gcode/UnsupportedCommandLog.h"

// NOLINTBEGIN(*-magic-numbers)
namespace travel
{

class GcodeParserTest : public testing::Test
{
public:
    Dialect dialect = Dialect::marlin();
    std::ostringstream unsupported_output;
    UnsupportedCommandLog unsupported_log{ std::make_shared<spdlog::sinks::ostream_sink_mt>(unsupported_output) };
    GcodeParser parser{ dialect, &unsupported_log };
};

TEST_F(GcodeParserTest, ClassifiesMoves)
{
    const Command travel = parser.parseLine("G0 X10 Y5 F6000", 1);
    EXPECT_EQ(travel.kind, CommandKind::TRAVEL);
    EXPECT_EQ(travel.code, "G0");
    ASSERT_TRUE(travel.x.has_value());
    EXPECT_DOUBLE_EQ(*travel.x, 10.0);
    EXPECT_DOUBLE_EQ(*travel.f, 6000.0);
    EXPECT_FALSE(travel.z.has_value());

    const Command extrude = parser.parseLine("G1 X20 Y5 E1.5", 2);
    EXPECT_EQ(extrude.kind, CommandKind::EXTRUDE);

    const Command retract = parser.parseLine("G1 E0.5 F2400", 3);
    EXPECT_EQ(retract.kind, CommandKind::TRAVEL) << "A retraction doesn't extrude.";

    const Command unretract = parser.parseLine("G1 E1.5", 4);
    EXPECT_EQ(unretract.kind, CommandKind::EXTRUDE) << "Priming moves the extruder forward.";

    const Command feedrate = parser.parseLine("G1 F1200", 5);
    EXPECT_EQ(feedrate.kind, CommandKind::STATE_CHANGE);

    EXPECT_DOUBLE_EQ(parser.position().x, 20.0);
    EXPECT_DOUBLE_EQ(parser.position().e, 1.5);
    EXPECT_DOUBLE_EQ(parser.position().feedrate, 1200.0);
    EXPECT_EQ(unsupported_log.count(), 0);
}

TEST_F(GcodeParserTest, CommentsAndBlankLines)
{
    EXPECT_EQ(parser.parseLine("", 1).kind, CommandKind::COMMENT);
    EXPECT_EQ(parser.parseLine("   ", 2).kind, CommandKind::COMMENT);
    EXPECT_EQ(parser.parseLine(";LAYER:0", 3).kind, CommandKind::COMMENT);
    EXPECT_EQ(parser.parseLine("(just a comment)", 4).kind, CommandKind::COMMENT);

    const Command commented = parser.parseLine("G1 X5 (halfway) Y6 ; trailing", 5);
    EXPECT_EQ(commented.kind, CommandKind::TRAVEL);
    EXPECT_DOUBLE_EQ(*commented.x, 5.0);
    EXPECT_DOUBLE_EQ(*commented.y, 6.0);
    EXPECT_EQ(commented.raw, "G1 X5 (halfway) Y6 ; trailing") << "The raw text must be kept byte for byte.";
}

TEST_F(GcodeParserTest, NormalisesCodes)
{
    const Command command = parser.parseLine("g01 x1 y2 e0.1", 1);
    EXPECT_EQ(command.code, "G1");
    EXPECT_EQ(command.kind, CommandKind::EXTRUDE);
    EXPECT_DOUBLE_EQ(*command.x, 1.0);
}

TEST_F(GcodeParserTest, LineNumbersAndChecksums)
{
    const Command command = parser.parseLine("N42 G1 X3 Y4*71", 1);
    EXPECT_EQ(command.code, "G1");
    EXPECT_DOUBLE_EQ(*command.x, 3.0);
    EXPECT_DOUBLE_EQ(*command.y, 4.0);
}

TEST_F(GcodeParserTest, UnknownCommands)
{
    const Command unknown = parser.parseLine("M9999 S1", 7);
    EXPECT_EQ(unknown.kind, CommandKind::UNKNOWN);
    EXPECT_EQ(unknown.code, "M9999");

    const Command not_gcode = parser.parseLine("START_PRINT BED=60", 8);
    EXPECT_EQ(not_gcode.kind, CommandKind::UNKNOWN);

    EXPECT_EQ(unsupported_log.count(), 2);
    const std::string logged = unsupported_output.str();
    EXPECT_NE(logged.find("line 7: M9999 S1 (unknown command)"), std::string::npos) << logged;
    EXPECT_NE(logged.find("line 8: START_PRINT BED=60 (not a G-code command)"), std::string::npos) << logged;
}

TEST_F(GcodeParserTest, MalformedMoveIsPassedThrough)
{
    parser.parseLine("G1 X10 Y10", 1);
    const Command malformed = parser.parseLine("G1 X1.2.3 Y5", 2);
    EXPECT_EQ(malformed.kind, CommandKind::UNKNOWN);
    EXPECT_FALSE(malformed.x.has_value());
    EXPECT_DOUBLE_EQ(parser.position().x, 10.0) << "A malformed move must not move the tracked position.";

    const Command missing = parser.parseLine("G1 X Y5", 3);
    EXPECT_EQ(missing.kind, CommandKind::UNKNOWN);
    EXPECT_EQ(unsupported_log.count(), 2);
    EXPECT_NE(unsupported_output.str().find("missing value for X"), std::string::npos);
}

TEST_F(GcodeParserTest, HomeWithoutValues)
{
    parser.parseLine("G1 X10 Y10 Z3", 1);
    const Command home = parser.parseLine("G28 X Y", 2);
    EXPECT_EQ(home.kind, CommandKind::HOME);
    EXPECT_DOUBLE_EQ(parser.position().x, 0.0);
    EXPECT_DOUBLE_EQ(parser.position().y, 0.0);
    EXPECT_DOUBLE_EQ(parser.position().z, 3.0);
}

TEST_F(GcodeParserTest, PassthroughCommands)
{
    const Command temperature = parser.parseLine("M104 S210", 1);
    EXPECT_EQ(temperature.kind, CommandKind::STATE_CHANGE);
    EXPECT_FALSE(temperature.hasAxisWords()) << "Parameters of passthrough commands aren't axis words.";
    EXPECT_EQ(unsupported_log.count(), 0);
}

TEST_F(GcodeParserTest, ModeSwitchWarns)
{
    LogCapture log;
    parser.parseLine("M82", 1);
    parser.parseLine("M83", 2);
    EXPECT_EQ(log.count("switches the extrusion mode"), 1) << log.str();
    EXPECT_FALSE(parser.position().absolute_extrusion);
}

TEST_F(GcodeParserTest, RelativePositioningExtrudes)
{
    std::istringstream in("G91\nG1 Z0.2\nG1 X10 E0.5\nG1 X10 E0.5\nG0 X5 Y5\nG1 X10 E1.0\n");
    const ParsedProgram program = parser.parse(in);
    ASSERT_EQ(program.commands.size(), 6);
    EXPECT_EQ(program.commands[2].kind, CommandKind::EXTRUDE);
    EXPECT_EQ(program.commands[3].kind, CommandKind::EXTRUDE) << "Under G91 every E word is an amount to extrude.";
    EXPECT_EQ(program.commands[4].kind, CommandKind::TRAVEL);
    EXPECT_EQ(program.commands[5].kind, CommandKind::EXTRUDE);
    EXPECT_DOUBLE_EQ(program.positions.back().x, 35.0);
    EXPECT_DOUBLE_EQ(program.positions.back().e, 2.0);
}

TEST_F(GcodeParserTest, ExtrusionModeAfterRelativePositioning)
{
    std::istringstream in("G91\nM82\nG1 X10 E0.5\nG1 X10 E0.5\n");
    const ParsedProgram program = parser.parse(in);
    ASSERT_EQ(program.commands.size(), 4);
    EXPECT_EQ(program.commands[2].kind, CommandKind::EXTRUDE);
    EXPECT_EQ(program.commands[3].kind, CommandKind::TRAVEL) << "M82 keeps E absolute, so the same E value doesn't extrude.";
}

TEST_F(GcodeParserTest, ParseKeepsPositionsAligned)
{
    std::istringstream in("G90\r\nG1 X1 Y0 E1\r\nG92 E0\r\n");
    const ParsedProgram program = parser.parse(in);
    ASSERT_EQ(program.commands.size(), 3);
    ASSERT_EQ(program.positions.size(), 4);
    EXPECT_EQ(program.commands[1].raw, "G1 X1 Y0 E1") << "Carriage returns are stripped.";
    EXPECT_EQ(program.commands[2].line_nr, 3);
    EXPECT_DOUBLE_EQ(program.positions[2].e, 1.0);
    EXPECT_DOUBLE_EQ(program.positions[3].e, 0.0);
    EXPECT_DOUBLE_EQ(program.positions[0].x, 0.0);
}

TEST_F(GcodeParserTest, FixtureExtrusions)
{
    const ParsedProgram program = parseGcode(three_islands_gcode);
    size_t extrusions = 0;
    for (const Command& command : program.commands)
    {
        extrusions += command.kind == CommandKind::EXTRUDE ? 1 : 0;
    }
    EXPECT_EQ(extrusions, 4) << "Three printing moves and one unretraction.";
}

} // namespace travel
// NOLINTEND(*-magic-numbers)

#include "colourlink/colourspace/ColourSpaceCommand.hpp"
#include "colourlink/colourspace/MeasurementParser.hpp"
#include "colourlink/log/Log.hpp"

#include <string>

using namespace colourlink;
using namespace colourlink::colourspace;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { colourlink::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { colourlink::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", _va, " != ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static void testInitProfileBytes() {
    const std::string expected =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" ?>\n"
        "<CS_RMC version=1><command>init profile</command></CS_RMC>";
    ASSERT_EQ(ColourSpaceCommand::initProfile(), expected, "init profile payload");

    ColourSpaceCommand command;
    ASSERT_TRUE(!command.isReady(), "fresh command is empty");
    command.setInitProfileCommand();
    ASSERT_TRUE(command.isReady(), "ready after set");
    ASSERT_EQ(std::string(command.commandName()), std::string("command"), "command element name");
}

static void testMeasurementBytes() {
    const std::string expected =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" ?>\n"
        "<CS_RMC version=1><measurement><red>10</red><green>20</green><blue>30</blue></measurement></CS_RMC>";
    ASSERT_EQ(ColourSpaceCommand::measurement(core::Color::fromComponents(10, 20, 30)), expected,
              "measurement payload");
}

static void testMeasurementIsSentAtEightBit() {
    const auto payload = ColourSpaceCommand::measurement(core::Color::fromComponents(512, 1023, 0, 10));
    ASSERT_TRUE(payload.find("<red>128</red>") != std::string::npos, "10-bit red scaled");
    ASSERT_TRUE(payload.find("<green>255</green>") != std::string::npos, "10-bit green scaled");
    ASSERT_TRUE(payload.find("<blue>0</blue>") != std::string::npos, "zero blue");
}

static void testReuseReplacesPayload() {
    ColourSpaceCommand command;
    command.setMeasurementCommand(core::Color::fromComponents(1, 2, 3));
    command.setMeasurementCommand(core::Color::fromComponents(4, 5, 6));
    ASSERT_TRUE(command.payload().find("<red>1</red>") == std::string::npos, "old body gone");
    ASSERT_TRUE(command.payload().find("<red>4</red>") != std::string::npos, "new body present");
    ASSERT_EQ(std::string(command.commandName()), std::string("measurement"), "name follows body");

    command.reset();
    ASSERT_TRUE(!command.isReady(), "reset clears");
    ASSERT_TRUE(command.payload().empty(), "reset clears payload");
}

static void testOutboundParsesAsInbound() {
    // Our own request read back: one command, no result, scalars echo the fallback.
    const core::Color asked = core::Color::fromComponents(10, 20, 30);
    MeasurementParser parser(asked);
    auto result = parser.parse(ColourSpaceCommand::measurement(asked));
    ASSERT_TRUE(result.has_value(), "request parses");
    if (!result) return;
    ASSERT_EQ(parser.commands().size(), std::size_t{1}, "single command");
    ASSERT_EQ(parser.commands().front(), std::string("measurement"), "command name");
    ASSERT_TRUE(result->shapes.empty(), "no shapes");
    ASSERT_TRUE(result->scalarColor() == asked, "fallback echoed");
}

int main() {
    testInitProfileBytes();
    testMeasurementBytes();
    testMeasurementIsSentAtEightBit();
    testReuseReplacesPayload();
    testOutboundParsesAsInbound();

    if (g_failures) {
        colourlink::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    colourlink::logInfo("ColourSpaceCommand tests passed.\n");
    return 0;
}

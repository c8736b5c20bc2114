#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "domain/TimecodeParser.hpp"
#include "domain/Transcript.hpp"

using namespace podscribe::domain;

namespace {

std::string Rejoin(const std::vector<TimecodeToken>& tokens) {
    std::string out;
    for (const auto& t : tokens) out += t.raw;
    return out;
}

void TestMixedLine() {
    std::cout << "[Test] Mixed literal and timecode tokens..." << std::endl;
    auto tokens = TimecodeParser::Parse("[2:15] a [1:02:03] b");
    assert(tokens.size() == 4);
    assert(tokens[0].isTimecode() && tokens[0].seconds == 135.0 && tokens[0].raw == "[2:15]");
    assert(!tokens[1].isTimecode() && tokens[1].raw == " a ");
    assert(tokens[2].isTimecode() && tokens[2].seconds == 3723.0);
    assert(!tokens[3].isTimecode() && tokens[3].raw == " b");
    std::cout << "[PASS] Mixed tokens" << std::endl;
}

void TestNoTimecodes() {
    std::cout << "[Test] Plain text and empty input..." << std::endl;
    auto tokens = TimecodeParser::Parse("no timecodes");
    assert(tokens.size() == 1);
    assert(!tokens[0].isTimecode() && tokens[0].raw == "no timecodes");
    assert(TimecodeParser::Parse("").empty());
    std::cout << "[PASS] Plain text" << std::endl;
}

void TestMalformedStaysLiteral() {
    std::cout << "[Test] Malformed bracket expressions..." << std::endl;
    const std::string inputs[] = {
        "[2:5] short seconds",
        "[123:45] three digit minutes",
        "[1:2:3] bad",
        "2:15 no brackets",
        "[2:15 unclosed",
        "[[0:30]] doubled",
        "[0:30][0:45]",
        "trailing [9:59]",
        "unicode ümlaut [0:01] ✓"
    };
    for (const auto& input : inputs) {
        assert(Rejoin(TimecodeParser::Parse(input)) == input);
    }
    assert(TimecodeParser::Parse("[2:5]").size() == 1);
    assert(!TimecodeParser::Parse("[2:5]")[0].isTimecode());

    auto doubled = TimecodeParser::Parse("[[0:30]]");
    assert(doubled.size() == 3 && doubled[1].isTimecode() && doubled[1].seconds == 30.0);

    auto adjacent = TimecodeParser::Parse("[0:30][0:45]");
    assert(adjacent.size() == 2 && adjacent[0].seconds == 30.0 && adjacent[1].seconds == 45.0);
    std::cout << "[PASS] Malformed input preserved" << std::endl;
}

void TestLinesAndFirstTimecode() {
    std::cout << "[Test] Line splitting and first timecode..." << std::endl;
    auto lines = TimecodeParser::ParseLines("- Intro\n- [0:05] Welcome [0:09]\n- [10:00] End");
    assert(lines.size() == 3);
    assert(!TimecodeParser::FirstTimecode(lines[0]));
    assert(*TimecodeParser::FirstTimecode(lines[1]) == 5.0);
    assert(*TimecodeParser::FirstTimecode(lines[2]) == 600.0);
    std::cout << "[PASS] Lines" << std::endl;
}

void TestToSeconds() {
    std::cout << "[Test] Clock conversion..." << std::endl;
    assert(*TimecodeParser::ToSeconds("0:00") == 0.0);
    assert(*TimecodeParser::ToSeconds("59:59") == 3599.0);
    assert(*TimecodeParser::ToSeconds("1:00:00") == 3600.0);
    assert(!TimecodeParser::ToSeconds("abc"));
    assert(!TimecodeParser::ToSeconds("1:02:03:04"));
    assert(!TimecodeParser::ToSeconds(""));
    std::cout << "[PASS] Clock conversion" << std::endl;
}

void TestFormatClock() {
    std::cout << "[Test] Clock formatting..." << std::endl;
    assert(FormatClock(0) == "0:00");
    assert(FormatClock(65) == "1:05");
    assert(FormatClock(3599.9) == "59:59");
    assert(FormatClock(3723) == "1:02:03");
    assert(FormatClock(-5) == "0:00");
    assert(FormatClock(std::nan("")) == "--:--");
    assert(FormatClock(1e300) == "99999:59:59");
    assert(FormatClock(359999999.0) == "99999:59:59");

    TranscriptSegment segment;
    segment.startOffset = 135.0;
    assert(segment.formattedTime() == "2:15");
    assert(*TimecodeParser::ToSeconds(segment.formattedTime()) == 135.0);
    std::cout << "[PASS] Clock formatting" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting TimecodeParser tests..." << std::endl;
    TestMixedLine();
    TestNoTimecodes();
    TestMalformedStaysLiteral();
    TestLinesAndFirstTimecode();
    TestToSeconds();
    TestFormatClock();
    std::cout << "[PASS] All TimecodeParser tests passed." << std::endl;
    return 0;
}

/**
 * @file TimecodeParser.cpp
 * @brief Implementation of TimecodeParser and clock formatting.
 */

#include "domain/TimecodeParser.hpp"
#include "domain/Transcript.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <regex>
#include <sstream>

namespace podscribe::domain {

namespace {

const std::regex& TimecodePattern() {
    static const std::regex pattern(R"(\[(\d{1,2}:\d{2}(?::\d{2})?)\])");
    return pattern;
}

TimecodeToken MakeText(std::string raw) {
    TimecodeToken token;
    token.kind = TimecodeToken::Kind::Text;
    token.raw = std::move(raw);
    return token;
}

} // namespace

std::vector<TimecodeToken> TimecodeParser::Parse(const std::string& text) {
    std::vector<TimecodeToken> tokens;
    if (text.empty()) return tokens;

    std::size_t lastEnd = 0;
    auto begin = std::sregex_iterator(text.begin(), text.end(), TimecodePattern());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const std::smatch& match = *it;
        const auto matchStart = static_cast<std::size_t>(match.position(0));

        auto seconds = ToSeconds(match.str(1));
        if (!seconds) continue; // left inside the surrounding literal span

        if (matchStart > lastEnd) {
            tokens.push_back(MakeText(text.substr(lastEnd, matchStart - lastEnd)));
        }

        TimecodeToken token;
        token.kind = TimecodeToken::Kind::Timecode;
        token.raw = match.str(0);
        token.seconds = *seconds;
        tokens.push_back(std::move(token));

        lastEnd = matchStart + static_cast<std::size_t>(match.length(0));
    }

    if (lastEnd < text.size()) {
        tokens.push_back(MakeText(text.substr(lastEnd)));
    }
    return tokens;
}

std::vector<std::vector<TimecodeToken>> TimecodeParser::ParseLines(const std::string& text) {
    std::vector<std::vector<TimecodeToken>> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        lines.push_back(Parse(line));
    }
    return lines;
}

std::optional<double> TimecodeParser::FirstTimecode(const std::vector<TimecodeToken>& tokens) {
    for (const auto& token : tokens) {
        if (token.isTimecode()) return token.seconds;
    }
    return std::nullopt;
}

std::optional<double> TimecodeParser::ToSeconds(const std::string& clock) {
    std::vector<int> parts;
    std::stringstream ss(clock);
    std::string part;
    while (std::getline(ss, part, ':')) {
        if (part.empty() || part.size() > 2) return std::nullopt;
        for (char c : part) {
            if (c < '0' || c > '9') return std::nullopt;
        }
        parts.push_back(std::stoi(part));
    }

    switch (parts.size()) {
        case 2:
            return static_cast<double>(parts[0] * 60 + parts[1]);
        case 3:
            return static_cast<double>(parts[0] * 3600 + parts[1] * 60 + parts[2]);
        default:
            return std::nullopt;
    }
}

std::string FormatClock(double seconds) {
    if (!std::isfinite(seconds)) return "--:--";

    // 99999:59:59; larger values do not fit the integral conversion below.
    constexpr double kMaxClockSeconds = 359999999.0;
    const long total = static_cast<long>(std::clamp(seconds, 0.0, kMaxClockSeconds));
    const long hours = total / 3600;
    const long minutes = (total % 3600) / 60;
    const long secs = total % 60;

    char buffer[32];
    if (hours > 0) {
        std::snprintf(buffer, sizeof(buffer), "%ld:%02ld:%02ld", hours, minutes, secs);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%ld:%02ld", minutes, secs);
    }
    return buffer;
}

std::string TranscriptSegment::formattedTime() const {
    return FormatClock(startOffset);
}

} // namespace podscribe::domain

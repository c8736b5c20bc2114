/**
 * @file TimecodeParser.hpp
 * @brief Extraction of [MM:SS] / [H:MM:SS] markers from generated text.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace podscribe::domain {

/**
 * @struct TimecodeToken
 * @brief Either a literal span of text or a bracketed timecode.
 *
 * raw always holds the exact substring of the input, so joining the raw text of
 * every token reproduces the input.
 */
struct TimecodeToken {
    enum class Kind { Text, Timecode };

    Kind kind = Kind::Text;
    std::string raw;
    double seconds = 0.0; ///< Only meaningful for Kind::Timecode.

    bool isTimecode() const { return kind == Kind::Timecode; }
};

/**
 * @brief Stateless parser. Never fails: anything that is not a well formed timecode is literal text.
 */
class TimecodeParser {
public:
    /** @brief Tokenizes the whole string. Empty input yields no tokens. */
    static std::vector<TimecodeToken> Parse(const std::string& text);

    /** @brief Splits on '\n' and tokenizes each line. */
    static std::vector<std::vector<TimecodeToken>> ParseLines(const std::string& text);

    /** @brief Seconds of the first timecode token, if any. */
    static std::optional<double> FirstTimecode(const std::vector<TimecodeToken>& tokens);

    /** @brief Converts "M:SS" or "H:MM:SS" (no brackets) to seconds. */
    static std::optional<double> ToSeconds(const std::string& clock);
};

/**
 * @brief Formats seconds as M:SS, or H:MM:SS from one hour up. Non-finite input gives "--:--".
 */
std::string FormatClock(double seconds);

} // namespace podscribe::domain

/**
 * @file Episode.hpp
 * @brief Episode metadata as produced by the feed parser.
 */

#pragma once

#include <optional>
#include <string>

namespace podscribe::domain {

/**
 * @struct Episode
 * @brief Immutable description of a single podcast episode.
 *
 * An episode without a media locator is listed but cannot be played or transcribed.
 */
struct Episode {
    std::string id;
    std::string title;
    std::string description;
    std::optional<std::string> mediaLocator;
    std::string publishedAt;   ///< Display string, as found in the feed.
    std::string durationLabel; ///< Display string, as found in the feed.
    std::string artworkLocator;

    bool isPlayable() const { return mediaLocator.has_value() && !mediaLocator->empty(); }
};

} // namespace podscribe::domain

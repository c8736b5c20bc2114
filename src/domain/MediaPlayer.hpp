/**
 * @file MediaPlayer.hpp
 * @brief Interface to the platform media layer that actually renders audio.
 */

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace podscribe::domain {

/**
 * @class MediaPlayer
 * @brief Opaque playable-media abstraction. Decoding and output live behind it.
 *
 * Seeks are requests: the new position is reported later through the periodic observer.
 */
class MediaPlayer {
public:
    virtual ~MediaPlayer() = default;

    enum class Readiness { Pending, Ready, Failed };

    /** @brief Callback invoked on the media layer's timer with the current position in seconds. */
    using PositionCallback = std::function<void(double seconds)>;
    using ObserverToken = int;

    /**
     * @brief Replaces the current media item. Throws on an unusable locator.
     * @param locator Network address or file path of the audio.
     */
    virtual void load(const std::string& locator) = 0;

    /** @brief Releases the current media item. */
    virtual void unload() = 0;

    virtual void play() = 0;
    virtual void pause() = 0;

    /** @brief Requests a move to an absolute position in seconds. */
    virtual void seek(double seconds) = 0;

    virtual double currentPosition() const = 0;

    /** @brief Whether the loaded item can report its duration yet. */
    virtual Readiness readiness() const = 0;

    /** @brief Duration of the loaded item, once ready. nullopt if it cannot be determined. */
    virtual std::optional<double> loadDuration() = 0;

    virtual ObserverToken addPeriodicObserver(std::chrono::milliseconds interval, PositionCallback callback) = 0;

    /** @brief No callback for the token runs after this returns. */
    virtual void removeObserver(ObserverToken token) = 0;
};

} // namespace podscribe::domain

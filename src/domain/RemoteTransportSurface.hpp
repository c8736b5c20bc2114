/**
 * @file RemoteTransportSurface.hpp
 * @brief Lock-screen / media-key style integration, both directions.
 */

#pragma once

#include <functional>

#include "domain/PlaybackState.hpp"

namespace podscribe::domain {

/**
 * @struct RemoteCommand
 * @brief A transport command coming from outside the application.
 */
struct RemoteCommand {
    enum class Type {
        Play,
        Pause,
        TogglePlayPause,
        SkipForward,
        SkipBackward,
        ChangePlaybackPosition
    };

    Type type = Type::Play;
    double positionSeconds = 0.0; ///< Used by ChangePlaybackPosition only.
};

/**
 * @class RemoteTransportSurface
 * @brief Displays now-playing info and forwards remote commands to a single handler.
 */
class RemoteTransportSurface {
public:
    virtual ~RemoteTransportSurface() = default;

    /** @brief Returns false when the command could not be honoured. */
    using CommandHandler = std::function<bool(const RemoteCommand&)>;

    virtual void publish(const NowPlayingInfo& info) = 0;

    /** @brief Installs the handler; nullptr unregisters it. */
    virtual void setCommandHandler(CommandHandler handler) = 0;
};

} // namespace podscribe::domain

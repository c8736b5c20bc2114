/**
 * @file PlaybackEngine.hpp
 * @brief Transport state machine for episode playback.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "application/BackgroundPoller.hpp"
#include "application/StateChannel.hpp"
#include "domain/Episode.hpp"
#include "domain/MediaPlayer.hpp"
#include "domain/PlaybackState.hpp"
#include "domain/RemoteTransportSurface.hpp"

namespace podscribe::application {

/**
 * @struct PlaybackConfig
 * @brief Tunables for the engine. Loaded from the "playback" section of settings.json.
 */
struct PlaybackConfig {
    double skipForwardSeconds = 30.0;
    double skipBackwardSeconds = 15.0;
    std::chrono::milliseconds positionInterval{500};
    PollPolicy durationPoll{};
    std::string fallbackTitle = "Podscribe";
};

/**
 * @class PlaybackEngine
 * @brief Single source of truth for what is playing and where.
 *
 * Owns the PlaybackState and the media session (observer subscription and duration
 * resolution worker). Every state change is pushed to the remote transport surface,
 * and commands from that surface are routed back through the same operations.
 * Failures degrade to no-ops; nothing here throws to the caller.
 */
class PlaybackEngine {
public:
    using Listener = StateChannel<domain::PlaybackState>::Listener;
    using ListenerId = StateChannel<domain::PlaybackState>::ListenerId;

    PlaybackEngine(std::shared_ptr<domain::MediaPlayer> player,
                   std::shared_ptr<domain::RemoteTransportSurface> surface,
                   PlaybackConfig config = {});
    ~PlaybackEngine();

    PlaybackEngine(const PlaybackEngine&) = delete;
    PlaybackEngine& operator=(const PlaybackEngine&) = delete;

    /**
     * @brief Starts an episode, or resumes it if it is already the active one.
     *
     * Episodes without a media locator are ignored.
     */
    void play(const domain::Episode& episode);

    void pause();
    void resume();
    void togglePlayPause();

    /**
     * @brief Seeks to a fraction of the duration. No-op while the duration is unknown.
     * @param progressFraction Clamped into [0, 1].
     */
    void seek(double progressFraction);

    /**
     * @brief Seeks to an absolute position. While the duration is unknown the target is
     * kept and applied once it resolves for the current media session.
     */
    void seekToPosition(double seconds);

    void skipForward();
    void skipForward(double seconds);
    void skipBackward();
    void skipBackward(double seconds);

    domain::PlaybackState state() const;
    double playbackProgress() const;

    /** @brief True when a media session exists for this episode id. */
    bool isActive(const std::string& episodeId) const;

    /** @brief Listeners may run with engine locks held; they must not call back into the engine. */
    ListenerId subscribe(Listener listener);
    void unsubscribe(ListenerId id);

    /** @brief Entry point for the remote transport surface. */
    bool handleRemoteCommand(const domain::RemoteCommand& command);

    const PlaybackConfig& config() const { return m_config; }

private:
    void teardownSession();
    void startDurationResolution(std::uint64_t generation);
    void onPositionTick(std::uint64_t generation, double seconds);
    void onMediaResolved(std::uint64_t generation, bool resolved);
    void seekRelative(double deltaSeconds);
    void publishNowPlaying();

    std::shared_ptr<domain::MediaPlayer> m_player;
    std::shared_ptr<domain::RemoteTransportSurface> m_surface;
    PlaybackConfig m_config;

    StateChannel<domain::PlaybackState> m_state;

    // Serializes play() so that two session replacements never interleave.
    std::mutex m_transitionMutex;
    // Guards the session fields below and every call into m_player.
    mutable std::mutex m_sessionMutex;
    std::atomic<std::uint64_t> m_generation{0};
    bool m_hasSession = false;
    bool m_mediaResolved = false;
    std::optional<domain::MediaPlayer::ObserverToken> m_observer;
    std::optional<double> m_pendingSeek;

    BackgroundPoller m_durationPoller;
};

} // namespace podscribe::application

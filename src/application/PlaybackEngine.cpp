/**
 * @file PlaybackEngine.cpp
 * @brief Implementation of PlaybackEngine.
 */

#include "application/PlaybackEngine.hpp"
#include "domain/TimecodeParser.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace podscribe::application {

using domain::MediaPlayer;
using domain::PlaybackState;
using domain::RemoteCommand;
using domain::TransportPhase;

PlaybackEngine::PlaybackEngine(std::shared_ptr<domain::MediaPlayer> player,
                               std::shared_ptr<domain::RemoteTransportSurface> surface,
                               PlaybackConfig config)
    : m_player(std::move(player))
    , m_surface(std::move(surface))
    , m_config(std::move(config)) {
    if (m_surface) {
        m_surface->setCommandHandler([this](const RemoteCommand& command) {
            return handleRemoteCommand(command);
        });
    }
}

PlaybackEngine::~PlaybackEngine() {
    if (m_surface) {
        m_surface->setCommandHandler(nullptr);
    }
    bool hadSession = false;
    {
        std::lock_guard<std::mutex> lock(m_sessionMutex);
        hadSession = m_hasSession;
    }
    teardownSession();
    if (hadSession) {
        m_player->unload();
    }
}

void PlaybackEngine::play(const domain::Episode& episode) {
    if (!episode.isPlayable()) {
        std::cout << "[PlaybackEngine] Episode '" << episode.title << "' has no media locator, ignoring play" << std::endl;
        return;
    }

    std::lock_guard<std::mutex> transition(m_transitionMutex);

    if (isActive(episode.id)) {
        resume();
        return;
    }

    teardownSession();

    std::uint64_t generation = 0;
    bool loaded = true;
    {
        std::lock_guard<std::mutex> lock(m_sessionMutex);
        generation = ++m_generation;

        try {
            m_player->load(*episode.mediaLocator);
        } catch (const std::exception& e) {
            std::cerr << "[PlaybackEngine] Media unavailable for '" << episode.title << "': " << e.what() << std::endl;
            loaded = false;
        }

        if (loaded) {
            m_state.update([&episode](PlaybackState& s) {
                s.episode = episode;
                s.phase = TransportPhase::Loading;
                s.position = 0.0;
                s.duration = 0.0;
                return true;
            });

            m_player->play();
            m_hasSession = true;
            m_mediaResolved = false;
            m_observer = m_player->addPeriodicObserver(m_config.positionInterval, [this, generation](double seconds) {
                onPositionTick(generation, seconds);
            });
        } else {
            m_state.update([](PlaybackState& s) {
                s = PlaybackState{};
                return true;
            });
        }
    }

    if (!loaded) {
        publishNowPlaying();
        return;
    }

    std::cout << "[PlaybackEngine] Loading '" << episode.title << "' from " << *episode.mediaLocator << std::endl;
    startDurationResolution(generation);
    publishNowPlaying();
}

void PlaybackEngine::pause() {
    {
        std::lock_guard<std::mutex> lock(m_sessionMutex);
        if (!m_hasSession) return;
        m_player->pause();
        m_state.update([](PlaybackState& s) {
            if (s.phase == TransportPhase::Paused) return false;
            s.phase = TransportPhase::Paused;
            return true;
        });
    }
    publishNowPlaying();
}

void PlaybackEngine::resume() {
    {
        std::lock_guard<std::mutex> lock(m_sessionMutex);
        if (!m_hasSession) return;
        m_player->play();
        const TransportPhase target = m_mediaResolved ? TransportPhase::Playing : TransportPhase::Loading;
        m_state.update([target](PlaybackState& s) {
            if (s.phase == target) return false;
            s.phase = target;
            return true;
        });
    }
    publishNowPlaying();
}

void PlaybackEngine::togglePlayPause() {
    const TransportPhase phase = m_state.snapshot().phase;
    if (phase == TransportPhase::Playing || phase == TransportPhase::Loading) {
        pause();
    } else {
        resume();
    }
}

void PlaybackEngine::seek(double progressFraction) {
    {
        std::lock_guard<std::mutex> lock(m_sessionMutex);
        if (!m_hasSession) return;
        const double duration = m_state.snapshot().duration;
        if (duration <= 0.0 || std::isnan(progressFraction)) return;
        m_player->seek(std::clamp(progressFraction, 0.0, 1.0) * duration);
    }
    publishNowPlaying();
}

void PlaybackEngine::seekToPosition(double seconds) {
    {
        std::lock_guard<std::mutex> lock(m_sessionMutex);
        if (!m_hasSession || std::isnan(seconds)) return;
        const double duration = m_state.snapshot().duration;
        if (duration <= 0.0) {
            m_pendingSeek = std::max(seconds, 0.0);
            return;
        }
        m_player->seek(std::clamp(seconds, 0.0, duration));
    }
    publishNowPlaying();
}

void PlaybackEngine::skipForward() {
    skipForward(m_config.skipForwardSeconds);
}

void PlaybackEngine::skipForward(double seconds) {
    seekRelative(seconds);
}

void PlaybackEngine::skipBackward() {
    skipBackward(m_config.skipBackwardSeconds);
}

void PlaybackEngine::skipBackward(double seconds) {
    seekRelative(-seconds);
}

void PlaybackEngine::seekRelative(double deltaSeconds) {
    {
        std::lock_guard<std::mutex> lock(m_sessionMutex);
        if (!m_hasSession) return;
        double target = std::max(m_player->currentPosition() + deltaSeconds, 0.0);
        const double duration = m_state.snapshot().duration;
        if (duration > 0.0) {
            target = std::min(target, duration);
        }
        m_player->seek(target);
    }
    publishNowPlaying();
}

PlaybackState PlaybackEngine::state() const {
    return m_state.snapshot();
}

double PlaybackEngine::playbackProgress() const {
    return m_state.snapshot().progress();
}

bool PlaybackEngine::isActive(const std::string& episodeId) const {
    std::lock_guard<std::mutex> lock(m_sessionMutex);
    if (!m_hasSession) return false;
    const auto snapshot = m_state.snapshot();
    return snapshot.episode && snapshot.episode->id == episodeId;
}

PlaybackEngine::ListenerId PlaybackEngine::subscribe(Listener listener) {
    return m_state.subscribe(std::move(listener));
}

void PlaybackEngine::unsubscribe(ListenerId id) {
    m_state.unsubscribe(id);
}

bool PlaybackEngine::handleRemoteCommand(const RemoteCommand& command) {
    {
        std::lock_guard<std::mutex> lock(m_sessionMutex);
        if (!m_hasSession) return false;
    }

    switch (command.type) {
        case RemoteCommand::Type::Play:
            resume();
            break;
        case RemoteCommand::Type::Pause:
            pause();
            break;
        case RemoteCommand::Type::TogglePlayPause:
            togglePlayPause();
            break;
        case RemoteCommand::Type::SkipForward:
            skipForward();
            break;
        case RemoteCommand::Type::SkipBackward:
            skipBackward();
            break;
        case RemoteCommand::Type::ChangePlaybackPosition: {
            const double duration = m_state.snapshot().duration;
            seek(command.positionSeconds / std::max(duration, 1.0));
            break;
        }
    }
    return true;
}

void PlaybackEngine::teardownSession() {
    std::optional<MediaPlayer::ObserverToken> observer;
    {
        std::lock_guard<std::mutex> lock(m_sessionMutex);
        ++m_generation;
        observer = m_observer;
        m_observer.reset();
        m_pendingSeek.reset();
        m_hasSession = false;
        m_mediaResolved = false;
    }
    if (observer) {
        m_player->removeObserver(*observer);
    }
    m_durationPoller.cancel();
}

void PlaybackEngine::startDurationResolution(std::uint64_t generation) {
    auto player = m_player;
    m_durationPoller.start(
        m_config.durationPoll,
        [player] { return player->readiness() != MediaPlayer::Readiness::Pending; },
        [this, generation](bool resolved) { onMediaResolved(generation, resolved); });
}

void PlaybackEngine::onPositionTick(std::uint64_t generation, double seconds) {
    m_state.update([this, generation, seconds](PlaybackState& s) {
        if (generation != m_generation.load() || s.phase == TransportPhase::Idle) return false;
        double position = std::isfinite(seconds) ? std::max(seconds, 0.0) : 0.0;
        if (s.duration > 0.0) {
            position = std::min(position, s.duration);
        }
        if (position == s.position) return false;
        s.position = position;
        return true;
    });
}

void PlaybackEngine::onMediaResolved(std::uint64_t generation, bool resolved) {
    {
        std::lock_guard<std::mutex> lock(m_sessionMutex);
        if (generation != m_generation.load()) return;

        double duration = 0.0;
        if (resolved && m_player->readiness() == MediaPlayer::Readiness::Ready) {
            try {
                auto loaded = m_player->loadDuration();
                if (loaded && std::isfinite(*loaded) && *loaded > 0.0) {
                    duration = *loaded;
                }
            } catch (const std::exception& e) {
                std::cerr << "[PlaybackEngine] Duration lookup failed: " << e.what() << std::endl;
            }
        } else {
            std::cerr << "[PlaybackEngine] Media did not become ready, duration unknown" << std::endl;
        }

        m_mediaResolved = true;
        m_state.update([duration](PlaybackState& s) {
            s.duration = duration;
            if (duration > 0.0) {
                s.position = std::min(s.position, duration);
            }
            if (s.phase == TransportPhase::Loading) {
                s.phase = TransportPhase::Playing;
            }
            return true;
        });

        if (m_pendingSeek && duration > 0.0) {
            m_player->seek(std::clamp(*m_pendingSeek, 0.0, duration));
        }
        m_pendingSeek.reset();

        std::cout << "[PlaybackEngine] Duration resolved: " << domain::FormatClock(duration) << ", now "
                  << domain::TransportPhaseToString(m_state.snapshot().phase) << std::endl;
    }
    publishNowPlaying();
}

void PlaybackEngine::publishNowPlaying() {
    if (!m_surface) return;

    const PlaybackState snapshot = m_state.snapshot();
    domain::NowPlayingInfo info;
    info.title = snapshot.episode ? snapshot.episode->title : m_config.fallbackTitle;
    info.elapsed = snapshot.position;
    info.duration = snapshot.duration;
    info.rate = snapshot.isPlaying() ? 1.0 : 0.0;
    m_surface->publish(info);
}

} // namespace podscribe::application

/**
 * @file PlaybackState.hpp
 * @brief Transport state owned by the playback engine.
 */

#pragma once

#include <algorithm>
#include <optional>
#include <string>

#include "domain/Episode.hpp"

namespace podscribe::domain {

enum class TransportPhase {
    Idle,
    Loading,
    Playing,
    Paused
};

inline const char* TransportPhaseToString(TransportPhase phase) {
    switch (phase) {
        case TransportPhase::Idle: return "Idle";
        case TransportPhase::Loading: return "Loading";
        case TransportPhase::Playing: return "Playing";
        case TransportPhase::Paused: return "Paused";
    }
    return "Unknown";
}

/**
 * @struct PlaybackState
 * @brief Snapshot of what is playing and where. A duration of 0 means "unknown".
 */
struct PlaybackState {
    std::optional<Episode> episode;
    TransportPhase phase = TransportPhase::Idle;
    double position = 0.0;
    double duration = 0.0;

    double progress() const {
        if (duration <= 0.0) return 0.0;
        return std::clamp(position / duration, 0.0, 1.0);
    }

    bool isPlaying() const { return phase == TransportPhase::Playing; }
};

/**
 * @struct NowPlayingInfo
 * @brief What the external transport surface (lock screen, media keys) displays.
 */
struct NowPlayingInfo {
    std::string title;
    double elapsed = 0.0;
    double duration = 0.0;
    double rate = 0.0;
};

} // namespace podscribe::domain

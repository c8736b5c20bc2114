/**
 * @file SdlMediaPlayer.hpp
 * @brief MediaPlayer that decodes a whole episode up front and plays it through SDL2 audio.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "domain/ContentFetcher.hpp"
#include "domain/MediaPlayer.hpp"

namespace podscribe::infrastructure {

class SdlMediaPlayer : public domain::MediaPlayer {
public:
    /**
     * @param fetcher Used for remote locators; local paths are decoded in place.
     * @param tempDirectory Where remote audio is staged. Empty means the system temp dir.
     */
    SdlMediaPlayer(std::shared_ptr<domain::ContentFetcher> fetcher, std::string tempDirectory = "");
    ~SdlMediaPlayer() override;

    SdlMediaPlayer(const SdlMediaPlayer&) = delete;
    SdlMediaPlayer& operator=(const SdlMediaPlayer&) = delete;

    void load(const std::string& locator) override;
    void unload() override;
    void play() override;
    void pause() override;
    void seek(double seconds) override;
    double currentPosition() const override;
    Readiness readiness() const override;
    std::optional<double> loadDuration() override;
    ObserverToken addPeriodicObserver(std::chrono::milliseconds interval, PositionCallback callback) override;
    void removeObserver(ObserverToken token) override;

    /** @brief False when no audio device could be opened. Position then stays where it was. */
    bool hasOutput() const { return m_device != 0; }

private:
    /** Decoding result shared with the loader thread, which may outlive a replaced track. */
    struct Track {
        std::mutex mutex;
        std::atomic<bool> cancelled{false};
        Readiness readiness = Readiness::Pending;
        std::vector<float> pcm;
    };

    struct Observer {
        std::thread thread;
        std::mutex mutex;
        std::condition_variable cv;
        bool stopped = false;
    };

    static void AudioCallback(void* userdata, std::uint8_t* stream, int len);
    void fill(float* out, int samples);

    static void LoadTrack(std::shared_ptr<Track> track,
                          std::shared_ptr<domain::ContentFetcher> fetcher,
                          std::string locator,
                          std::string tempDirectory);

    std::shared_ptr<domain::ContentFetcher> m_fetcher;
    std::string m_tempDirectory;
    bool m_audioInitialized = false;
    std::uint32_t m_device = 0;

    mutable std::mutex m_mutex;
    std::shared_ptr<Track> m_track;
    std::size_t m_cursor = 0;
    bool m_playing = false;

    std::mutex m_observersMutex;
    std::map<ObserverToken, std::shared_ptr<Observer>> m_observers;
    ObserverToken m_nextToken = 1;
};

} // namespace podscribe::infrastructure

/**
 * @file SdlMediaPlayer.cpp
 * @brief Implementation of SdlMediaPlayer.
 */

#include "infrastructure/SdlMediaPlayer.hpp"
#include "infrastructure/AudioUtils.hpp"
#include "domain/Errors.hpp"

#include <SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>

namespace podscribe::infrastructure {

namespace fs = std::filesystem;
using domain::CoreError;
using domain::ErrorKind;

namespace {

bool IsRemote(const std::string& locator) {
    return locator.find("://") != std::string::npos && locator.rfind("file://", 0) != 0;
}

std::string LocalPath(const std::string& locator) {
    return locator.rfind("file://", 0) == 0 ? locator.substr(7) : locator;
}

} // namespace

SdlMediaPlayer::SdlMediaPlayer(std::shared_ptr<domain::ContentFetcher> fetcher, std::string tempDirectory)
    : m_fetcher(std::move(fetcher))
    , m_tempDirectory(std::move(tempDirectory))
{
    if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0) {
        std::cerr << "[SdlMediaPlayer] SDL audio init failed: " << SDL_GetError() << std::endl;
        return;
    }
    m_audioInitialized = true;

    SDL_AudioSpec want;
    SDL_zero(want);
    want.freq = AudioUtils::kTargetSampleRate;
    want.format = AUDIO_F32SYS;
    want.channels = 1;
    want.samples = 2048;
    want.callback = &SdlMediaPlayer::AudioCallback;
    want.userdata = this;

    m_device = SDL_OpenAudioDevice(nullptr, 0, &want, nullptr, 0);
    if (m_device == 0) {
        std::cerr << "[SdlMediaPlayer] No audio output: " << SDL_GetError() << std::endl;
    }
}

SdlMediaPlayer::~SdlMediaPlayer() {
    std::vector<ObserverToken> tokens;
    {
        std::lock_guard<std::mutex> lock(m_observersMutex);
        for (const auto& entry : m_observers) tokens.push_back(entry.first);
    }
    for (auto token : tokens) {
        removeObserver(token);
    }

    unload();
    if (m_device != 0) {
        SDL_CloseAudioDevice(m_device);
    }
    if (m_audioInitialized) {
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
    }
}

void SdlMediaPlayer::load(const std::string& locator) {
    if (locator.empty()) {
        throw CoreError(ErrorKind::MediaUnavailable, "Empty media locator");
    }
    if (!IsRemote(locator) && !fs::exists(LocalPath(locator))) {
        throw CoreError(ErrorKind::MediaUnavailable, "No such file: " + locator);
    }
    if (IsRemote(locator) && !m_fetcher) {
        throw CoreError(ErrorKind::MediaUnavailable, "No fetcher for remote media: " + locator);
    }

    unload();

    auto track = std::make_shared<Track>();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_track = track;
        m_cursor = 0;
    }

    // Decoding can take a while; readiness() reports when it is done.
    std::thread(&SdlMediaPlayer::LoadTrack, track, m_fetcher, locator, m_tempDirectory).detach();
}

void SdlMediaPlayer::LoadTrack(std::shared_ptr<Track> track,
                               std::shared_ptr<domain::ContentFetcher> fetcher,
                               std::string locator,
                               std::string tempDirectory) {
    std::string path = LocalPath(locator);
    fs::path staged;
    std::string error;
    std::vector<float> pcm;
    bool ok = true;

    if (IsRemote(locator)) {
        fs::path dir = tempDirectory.empty() ? fs::temp_directory_path() : fs::path(tempDirectory);
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        staged = dir / ("podscribe-play-" + std::to_string(stamp) + fs::path(path.substr(0, path.find('?'))).extension().string());
        try {
            fetcher->fetchToFile(locator, staged.string(), [&track](std::uint64_t, std::uint64_t) {
                return !track->cancelled.load();
            });
            path = staged.string();
        } catch (const std::exception& e) {
            error = e.what();
            ok = false;
        }
    }

    if (ok && !track->cancelled.load()) {
        ok = AudioUtils::LoadPcm(path, pcm, error);
    }

    if (!staged.empty()) {
        std::error_code ec;
        fs::remove(staged, ec);
    }

    if (track->cancelled.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(track->mutex);
    if (ok) {
        track->pcm = std::move(pcm);
        track->readiness = Readiness::Ready;
        std::cout << "[SdlMediaPlayer] Decoded " << locator << " ("
                  << track->pcm.size() / AudioUtils::kTargetSampleRate << "s)" << std::endl;
    } else {
        track->readiness = Readiness::Failed;
        std::cerr << "[SdlMediaPlayer] Failed to load " << locator << ": " << error << std::endl;
    }
}

void SdlMediaPlayer::unload() {
    if (m_device != 0) {
        SDL_PauseAudioDevice(m_device, 1);
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_track) {
        m_track->cancelled = true;
        m_track.reset();
    }
    m_cursor = 0;
    m_playing = false;
}

void SdlMediaPlayer::play() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_track) return;
        m_playing = true;
    }
    if (m_device != 0) {
        SDL_PauseAudioDevice(m_device, 0);
    }
}

void SdlMediaPlayer::pause() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_playing = false;
    }
    if (m_device != 0) {
        SDL_PauseAudioDevice(m_device, 1);
    }
}

void SdlMediaPlayer::seek(double seconds) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_track) return;
    std::size_t target = static_cast<std::size_t>(std::max(0.0, seconds) * AudioUtils::kTargetSampleRate);
    {
        std::lock_guard<std::mutex> trackLock(m_track->mutex);
        if (m_track->readiness == Readiness::Ready) {
            target = std::min(target, m_track->pcm.size());
        }
    }
    m_cursor = target;
}

double SdlMediaPlayer::currentPosition() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<double>(m_cursor) / AudioUtils::kTargetSampleRate;
}

domain::MediaPlayer::Readiness SdlMediaPlayer::readiness() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_track) return Readiness::Failed;
    std::lock_guard<std::mutex> trackLock(m_track->mutex);
    return m_track->readiness;
}

std::optional<double> SdlMediaPlayer::loadDuration() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_track) return std::nullopt;
    std::lock_guard<std::mutex> trackLock(m_track->mutex);
    if (m_track->readiness != Readiness::Ready || m_track->pcm.empty()) {
        return std::nullopt;
    }
    return static_cast<double>(m_track->pcm.size()) / AudioUtils::kTargetSampleRate;
}

void SdlMediaPlayer::AudioCallback(void* userdata, std::uint8_t* stream, int len) {
    auto* self = static_cast<SdlMediaPlayer*>(userdata);
    self->fill(reinterpret_cast<float*>(stream), len / static_cast<int>(sizeof(float)));
}

void SdlMediaPlayer::fill(float* out, int samples) {
    std::fill(out, out + samples, 0.0f);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_playing || !m_track) return;

    std::lock_guard<std::mutex> trackLock(m_track->mutex);
    if (m_track->readiness != Readiness::Ready) return;

    const auto& pcm = m_track->pcm;
    if (m_cursor >= pcm.size()) return;
    const std::size_t count = std::min(static_cast<std::size_t>(samples), pcm.size() - m_cursor);
    std::memcpy(out, pcm.data() + m_cursor, count * sizeof(float));
    m_cursor += count;
}

domain::MediaPlayer::ObserverToken SdlMediaPlayer::addPeriodicObserver(std::chrono::milliseconds interval,
                                                                      PositionCallback callback) {
    auto observer = std::make_shared<Observer>();
    ObserverToken token = 0;
    {
        std::lock_guard<std::mutex> lock(m_observersMutex);
        token = m_nextToken++;
        m_observers[token] = observer;
    }

    // The thread holds its own reference so a detached observer outlives removal.
    observer->thread = std::thread([this, observer, interval, callback]() {
        std::unique_lock<std::mutex> lock(observer->mutex);
        while (!observer->cv.wait_for(lock, interval, [&observer] { return observer->stopped; })) {
            lock.unlock();
            callback(currentPosition());
            lock.lock();
        }
    });
    return token;
}

void SdlMediaPlayer::removeObserver(ObserverToken token) {
    std::shared_ptr<Observer> observer;
    {
        std::lock_guard<std::mutex> lock(m_observersMutex);
        auto it = m_observers.find(token);
        if (it == m_observers.end()) return;
        observer = it->second;
        m_observers.erase(it);
    }

    {
        std::lock_guard<std::mutex> lock(observer->mutex);
        observer->stopped = true;
    }
    observer->cv.notify_all();

    if (observer->thread.get_id() == std::this_thread::get_id()) {
        // Removed from its own callback; the loop exits once the callback returns.
        observer->thread.detach();
    } else if (observer->thread.joinable()) {
        observer->thread.join();
    }
}

} // namespace podscribe::infrastructure

#include "infrastructure/AudioUtils.hpp"
#include <SDL.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace podscribe::infrastructure {

int AudioUtils::ExecCmd(const std::string& cmd) {
    return std::system(cmd.c_str());
}

bool AudioUtils::ConvertAudioToWav(const std::string& inputPath, std::string& outputPath, std::string& error) {
    namespace fs = std::filesystem;
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = fs::temp_directory_path() /
        (fs::path(inputPath).stem().string() + "_" + std::to_string(stamp) + "_16k.wav");
    outputPath = tempPath.string();

    std::string cmd = "ffmpeg -y -loglevel error -i \"" + inputPath + "\" -ar 16000 -ac 1 -c:a pcm_s16le \"" + outputPath + "\"";

    int ret = ExecCmd(cmd);
    if (ret != 0) {
        error = "ffmpeg could not convert the audio. Check that ffmpeg is installed.";
        std::error_code ec;
        fs::remove(tempPath, ec);
        return false;
    }

    if (!fs::exists(outputPath)) {
        error = "Converted file not found: " + outputPath;
        return false;
    }

    return true;
}

bool AudioUtils::LoadAudioSDL(const std::string& fname, std::vector<float>& pcmf32, std::string& error) {
    SDL_AudioSpec wavSpec;
    Uint32 wavLength;
    Uint8 *wavBuffer;

    if (SDL_LoadWAV(fname.c_str(), &wavSpec, &wavBuffer, &wavLength) == NULL) {
        error = "SDL_LoadWAV failed: " + std::string(SDL_GetError());
        return false;
    }

    SDL_AudioSpec targetSpec;
    SDL_zero(targetSpec);
    targetSpec.freq = kTargetSampleRate;
    targetSpec.format = AUDIO_F32SYS;
    targetSpec.channels = 1;

    SDL_AudioCVT cvt;
    if (SDL_BuildAudioCVT(&cvt, wavSpec.format, wavSpec.channels, wavSpec.freq,
                          targetSpec.format, targetSpec.channels, targetSpec.freq) < 0) {
        error = "SDL_BuildAudioCVT failed: " + std::string(SDL_GetError());
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    cvt.len = wavLength;
    cvt.buf = (Uint8 *)SDL_malloc(cvt.len * cvt.len_mult);
    if (!cvt.buf) {
        error = "Out of memory while converting audio";
        SDL_FreeWAV(wavBuffer);
        return false;
    }
    SDL_memcpy(cvt.buf, wavBuffer, wavLength);

    if (SDL_ConvertAudio(&cvt) < 0) {
        error = "SDL_ConvertAudio failed: " + std::string(SDL_GetError());
        SDL_free(cvt.buf);
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    int sampleCount = cvt.len_cvt / sizeof(float);
    pcmf32.resize(sampleCount);
    SDL_memcpy(pcmf32.data(), cvt.buf, cvt.len_cvt);

    SDL_free(cvt.buf);
    SDL_FreeWAV(wavBuffer);

    return true;
}

bool AudioUtils::LoadPcm(const std::string& inputPath, std::vector<float>& pcmf32, std::string& error) {
    namespace fs = std::filesystem;

    if (!fs::exists(inputPath)) {
        error = "Audio file not found: " + inputPath;
        return false;
    }

    std::string ext = fs::path(inputPath).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".wav") {
        return LoadAudioSDL(inputPath, pcmf32, error);
    }

    std::string wavPath;
    if (!ConvertAudioToWav(inputPath, wavPath, error)) {
        return false;
    }
    bool ok = LoadAudioSDL(wavPath, pcmf32, error);

    std::error_code ec;
    fs::remove(wavPath, ec);
    if (ec) {
        std::cerr << "[AudioUtils] Could not remove " << wavPath << ": " << ec.message() << std::endl;
    }
    return ok;
}

} // namespace podscribe::infrastructure

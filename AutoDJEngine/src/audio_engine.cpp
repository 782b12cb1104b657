#include "autodj_engine.h"
#include "autodj_internal.h"
#include "logging.h"
#include <portaudio.h>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

namespace autodj {

// Global engine state
EngineState* g_engine = nullptr;

namespace {

// Throttle position callbacks (every ~10 callbacks = ~100ms at 512 samples)
const int kPositionCallbackInterval = 10;

bool validDeck(int deck_id) {
    return g_engine && deck_id >= 0 && deck_id <= 1;
}

DeckId toDeckId(int deck_id) {
    return deck_id == 0 ? DeckId::A : DeckId::B;
}

double engineClock(const EngineState* engine) {
    if (engine->sample_rate <= 0) return 0.0;
    return static_cast<double>(engine->frames_rendered.load()) / engine->sample_rate;
}

int copyString(const std::string& value, char* out, int out_size) {
    if (!out || out_size <= 0) return -1;
    if (static_cast<int>(value.size()) >= out_size) return -1;
    memcpy(out, value.c_str(), value.size() + 1);
    return 0;
}

// Read-modify-write of the scheduler settings; clamping happens in setSettings
template <typename Fn>
void updateSettings(Fn fn) {
    if (!g_engine) return;
    std::lock_guard<std::mutex> lock(g_engine->api_mutex);
    MixSettings settings = g_engine->party->settings();
    fn(&settings);
    g_engine->party->setSettings(settings);
}

} // namespace

// PortAudio callback
static int audioCallback(
    const void* inputBuffer,
    void* outputBuffer,
    unsigned long framesPerBuffer,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData)
{
    (void)inputBuffer;
    (void)timeInfo;
    (void)statusFlags;

    EngineState* engine = static_cast<EngineState*>(userData);
    float* output = static_cast<float*>(outputBuffer);

    // Mix both decks; fade volumes are already set on the decks by the scheduler
    engine->mixer->mix(
        engine->decks[0].get(),
        engine->decks[1].get(),
        output,
        static_cast<int>(framesPerBuffer)
    );

    engine->frames_rendered += static_cast<int64_t>(framesPerBuffer);

    engine->callback_counter++;
    if (engine->callback_counter >= kPositionCallbackInterval) {
        engine->callback_counter = 0;

        if (engine->position_callback) {
            auto callback = reinterpret_cast<position_callback_t>(engine->position_callback);
            callback(0, engine->decks[0]->getPosition());
            callback(1, engine->decks[1]->getPosition());
        }
    }

    return paContinue;
}

} // namespace autodj

// C API Implementation
extern "C" {

AUTODJ_API int engine_init(int sample_rate, int buffer_size) {
    if (autodj::g_engine) {
        return -1;  // Already initialized
    }
    if (sample_rate <= 0 || buffer_size <= 0) {
        AUTODJ_LOG_ERROR("engine_init: invalid sample rate %d or buffer size %d", sample_rate, buffer_size);
        return -1;
    }

    // Initialize PortAudio
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        AUTODJ_LOG_ERROR("Pa_Initialize failed: %s", Pa_GetErrorText(err));
        return -1;
    }

    // Create engine state
    autodj::g_engine = new autodj::EngineState();
    autodj::EngineState* engine = autodj::g_engine;
    engine->sample_rate = sample_rate;
    engine->buffer_size = buffer_size;
    engine->stream = nullptr;
    engine->frames_rendered = 0;
    engine->position_callback = nullptr;
    engine->track_skipped_callback = nullptr;
    engine->callback_counter = 0;

    // Create decks
    engine->decks[0] = std::make_unique<autodj::Deck>(sample_rate);
    engine->decks[1] = std::make_unique<autodj::Deck>(sample_rate);

    engine->mixer = std::make_unique<autodj::Mixer>();
    engine->player = std::make_unique<autodj::EngineDeckPlayer>(engine->decks[0].get(),
                                                                engine->decks[1].get());
    engine->party = std::make_unique<autodj::PartyScheduler>(&engine->library, engine->player.get());

    engine->party->setSkipNotifier([engine](const std::string& track_id, const std::string& reason) {
        if (engine->track_skipped_callback) {
            auto callback = reinterpret_cast<track_skipped_callback_t>(engine->track_skipped_callback);
            callback(track_id.c_str(), reason.c_str());
        }
    });

    AUTODJ_LOG_INFO("Engine initialized at %d Hz, buffer %d", sample_rate, buffer_size);
    return 0;
}

AUTODJ_API void engine_shutdown() {
    if (!autodj::g_engine) return;

    engine_stop();

    {
        std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
        autodj::g_engine->party->stop();
    }

    delete autodj::g_engine;
    autodj::g_engine = nullptr;

    Pa_Terminate();
}

AUTODJ_API int engine_start() {
    if (!autodj::g_engine || autodj::g_engine->stream) {
        return -1;
    }

    PaStreamParameters outputParams;
    outputParams.device = Pa_GetDefaultOutputDevice();

    if (outputParams.device == paNoDevice) {
        AUTODJ_LOG_ERROR("No default audio output device");
        return -1;
    }

    const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(outputParams.device);
    outputParams.channelCount = 2;
    outputParams.sampleFormat = paFloat32;
    outputParams.suggestedLatency = deviceInfo->defaultLowOutputLatency;
    outputParams.hostApiSpecificStreamInfo = nullptr;

    PaStream* stream = nullptr;
    PaError err = Pa_OpenStream(
        &stream,
        nullptr,  // No input
        &outputParams,
        autodj::g_engine->sample_rate,
        autodj::g_engine->buffer_size,
        paClipOff,
        autodj::audioCallback,
        autodj::g_engine
    );

    if (err != paNoError) {
        AUTODJ_LOG_ERROR("Pa_OpenStream failed: %s", Pa_GetErrorText(err));
        return -1;
    }

    err = Pa_StartStream(stream);
    if (err != paNoError) {
        AUTODJ_LOG_ERROR("Pa_StartStream failed: %s", Pa_GetErrorText(err));
        Pa_CloseStream(stream);
        return -1;
    }

    autodj::g_engine->stream = stream;
    AUTODJ_LOG_INFO("Audio output started on %s", deviceInfo->name);
    return 0;
}

AUTODJ_API void engine_stop() {
    if (!autodj::g_engine || !autodj::g_engine->stream) return;

    PaStream* stream = static_cast<PaStream*>(autodj::g_engine->stream);
    Pa_StopStream(stream);
    Pa_CloseStream(stream);
    autodj::g_engine->stream = nullptr;
}

// Logging
AUTODJ_API int engine_set_log_file(const char* file_path) {
    return autodj::setLogFile(file_path) ? 0 : -1;
}

AUTODJ_API void engine_set_log_level(int level) {
    if (level < 0) level = 0;
    if (level > 3) level = 3;
    autodj::setLogLevel(static_cast<autodj::LogLevel>(level));
}

// Track library
AUTODJ_API int library_import(const char* file_path, int analyze_bpm, char* out_id, int out_id_size) {
    if (!autodj::g_engine || !file_path) return -1;

    autodj::ImportOptions options;
    options.analyze_bpm = analyze_bpm != 0;

    // Decode and analysis run outside the lock; only the insert is serialized
    autodj::Track track;
    if (!autodj::TrackLibrary::analyzeFile(file_path, options, &track)) {
        return -1;
    }

    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    std::string id;
    if (!autodj::g_engine->library.addTrack(track, &id)) {
        return -1;
    }
    AUTODJ_LOG_INFO("Imported %s as %s: duration=%.2fs trueEnd=%.2fs bpm=%.1f",
                    file_path, id.c_str(), track.duration, track.true_end_time, track.bpm);

    if (out_id && copyString(id, out_id, out_id_size) != 0) {
        AUTODJ_LOG_WARN("library_import: id buffer too small for %s", id.c_str());
    }
    return 0;
}

AUTODJ_API int library_remove(const char* track_id) {
    if (!autodj::g_engine || !track_id) return -1;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    return autodj::g_engine->library.remove(track_id) ? 0 : -1;
}

AUTODJ_API int library_track_count() {
    if (!autodj::g_engine) return 0;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    return static_cast<int>(autodj::g_engine->library.size());
}

AUTODJ_API int library_get_track_id(int index, char* out_id, int out_id_size) {
    if (!autodj::g_engine) return -1;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    const std::vector<autodj::Track>& tracks = autodj::g_engine->library.tracks();
    if (index < 0 || index >= static_cast<int>(tracks.size())) return -1;
    return copyString(tracks[index].id, out_id, out_id_size);
}

AUTODJ_API double library_get_bpm(const char* track_id) {
    if (!autodj::g_engine || !track_id) return 0.0;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    const autodj::Track* track = autodj::g_engine->library.find(track_id);
    return (track && track->hasBpm()) ? track->bpm : 0.0;
}

AUTODJ_API double library_get_duration(const char* track_id) {
    if (!autodj::g_engine || !track_id) return 0.0;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    const autodj::Track* track = autodj::g_engine->library.find(track_id);
    return track ? track->duration : 0.0;
}

AUTODJ_API double library_get_true_end_time(const char* track_id) {
    if (!autodj::g_engine || !track_id) return -1.0;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    const autodj::Track* track = autodj::g_engine->library.find(track_id);
    return (track && track->hasTrueEndTime()) ? track->true_end_time : -1.0;
}

AUTODJ_API int library_set_bpm(const char* track_id, double bpm) {
    if (!autodj::g_engine || !track_id) return -1;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    return autodj::g_engine->library.setBpm(track_id, bpm) ? 0 : -1;
}

AUTODJ_API int library_set_true_end_time(const char* track_id, double seconds) {
    if (!autodj::g_engine || !track_id) return -1;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    return autodj::g_engine->library.setTrueEndTime(track_id, seconds) ? 0 : -1;
}

// Party mode settings
AUTODJ_API int party_load_settings(const char* file_path) {
    if (!autodj::g_engine || !file_path) return -1;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    autodj::MixSettings settings = autodj::g_engine->party->settings();
    if (!autodj::loadMixSettings(file_path, &settings)) {
        return -1;
    }
    autodj::g_engine->party->setSettings(settings);
    return 0;
}

AUTODJ_API int party_save_settings(const char* file_path) {
    if (!autodj::g_engine || !file_path) return -1;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    return autodj::saveMixSettings(file_path, autodj::g_engine->party->settings()) ? 0 : -1;
}

AUTODJ_API void party_reset_timing() {
    autodj::updateSettings([](autodj::MixSettings* s) { autodj::resetMixTiming(s); });
}

AUTODJ_API void party_set_next_song_start_offset(double seconds) {
    autodj::updateSettings([seconds](autodj::MixSettings* s) { s->next_song_start_offset = seconds; });
}

AUTODJ_API void party_set_end_early_seconds(double seconds) {
    autodj::updateSettings([seconds](autodj::MixSettings* s) { s->end_early_seconds = seconds; });
}

AUTODJ_API void party_set_crossfade_seconds(double seconds) {
    autodj::updateSettings([seconds](autodj::MixSettings* s) { s->crossfade_seconds = seconds; });
}

AUTODJ_API void party_set_max_tempo_percent(double percent) {
    autodj::updateSettings([percent](autodj::MixSettings* s) { s->max_tempo_percent = percent; });
}

AUTODJ_API int party_set_tempo_mode(const char* mode) {
    if (!autodj::g_engine || !mode) return -1;
    autodj::TempoMode parsed;
    if (!autodj::parseTempoMode(mode, &parsed)) {
        AUTODJ_LOG_WARN("Unknown tempo mode '%s'", mode);
        return -1;
    }
    autodj::updateSettings([parsed](autodj::MixSettings* s) { s->tempo_mode = parsed; });
    return 0;
}

AUTODJ_API int party_set_tempo_preset(const char* preset) {
    if (!autodj::g_engine || !preset) return -1;
    // Unknown keys resolve to the original preset
    const autodj::TempoPreset parsed = autodj::parseTempoPreset(preset);
    autodj::updateSettings([parsed](autodj::MixSettings* s) { s->tempo_preset = parsed; });
    return 0;
}

AUTODJ_API void party_set_tempo_control_enabled(int enabled) {
    autodj::updateSettings([enabled](autodj::MixSettings* s) { s->tempo_control_enabled = enabled != 0; });
}

AUTODJ_API void party_set_loop_playlist(int enabled) {
    autodj::updateSettings([enabled](autodj::MixSettings* s) { s->loop_playlist = enabled != 0; });
}

AUTODJ_API void party_set_prepare_lead_seconds(double seconds) {
    autodj::updateSettings([seconds](autodj::MixSettings* s) { s->prepare_lead_seconds = seconds; });
}

// Party mode commands
AUTODJ_API int party_start(const char** track_ids, int count, int start_index) {
    if (!autodj::g_engine) return -1;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);

    std::vector<std::string> ids;
    if (track_ids) {
        for (int i = 0; i < count; i++) {
            if (track_ids[i]) ids.push_back(track_ids[i]);
        }
    } else {
        for (const autodj::Track& track : autodj::g_engine->library.tracks()) {
            ids.push_back(track.id);
        }
    }

    return autodj::g_engine->party->start(ids, start_index) ? 0 : -1;
}

AUTODJ_API void party_stop() {
    if (!autodj::g_engine) return;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    autodj::g_engine->party->stop();
}

AUTODJ_API void party_play() {
    if (!autodj::g_engine) return;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    autodj::g_engine->party->play();
}

AUTODJ_API void party_pause() {
    if (!autodj::g_engine) return;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    autodj::g_engine->party->pause(autodj::engineClock(autodj::g_engine));
}

AUTODJ_API void party_skip() {
    if (!autodj::g_engine) return;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    autodj::g_engine->party->skip(autodj::engineClock(autodj::g_engine));
}

AUTODJ_API int party_play_next(int queue_index) {
    if (!autodj::g_engine) return -1;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    return autodj::g_engine->party->playNext(queue_index) ? 0 : -1;
}

AUTODJ_API int party_play_now(int queue_index) {
    if (!autodj::g_engine) return -1;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    return autodj::g_engine->party->playNow(queue_index, autodj::engineClock(autodj::g_engine)) ? 0 : -1;
}

AUTODJ_API int party_restart() {
    if (!autodj::g_engine) return -1;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    return autodj::g_engine->party->restart(autodj::engineClock(autodj::g_engine)) ? 0 : -1;
}

AUTODJ_API int party_move_track(int from_index, int to_index) {
    if (!autodj::g_engine) return -1;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    return autodj::g_engine->party->moveTrack(from_index, to_index) ? 0 : -1;
}

AUTODJ_API void party_shuffle_upcoming(unsigned int seed) {
    if (!autodj::g_engine) return;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    autodj::g_engine->party->shuffleUpcoming(seed);
}

AUTODJ_API void party_tick() {
    if (!autodj::g_engine) return;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    autodj::g_engine->party->tick(autodj::engineClock(autodj::g_engine));
}

// Party mode status
AUTODJ_API int party_get_state() {
    if (!autodj::g_engine) return AUTODJ_PARTY_IDLE;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    switch (autodj::g_engine->party->state()) {
        case autodj::PartyState::Idle: return AUTODJ_PARTY_IDLE;
        case autodj::PartyState::Playing: return AUTODJ_PARTY_PLAYING;
        case autodj::PartyState::PreparingNext: return AUTODJ_PARTY_PREPARING_NEXT;
        case autodj::PartyState::Crossfading: return AUTODJ_PARTY_CROSSFADING;
    }
    return AUTODJ_PARTY_IDLE;
}

AUTODJ_API int party_is_paused() {
    if (!autodj::g_engine) return 0;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    return autodj::g_engine->party->isPaused() ? 1 : 0;
}

AUTODJ_API int party_get_active_deck() {
    if (!autodj::g_engine) return 0;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    return autodj::deckIndex(autodj::g_engine->party->activeDeck());
}

AUTODJ_API int party_get_now_playing_index() {
    if (!autodj::g_engine) return -1;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    if (autodj::g_engine->party->state() == autodj::PartyState::Idle) return -1;
    return autodj::g_engine->party->queue().now_playing_index;
}

AUTODJ_API int party_get_tempo_zone() {
    if (!autodj::g_engine) return -1;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    if (!autodj::g_engine->party->hasTempoDecision()) return -1;
    return static_cast<int>(autodj::g_engine->party->lastTempoDecision().zone);
}

AUTODJ_API double party_get_tempo_shift_pct() {
    if (!autodj::g_engine) return 0.0;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    if (!autodj::g_engine->party->hasTempoDecision()) return 0.0;
    return autodj::g_engine->party->lastTempoDecision().required_shift_pct;
}

// Deck readouts
AUTODJ_API double deck_get_position(int deck_id) {
    if (!autodj::validDeck(deck_id)) return 0.0;
    return autodj::g_engine->decks[deck_id]->getPosition();
}

AUTODJ_API double deck_get_duration(int deck_id) {
    if (!autodj::validDeck(deck_id)) return 0.0;
    return autodj::g_engine->decks[deck_id]->getDuration();
}

AUTODJ_API double deck_get_rate(int deck_id) {
    if (!autodj::validDeck(deck_id)) return 1.0;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    return autodj::g_engine->party->deck(autodj::toDeckId(deck_id)).playback_rate;
}

AUTODJ_API float deck_get_volume(int deck_id) {
    if (!autodj::validDeck(deck_id)) return 0.0f;
    return autodj::g_engine->decks[deck_id]->getVolume();
}

AUTODJ_API int deck_is_playing(int deck_id) {
    if (!autodj::validDeck(deck_id)) return 0;
    return autodj::g_engine->decks[deck_id]->isPlaying() ? 1 : 0;
}

AUTODJ_API int deck_set_rate(int deck_id, double rate) {
    if (!autodj::validDeck(deck_id)) return -1;
    std::lock_guard<std::mutex> lock(autodj::g_engine->api_mutex);
    return autodj::g_engine->party->setDeckRate(autodj::toDeckId(deck_id), rate) ? 0 : -1;
}

// Callbacks
AUTODJ_API void set_position_callback(position_callback_t callback) {
    if (!autodj::g_engine) return;
    autodj::g_engine->position_callback = reinterpret_cast<void*>(callback);
}

AUTODJ_API void set_track_skipped_callback(track_skipped_callback_t callback) {
    if (!autodj::g_engine) return;
    autodj::g_engine->track_skipped_callback = reinterpret_cast<void*>(callback);
}

} // extern "C"

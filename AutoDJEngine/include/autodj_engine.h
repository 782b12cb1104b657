#ifndef AUTODJ_ENGINE_H
#define AUTODJ_ENGINE_H

#ifdef __cplusplus
extern "C" {
#endif

#if defined(_WIN32)
  #ifdef AUTODJ_ENGINE_EXPORTS
    #define AUTODJ_API __declspec(dllexport)
  #else
    #define AUTODJ_API __declspec(dllimport)
  #endif
#else
  #define AUTODJ_API __attribute__((visibility("default")))
#endif

// Engine lifecycle
AUTODJ_API int engine_init(int sample_rate, int buffer_size);
AUTODJ_API void engine_shutdown();
AUTODJ_API int engine_start();
AUTODJ_API void engine_stop();

// Logging (level: 0 = error, 1 = warn, 2 = info, 3 = debug)
AUTODJ_API int engine_set_log_file(const char* file_path);  // NULL logs to stderr
AUTODJ_API void engine_set_log_level(int level);

// Track library
AUTODJ_API int library_import(const char* file_path, int analyze_bpm, char* out_id, int out_id_size);
AUTODJ_API int library_remove(const char* track_id);
AUTODJ_API int library_track_count();
AUTODJ_API int library_get_track_id(int index, char* out_id, int out_id_size);
AUTODJ_API double library_get_bpm(const char* track_id);             // 0 when unknown
AUTODJ_API double library_get_duration(const char* track_id);
AUTODJ_API double library_get_true_end_time(const char* track_id);   // -1 when unknown
AUTODJ_API int library_set_bpm(const char* track_id, double bpm);
AUTODJ_API int library_set_true_end_time(const char* track_id, double seconds);  // < 0 clears

// Party mode settings
AUTODJ_API int party_load_settings(const char* file_path);
AUTODJ_API int party_save_settings(const char* file_path);
AUTODJ_API void party_reset_timing();
AUTODJ_API void party_set_next_song_start_offset(double seconds);  // 0 - 60
AUTODJ_API void party_set_end_early_seconds(double seconds);       // 0 - 60
AUTODJ_API void party_set_crossfade_seconds(double seconds);       // 1 - 20
AUTODJ_API void party_set_max_tempo_percent(double percent);       // <= 1 is read as a fraction
AUTODJ_API int party_set_tempo_mode(const char* mode);             // "auto", "locked", "original"
AUTODJ_API int party_set_tempo_preset(const char* preset);         // "original", "chill", ...
AUTODJ_API void party_set_tempo_control_enabled(int enabled);
AUTODJ_API void party_set_loop_playlist(int enabled);
AUTODJ_API void party_set_prepare_lead_seconds(double seconds);

// Party mode commands. A NULL track list queues the whole library in import order.
AUTODJ_API int party_start(const char** track_ids, int count, int start_index);
AUTODJ_API void party_stop();
AUTODJ_API void party_play();
AUTODJ_API void party_pause();
AUTODJ_API void party_skip();
AUTODJ_API int party_play_next(int queue_index);
AUTODJ_API int party_play_now(int queue_index);
AUTODJ_API int party_restart();
AUTODJ_API int party_move_track(int from_index, int to_index);
AUTODJ_API void party_shuffle_upcoming(unsigned int seed);

// Advance the scheduler to the engine clock; call from the host loop (~10 Hz or faster)
AUTODJ_API void party_tick();

// Party mode status
#define AUTODJ_PARTY_IDLE 0
#define AUTODJ_PARTY_PLAYING 1
#define AUTODJ_PARTY_PREPARING_NEXT 2
#define AUTODJ_PARTY_CROSSFADING 3

AUTODJ_API int party_get_state();
AUTODJ_API int party_is_paused();
AUTODJ_API int party_get_active_deck();          // 0 = Deck A, 1 = Deck B
AUTODJ_API int party_get_now_playing_index();
AUTODJ_API int party_get_tempo_zone();           // 0 green .. 3 red, -1 before the first transition
AUTODJ_API double party_get_tempo_shift_pct();   // required shift of the last transition

// Deck readouts (deck_id: 0 = Deck A, 1 = Deck B)
AUTODJ_API double deck_get_position(int deck_id);
AUTODJ_API double deck_get_duration(int deck_id);
AUTODJ_API double deck_get_rate(int deck_id);
AUTODJ_API float deck_get_volume(int deck_id);
AUTODJ_API int deck_is_playing(int deck_id);
AUTODJ_API int deck_set_rate(int deck_id, double rate);  // 0.5 - 2.0

// Callbacks (for UI updates)
typedef void (*position_callback_t)(int deck_id, double position);
typedef void (*track_skipped_callback_t)(const char* track_id, const char* reason);
AUTODJ_API void set_position_callback(position_callback_t callback);
AUTODJ_API void set_track_skipped_callback(track_skipped_callback_t callback);

#ifdef __cplusplus
}
#endif

#endif // AUTODJ_ENGINE_H

// Command-line host for the AutoDJ engine: imports the given files, starts
// party mode and drives it until the queue finishes.
//
//   autodj_play [--settings file.json] [--log-level 0-3] [--log-file path]
//               [--no-loop] [--no-bpm] track1.mp3 track2.flac ...

#include "autodj_engine.h"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void onSignal(int) {
    g_interrupted = 1;
}

void onTrackSkipped(const char* track_id, const char* reason) {
    fprintf(stderr, "Skipped %s: %s\n", track_id, reason);
}

const char* stateName(int state) {
    switch (state) {
        case AUTODJ_PARTY_PLAYING: return "playing";
        case AUTODJ_PARTY_PREPARING_NEXT: return "preparing";
        case AUTODJ_PARTY_CROSSFADING: return "crossfading";
        default: return "idle";
    }
}

void printUsage(const char* program) {
    fprintf(stderr,
            "Usage: %s [--settings file.json] [--log-level 0-3] [--log-file path]\n"
            "          [--no-loop] [--no-bpm] track...\n",
            program);
}

} // namespace

int main(int argc, char** argv) {
    const char* settings_path = nullptr;
    const char* log_path = nullptr;
    int log_level = -1;
    bool loop = true;
    bool analyze_bpm = true;
    std::vector<const char*> files;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--settings") == 0 && i + 1 < argc) {
            settings_path = argv[++i];
        } else if (strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            log_level = atoi(argv[++i]);
        } else if (strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            log_path = argv[++i];
        } else if (strcmp(argv[i], "--no-loop") == 0) {
            loop = false;
        } else if (strcmp(argv[i], "--no-bpm") == 0) {
            analyze_bpm = false;
        } else if (strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-') {
            fprintf(stderr, "Unknown option %s\n", argv[i]);
            printUsage(argv[0]);
            return 2;
        } else {
            files.push_back(argv[i]);
        }
    }

    if (files.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    if (engine_init(44100, 512) != 0) {
        fprintf(stderr, "Could not initialize the audio engine\n");
        return 1;
    }

    if (log_level >= 0) engine_set_log_level(log_level);
    if (log_path && engine_set_log_file(log_path) != 0) {
        fprintf(stderr, "Could not open log file %s\n", log_path);
    }

    set_track_skipped_callback(onTrackSkipped);

    if (settings_path && party_load_settings(settings_path) != 0) {
        fprintf(stderr, "Could not load settings from %s, using defaults\n", settings_path);
    }
    party_set_loop_playlist(loop ? 1 : 0);

    std::vector<std::string> ids;
    for (const char* file : files) {
        char id[64];
        if (library_import(file, analyze_bpm ? 1 : 0, id, sizeof(id)) != 0) {
            fprintf(stderr, "Could not import %s\n", file);
            continue;
        }
        printf("%-10s %7.1f BPM  %7.2fs (ends %.2fs)  %s\n", id, library_get_bpm(id),
               library_get_duration(id), library_get_true_end_time(id), file);
        ids.push_back(id);
    }

    if (ids.empty()) {
        fprintf(stderr, "Nothing to play\n");
        engine_shutdown();
        return 1;
    }

    if (engine_start() != 0) {
        fprintf(stderr, "Could not open the audio output\n");
        engine_shutdown();
        return 1;
    }

    std::vector<const char*> queue;
    for (const std::string& id : ids) {
        queue.push_back(id.c_str());
    }
    if (party_start(queue.data(), static_cast<int>(queue.size()), 0) != 0) {
        fprintf(stderr, "Party mode could not start\n");
        engine_shutdown();
        return 1;
    }

    std::signal(SIGINT, onSignal);

    int last_index = -1;
    int last_state = -1;
    while (!g_interrupted) {
        party_tick();

        const int state = party_get_state();
        if (state == AUTODJ_PARTY_IDLE) break;

        const int index = party_get_now_playing_index();
        if (index != last_index || state != last_state) {
            const int deck = party_get_active_deck();
            printf("[%s] queue %d on deck %c at %.1fs (rate %.3f)\n", stateName(state), index,
                   deck == 0 ? 'A' : 'B', deck_get_position(deck), deck_get_rate(deck));
            fflush(stdout);
            last_index = index;
            last_state = state;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    party_stop();
    engine_shutdown();
    return 0;
}

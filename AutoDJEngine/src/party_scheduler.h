#ifndef AUTODJ_PARTY_SCHEDULER_H
#define AUTODJ_PARTY_SCHEDULER_H

#include "deck_player.h"
#include "mix_settings.h"
#include "tempo_match.h"

#include <functional>
#include <string>
#include <vector>

namespace autodj {

class TrackLibrary;
struct Track;

enum class PartyState {
    Idle,
    Playing,
    PreparingNext,
    Crossfading
};

const char* partyStateName(PartyState state);

struct DeckState {
    std::string track_id;   // empty when nothing is loaded
    double current_time;
    double duration;
    double playback_rate;
    float volume;
    bool is_playing;

    DeckState();
    void clear();
    bool isLoaded() const { return !track_id.empty(); }
};

struct PartyQueue {
    std::vector<std::string> track_ids;
    int now_playing_index;
    int pending_next_index;   // -1 when the natural order applies
    DeckId active_deck;

    PartyQueue() : now_playing_index(0), pending_next_index(-1), active_deck(DeckId::A) {}
};

// Per-transition tempo plan, kept for the UI readout
struct TempoDecision {
    double required_shift_pct;
    TempoInterpretation interpretation;
    double cap_pct_used;
    bool over_cap;
    bool will_tempo_match;
    bool near_cap;
    TempoCapVariant variant;
    double ratio;        // rate actually applied to the incoming deck
    double target_bpm;   // <= 0 when there was no target
    TempoMatchZone zone;

    TempoDecision();
};

typedef std::function<void(const std::string& track_id, const std::string& reason)> SkipNotifier;

// Party Mode orchestrator: keeps the two decks alternating.
//
// All mutation goes through the commands below. `now` is the engine clock in
// seconds; it only has to be monotonic. tick() may be called at any rate and
// repeatedly with the same time; the active deck pointer and the queue
// position only change when a crossfade completes.
class PartyScheduler {
public:
    PartyScheduler(const TrackLibrary* library, DeckPlayer* player);

    void setSettings(const MixSettings& settings);
    const MixSettings& settings() const { return settings_; }

    void setSkipNotifier(SkipNotifier notifier) { skip_notifier_ = notifier; }

    bool start(const std::vector<std::string>& track_ids, int start_index = 0);
    void stop();

    void play();
    void pause(double now);
    void skip(double now);

    bool playNext(int index);
    bool playNow(int index, double now);
    bool restart(double now);
    bool moveTrack(int from_index, int to_index);
    void shuffleUpcoming(unsigned int seed);

    // Manual rate override from the UI
    bool setDeckRate(DeckId deck, double ratio);

    void tick(double now);

    PartyState state() const { return state_; }
    bool isPaused() const { return paused_; }
    DeckId activeDeck() const { return queue_.active_deck; }
    const DeckState& deck(DeckId deck) const { return decks_[deckIndex(deck)]; }
    const PartyQueue& queue() const { return queue_; }
    int preparedIndex() const { return prepared_index_; }

    bool hasTempoDecision() const { return has_decision_; }
    const TempoDecision& lastTempoDecision() const { return last_decision_; }

    // Fade-out start and natural end for a track under the current settings
    double effectiveEndTime(const Track& track) const;
    double crossfadeStartTime(const Track& track) const;

private:
    const Track* trackAt(int index) const;
    const Track* activeTrack() const;

    int nextIndexAfter(int index) const;
    int firstCandidateIndex() const;

    bool loadIntoDeck(DeckId deck, int index, double start_offset, double rate);
    bool prepareNext();
    void discardPrepared();
    TempoDecision resolveIncomingTempo(const Track& next) const;
    double startRateFor(const Track& track) const;
    double naturalEndOf(const Track* track) const;
    double effectiveEndOf(const Track* track) const;

    bool beginCrossfade(double now);
    void updateCrossfade(double now);
    void commitCrossfade();
    void cancelCrossfade();
    void stopAllDecks();

    void refreshDeckStates();
    void notifySkip(const std::string& track_id, const std::string& reason);

    const TrackLibrary* library_;
    DeckPlayer* player_;
    MixSettings settings_;
    SkipNotifier skip_notifier_;

    PartyState state_;
    DeckState decks_[2];
    PartyQueue queue_;

    int prepared_index_;       // queue index loaded on the idle deck, -1 if none
    bool next_unavailable_;    // nothing left to prepare for this track
    bool paused_;
    double fade_started_at_;

    TempoDecision last_decision_;
    bool has_decision_;
};

} // namespace autodj

#endif // AUTODJ_PARTY_SCHEDULER_H

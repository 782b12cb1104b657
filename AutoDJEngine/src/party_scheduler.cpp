#include "party_scheduler.h"
#include "logging.h"
#include "track_library.h"

#include <algorithm>
#include <cmath>
#include <random>

namespace autodj {

namespace {

const double kMinDeckRate = 0.5;
const double kMaxDeckRate = 2.0;

// Where index `k` ends up after moving the element at `from` to `to`
int remapIndexAfterMove(int k, int from, int to) {
    if (k < 0) return k;
    if (k == from) return to;
    if (from < k && to >= k) return k - 1;
    if (from > k && to <= k) return k + 1;
    return k;
}

} // namespace

const char* partyStateName(PartyState state) {
    switch (state) {
        case PartyState::Idle: return "idle";
        case PartyState::Playing: return "playing";
        case PartyState::PreparingNext: return "preparing_next";
        case PartyState::Crossfading: return "crossfading";
    }
    return "idle";
}

DeckState::DeckState() {
    clear();
}

void DeckState::clear() {
    track_id.clear();
    current_time = 0.0;
    duration = 0.0;
    playback_rate = 1.0;
    volume = 1.0f;
    is_playing = false;
}

TempoDecision::TempoDecision()
    : required_shift_pct(0.0)
    , interpretation(TempoInterpretation::Normal)
    , cap_pct_used(0.0)
    , over_cap(false)
    , will_tempo_match(false)
    , near_cap(false)
    , variant(TempoCapVariant::Disabled)
    , ratio(1.0)
    , target_bpm(0.0)
    , zone(TempoMatchZone::Green)
{
}

PartyScheduler::PartyScheduler(const TrackLibrary* library, DeckPlayer* player)
    : library_(library)
    , player_(player)
    , state_(PartyState::Idle)
    , prepared_index_(-1)
    , next_unavailable_(false)
    , paused_(false)
    , fade_started_at_(0.0)
    , has_decision_(false)
{
}

void PartyScheduler::setSettings(const MixSettings& settings) {
    settings_ = clampMixSettings(settings);
    // loop_playlist may have changed what "next" means
    next_unavailable_ = false;
}

// ---------------------------------------------------------------------------
// Lookups

const Track* PartyScheduler::trackAt(int index) const {
    if (!library_ || index < 0 || index >= static_cast<int>(queue_.track_ids.size())) {
        return nullptr;
    }
    return library_->find(queue_.track_ids[index]);
}

const Track* PartyScheduler::activeTrack() const {
    const DeckState& active = decks_[deckIndex(queue_.active_deck)];
    if (!library_ || !active.isLoaded()) return nullptr;
    return library_->find(active.track_id);
}

int PartyScheduler::nextIndexAfter(int index) const {
    const int size = static_cast<int>(queue_.track_ids.size());
    if (size == 0) return -1;
    if (index + 1 < size) return index + 1;
    return settings_.loop_playlist ? 0 : -1;
}

int PartyScheduler::firstCandidateIndex() const {
    const int size = static_cast<int>(queue_.track_ids.size());
    if (queue_.pending_next_index >= 0 && queue_.pending_next_index < size) {
        return queue_.pending_next_index;
    }
    return nextIndexAfter(queue_.now_playing_index);
}

// A track that left the library, or was never measured, still has the
// length of the audio the active deck decoded
double PartyScheduler::naturalEndOf(const Track* track) const {
    if (track && (track->hasTrueEndTime() || track->duration > 0.0)) {
        return track->naturalEnd();
    }
    return decks_[deckIndex(queue_.active_deck)].duration;
}

double PartyScheduler::effectiveEndOf(const Track* track) const {
    return std::max(0.0, naturalEndOf(track) - settings_.end_early_seconds);
}

double PartyScheduler::effectiveEndTime(const Track& track) const {
    return effectiveEndOf(&track);
}

double PartyScheduler::crossfadeStartTime(const Track& track) const {
    return effectiveEndOf(&track) - settings_.crossfade_seconds;
}

// ---------------------------------------------------------------------------
// Tempo

double PartyScheduler::startRateFor(const Track& track) const {
    if (settings_.tempo_control_enabled && settings_.tempo_mode == TempoMode::Locked) {
        return computePresetTempo(track.bpm, settings_.tempo_preset).ratio;
    }
    return 1.0;
}

TempoDecision PartyScheduler::resolveIncomingTempo(const Track& next) const {
    TempoShiftInfo shift;

    TempoDecision decision;
    if (settings_.tempo_mode == TempoMode::Locked) {
        const PresetTempo preset = computePresetTempo(next.bpm, settings_.tempo_preset);
        decision.target_bpm = preset.target_bpm;
        shift.ideal_ratio = preset.ratio;
        shift.required_shift_pct = std::abs(preset.ratio - 1.0) * 100.0;
        shift.interpretation = TempoInterpretation::Normal;
        shift.interpreted_base_bpm = next.bpm;
    } else {
        // Target is what the audience hears right now on the active deck
        const Track* current = activeTrack();
        const DeckState& active = decks_[deckIndex(queue_.active_deck)];
        if (current && current->hasBpm()) {
            decision.target_bpm = current->bpm * active.playback_rate;
        }
        shift = computeTempoShiftInfo(next.bpm, decision.target_bpm);
    }

    TempoCapRequest request;
    request.tempo_control_enabled = settings_.tempo_control_enabled;
    request.tempo_mode = settings_.tempo_mode;
    request.required_shift_pct = shift.required_shift_pct;
    request.raw_max_tempo_percent = settings_.max_tempo_percent;
    const TempoCapDecision cap = getTempoCapDecision(request);

    decision.required_shift_pct = shift.required_shift_pct;
    decision.interpretation = shift.interpretation;
    decision.cap_pct_used = cap.cap_pct_used;
    decision.over_cap = cap.over_cap;
    decision.will_tempo_match = cap.will_tempo_match;
    decision.near_cap = cap.near_cap;
    decision.variant = cap.variant;
    decision.zone = computeTempoMatchZone(shift.required_shift_pct);

    // Over the cap the track plays at its own tempo, never at a clipped shift
    const bool usable_ratio = std::isfinite(shift.ideal_ratio) && shift.ideal_ratio > 0.0;
    if (cap.will_tempo_match && settings_.tempo_mode != TempoMode::Original && usable_ratio) {
        decision.ratio = shift.ideal_ratio;
    } else {
        decision.ratio = 1.0;
    }
    return decision;
}

// ---------------------------------------------------------------------------
// Deck preparation

void PartyScheduler::notifySkip(const std::string& track_id, const std::string& reason) {
    if (skip_notifier_) {
        skip_notifier_(track_id, reason);
    }
}

bool PartyScheduler::loadIntoDeck(DeckId deck, int index, double start_offset, double rate) {
    const std::string queued_id = (index >= 0 && index < static_cast<int>(queue_.track_ids.size()))
        ? queue_.track_ids[index] : std::string();

    const Track* track = trackAt(index);
    if (!track) {
        AUTODJ_LOG_WARN("Queue entry %d (%s) is not in the library, skipping",
                        index, queued_id.c_str());
        notifySkip(queued_id, "not in library");
        return false;
    }

    if (!player_->load(deck, *track)) {
        AUTODJ_LOG_WARN("Could not load %s (%s) on deck %c, skipping",
                        track->id.c_str(), track->path.c_str(), deckName(deck));
        notifySkip(track->id, "could not load audio");
        return false;
    }

    double duration = player_->duration(deck);
    if (duration <= 0.0) duration = track->duration;

    const double start = clampStartOffset(start_offset, duration);
    if (start > 0.0) {
        player_->seek(deck, start);
    }

    const double clamped_rate = std::max(kMinDeckRate, std::min(rate, kMaxDeckRate));
    player_->setRate(deck, clamped_rate);

    DeckState& state = decks_[deckIndex(deck)];
    state.track_id = track->id;
    state.current_time = start;
    state.duration = duration;
    state.playback_rate = clamped_rate;
    state.is_playing = false;
    return true;
}

bool PartyScheduler::prepareNext() {
    if (state_ == PartyState::PreparingNext) return true;
    if (state_ != PartyState::Playing) return false;

    const DeckId idle = otherDeck(queue_.active_deck);
    const size_t queue_size = queue_.track_ids.size();

    int index = firstCandidateIndex();
    queue_.pending_next_index = -1;

    for (size_t attempt = 0; index >= 0 && attempt < queue_size; attempt++) {
        const Track* next = trackAt(index);
        const TempoDecision decision = next ? resolveIncomingTempo(*next) : TempoDecision();

        if (loadIntoDeck(idle, index, settings_.next_song_start_offset, decision.ratio)) {
            player_->setVolume(idle, 0.0f);
            decks_[deckIndex(idle)].volume = 0.0f;

            prepared_index_ = index;
            last_decision_ = decision;
            has_decision_ = true;
            state_ = PartyState::PreparingNext;

            AUTODJ_LOG_INFO("Prepared deck %c with %s (queue %d)",
                            deckName(idle), decks_[deckIndex(idle)].track_id.c_str(), index);
            AUTODJ_LOG_DEBUG("Tempo plan: target=%.2f required=%.4f%% cap=%.4f%% variant=%s "
                             "interpretation=%s ratio=%.4f",
                             decision.target_bpm, decision.required_shift_pct,
                             decision.cap_pct_used, tempoCapVariantName(decision.variant),
                             tempoInterpretationName(decision.interpretation), decision.ratio);
            return true;
        }

        index = nextIndexAfter(index);
    }

    next_unavailable_ = true;
    AUTODJ_LOG_INFO("No next track to prepare after queue position %d", queue_.now_playing_index);
    return false;
}

void PartyScheduler::discardPrepared() {
    if (state_ != PartyState::PreparingNext) return;

    const DeckId idle = otherDeck(queue_.active_deck);
    player_->stop(idle);
    player_->unload(idle);
    decks_[deckIndex(idle)].clear();

    prepared_index_ = -1;
    state_ = PartyState::Playing;
}

// ---------------------------------------------------------------------------
// Crossfade

bool PartyScheduler::beginCrossfade(double now) {
    if (state_ == PartyState::Crossfading) return true;
    if (state_ == PartyState::Playing && !prepareNext()) return false;
    if (state_ != PartyState::PreparingNext) return false;

    const DeckId outgoing = queue_.active_deck;
    const DeckId incoming = otherDeck(outgoing);

    if (paused_) {
        player_->play(outgoing);
        paused_ = false;
    }

    player_->setVolume(outgoing, 1.0f);
    player_->setVolume(incoming, 0.0f);
    player_->play(incoming);

    decks_[deckIndex(outgoing)].volume = 1.0f;
    decks_[deckIndex(incoming)].volume = 0.0f;
    decks_[deckIndex(incoming)].is_playing = true;

    fade_started_at_ = now;
    state_ = PartyState::Crossfading;

    AUTODJ_LOG_INFO("Crossfade %c -> %c over %.1fs", deckName(outgoing), deckName(incoming),
                    settings_.crossfade_seconds);

    updateCrossfade(now);
    return true;
}

void PartyScheduler::updateCrossfade(double now) {
    if (state_ != PartyState::Crossfading) return;

    double progress = (now - fade_started_at_) / settings_.crossfade_seconds;
    if (!std::isfinite(progress)) progress = 1.0;
    progress = std::max(0.0, std::min(1.0, progress));

    const DeckId outgoing = queue_.active_deck;
    const DeckId incoming = otherDeck(outgoing);

    const float out_volume = static_cast<float>(1.0 - progress);
    const float in_volume = static_cast<float>(progress);
    player_->setVolume(outgoing, out_volume);
    player_->setVolume(incoming, in_volume);
    decks_[deckIndex(outgoing)].volume = out_volume;
    decks_[deckIndex(incoming)].volume = in_volume;

    if (progress >= 1.0) {
        commitCrossfade();
    }
}

// The one place where the active deck and the queue position change
void PartyScheduler::commitCrossfade() {
    const DeckId outgoing = queue_.active_deck;
    const DeckId incoming = otherDeck(outgoing);

    player_->stop(outgoing);
    player_->unload(outgoing);
    decks_[deckIndex(outgoing)].clear();

    player_->setVolume(incoming, 1.0f);
    decks_[deckIndex(incoming)].volume = 1.0f;

    queue_.active_deck = incoming;
    if (prepared_index_ >= 0) {
        queue_.now_playing_index = prepared_index_;
    }
    if (queue_.pending_next_index == queue_.now_playing_index) {
        queue_.pending_next_index = -1;
    }
    prepared_index_ = -1;
    next_unavailable_ = false;
    state_ = PartyState::Playing;

    AUTODJ_LOG_INFO("Deck %c is live with %s (queue %d)", deckName(incoming),
                    decks_[deckIndex(incoming)].track_id.c_str(), queue_.now_playing_index);
}

// Halts both decks in place; the incoming one keeps its position
void PartyScheduler::cancelCrossfade() {
    player_->pause(DeckId::A);
    player_->pause(DeckId::B);
    player_->setVolume(DeckId::A, 1.0f);
    player_->setVolume(DeckId::B, 1.0f);

    for (DeckState& deck : decks_) {
        deck.is_playing = false;
        deck.volume = 1.0f;
    }
}

void PartyScheduler::stopAllDecks() {
    for (int i = 0; i < 2; i++) {
        const DeckId deck = static_cast<DeckId>(i);
        player_->stop(deck);
        player_->setVolume(deck, 1.0f);
        player_->unload(deck);
        decks_[i].clear();
    }
}

// ---------------------------------------------------------------------------
// Commands

bool PartyScheduler::start(const std::vector<std::string>& track_ids, int start_index) {
    stop();

    if (!library_ || !player_ || track_ids.empty()) {
        AUTODJ_LOG_WARN("Party mode needs a library, a player and at least one track");
        return false;
    }

    queue_ = PartyQueue();
    queue_.track_ids = track_ids;

    const int size = static_cast<int>(track_ids.size());
    int index = (start_index >= 0 && start_index < size) ? start_index : 0;

    for (int attempt = 0; attempt < size; attempt++) {
        const Track* track = trackAt(index);
        const double rate = track ? startRateFor(*track) : 1.0;

        if (loadIntoDeck(DeckId::A, index, 0.0, rate)) {
            player_->setVolume(DeckId::A, 1.0f);
            player_->play(DeckId::A);
            decks_[0].volume = 1.0f;
            decks_[0].is_playing = true;

            queue_.now_playing_index = index;
            state_ = PartyState::Playing;
            paused_ = false;
            next_unavailable_ = false;

            AUTODJ_LOG_INFO("Party mode started with %d tracks at queue %d", size, index);
            return true;
        }

        index = (index + 1) % size;
    }

    AUTODJ_LOG_ERROR("Party mode could not start, no track in the queue is playable");
    return false;
}

void PartyScheduler::stop() {
    if (state_ == PartyState::Idle && !decks_[0].isLoaded() && !decks_[1].isLoaded()) {
        return;
    }

    const PartyState previous = state_;

    // Both decks stopped and volumes reset in one step, whatever the state
    stopAllDecks();

    state_ = PartyState::Idle;
    prepared_index_ = -1;
    queue_.pending_next_index = -1;
    next_unavailable_ = false;
    paused_ = false;

    AUTODJ_LOG_INFO("Party mode stopped (was %s)", partyStateName(previous));
}

void PartyScheduler::play() {
    if (state_ == PartyState::Idle || !paused_) return;

    const DeckId active = queue_.active_deck;
    player_->play(active);
    decks_[deckIndex(active)].is_playing = true;
    paused_ = false;
}

void PartyScheduler::pause(double now) {
    if (state_ == PartyState::Idle || paused_) return;

    if (state_ == PartyState::Crossfading) {
        // Land the fade before pausing, never freeze mid-fade
        updateCrossfade(now);
        if (state_ == PartyState::Crossfading) {
            commitCrossfade();
        }
    }

    const DeckId active = queue_.active_deck;
    player_->pause(active);
    decks_[deckIndex(active)].is_playing = false;
    paused_ = true;
}

void PartyScheduler::skip(double now) {
    switch (state_) {
        case PartyState::Idle:
            return;

        case PartyState::Crossfading: {
            cancelCrossfade();
            commitCrossfade();
            const DeckId active = queue_.active_deck;
            player_->play(active);
            decks_[deckIndex(active)].is_playing = true;
            return;
        }

        case PartyState::Playing:
        case PartyState::PreparingNext:
            if (!beginCrossfade(now)) {
                AUTODJ_LOG_INFO("Skip with nothing left to play");
                stop();
            }
            return;
    }
}

bool PartyScheduler::playNext(int index) {
    if (index < 0 || index >= static_cast<int>(queue_.track_ids.size())) {
        return false;
    }

    next_unavailable_ = false;

    // Already cued on the idle deck or fading in
    const bool in_transition = state_ == PartyState::PreparingNext
        || state_ == PartyState::Crossfading;
    if (in_transition && prepared_index_ == index) {
        queue_.pending_next_index = -1;
        return true;
    }

    queue_.pending_next_index = index;
    if (state_ == PartyState::PreparingNext) {
        discardPrepared();
    }
    return true;
}

bool PartyScheduler::playNow(int index, double now) {
    if (state_ == PartyState::Idle) {
        if (index < 0 || index >= static_cast<int>(queue_.track_ids.size())) return false;
        const std::vector<std::string> ids = queue_.track_ids;
        return start(ids, index);
    }

    const bool fading_in = state_ == PartyState::Crossfading && prepared_index_ == index;
    if (!playNext(index)) return false;

    // A running fade lands first; the requested track follows right after
    if (state_ == PartyState::Crossfading) {
        skip(now);
        if (fading_in) return true;
    }
    skip(now);
    return true;
}

bool PartyScheduler::restart(double now) {
    return playNow(0, now);
}

bool PartyScheduler::moveTrack(int from_index, int to_index) {
    const int size = static_cast<int>(queue_.track_ids.size());
    if (from_index < 0 || from_index >= size || to_index < 0 || to_index >= size) {
        return false;
    }
    if (from_index == to_index) return true;

    const std::string moved = queue_.track_ids[from_index];
    queue_.track_ids.erase(queue_.track_ids.begin() + from_index);
    queue_.track_ids.insert(queue_.track_ids.begin() + to_index, moved);

    queue_.now_playing_index = remapIndexAfterMove(queue_.now_playing_index, from_index, to_index);
    queue_.pending_next_index = remapIndexAfterMove(queue_.pending_next_index, from_index, to_index);
    prepared_index_ = remapIndexAfterMove(prepared_index_, from_index, to_index);
    return true;
}

void PartyScheduler::shuffleUpcoming(unsigned int seed) {
    const int size = static_cast<int>(queue_.track_ids.size());
    const int first = queue_.now_playing_index + 1;
    if (size - first < 2) return;

    // Explicit ordering is void after a shuffle; re-prepare from the new order
    queue_.pending_next_index = -1;
    discardPrepared();

    std::mt19937 rng(seed);
    std::shuffle(queue_.track_ids.begin() + first, queue_.track_ids.end(), rng);

    if (state_ == PartyState::Crossfading && prepared_index_ >= first) {
        // Keep the fading-in track's queue position pointing at it
        const std::string& incoming_id = decks_[deckIndex(otherDeck(queue_.active_deck))].track_id;
        for (int i = first; i < size; i++) {
            if (queue_.track_ids[i] == incoming_id) {
                prepared_index_ = i;
                break;
            }
        }
    }
}

bool PartyScheduler::setDeckRate(DeckId deck, double ratio) {
    if (!std::isfinite(ratio) || ratio <= 0.0) return false;

    DeckState& state = decks_[deckIndex(deck)];
    if (!state.isLoaded()) return false;

    const double clamped = std::max(kMinDeckRate, std::min(ratio, kMaxDeckRate));
    player_->setRate(deck, clamped);
    state.playback_rate = clamped;
    return true;
}

// ---------------------------------------------------------------------------
// Time updates

void PartyScheduler::refreshDeckStates() {
    for (int i = 0; i < 2; i++) {
        if (!decks_[i].isLoaded()) continue;
        const DeckId deck = static_cast<DeckId>(i);
        decks_[i].current_time = player_->position(deck);
        decks_[i].is_playing = player_->isPlaying(deck);
    }
}

void PartyScheduler::tick(double now) {
    if (state_ == PartyState::Idle) return;

    refreshDeckStates();

    if (state_ == PartyState::Crossfading) {
        updateCrossfade(now);
        return;
    }

    if (paused_) return;

    // Null once the playing track is removed from the library; the deck plays on
    const Track* current = activeTrack();

    const DeckState& active = decks_[deckIndex(queue_.active_deck)];
    const bool ended = !active.is_playing;
    const double position = active.current_time;
    const double fade_start = effectiveEndOf(current) - settings_.crossfade_seconds;

    if (state_ == PartyState::Playing && !next_unavailable_
        && (ended || position >= fade_start - settings_.prepare_lead_seconds)) {
        prepareNext();
    }

    if (state_ == PartyState::PreparingNext) {
        if (ended || position >= fade_start) {
            beginCrossfade(now);
        }
        return;
    }

    // Nothing to fade into: let the track finish on its own, then go idle
    if (ended || position >= naturalEndOf(current)) {
        AUTODJ_LOG_INFO("Queue finished");
        stop();
    }
}

} // namespace autodj

#ifndef AUTODJ_DECK_PLAYER_H
#define AUTODJ_DECK_PLAYER_H

namespace autodj {

struct Track;

enum class DeckId {
    A = 0,
    B = 1
};

inline int deckIndex(DeckId deck) { return deck == DeckId::A ? 0 : 1; }
inline DeckId otherDeck(DeckId deck) { return deck == DeckId::A ? DeckId::B : DeckId::A; }
inline char deckName(DeckId deck) { return deck == DeckId::A ? 'A' : 'B'; }

// Playback knobs the party scheduler drives. The engine implements this over
// its two Deck objects; positions are seconds in the track's own timeline.
class DeckPlayer {
public:
    virtual ~DeckPlayer() {}

    // Decode and load; false when the audio source is unusable
    virtual bool load(DeckId deck, const Track& track) = 0;
    virtual void unload(DeckId deck) = 0;

    virtual void play(DeckId deck) = 0;
    virtual void pause(DeckId deck) = 0;
    virtual void stop(DeckId deck) = 0;
    virtual void seek(DeckId deck, double seconds) = 0;

    virtual void setRate(DeckId deck, double ratio) = 0;
    virtual void setVolume(DeckId deck, float volume) = 0;

    virtual double position(DeckId deck) const = 0;
    virtual double duration(DeckId deck) const = 0;
    virtual bool isPlaying(DeckId deck) const = 0;
};

} // namespace autodj

#endif // AUTODJ_DECK_PLAYER_H

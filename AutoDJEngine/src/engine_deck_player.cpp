#include "autodj_internal.h"

namespace autodj {

EngineDeckPlayer::EngineDeckPlayer(Deck* deck_a, Deck* deck_b) {
    decks_[0] = deck_a;
    decks_[1] = deck_b;
}

bool EngineDeckPlayer::load(DeckId deck, const Track& track) {
    return decks_[deckIndex(deck)]->loadTrack(track.path.c_str());
}

void EngineDeckPlayer::unload(DeckId deck) {
    decks_[deckIndex(deck)]->unloadTrack();
}

void EngineDeckPlayer::play(DeckId deck) {
    decks_[deckIndex(deck)]->play();
}

void EngineDeckPlayer::pause(DeckId deck) {
    decks_[deckIndex(deck)]->pause();
}

void EngineDeckPlayer::stop(DeckId deck) {
    decks_[deckIndex(deck)]->stop();
}

void EngineDeckPlayer::seek(DeckId deck, double seconds) {
    decks_[deckIndex(deck)]->setPosition(seconds);
}

void EngineDeckPlayer::setRate(DeckId deck, double ratio) {
    decks_[deckIndex(deck)]->setTempo(ratio);
}

void EngineDeckPlayer::setVolume(DeckId deck, float volume) {
    decks_[deckIndex(deck)]->setVolume(volume);
}

double EngineDeckPlayer::position(DeckId deck) const {
    return decks_[deckIndex(deck)]->getPosition();
}

double EngineDeckPlayer::duration(DeckId deck) const {
    return decks_[deckIndex(deck)]->getDuration();
}

bool EngineDeckPlayer::isPlaying(DeckId deck) const {
    return decks_[deckIndex(deck)]->isPlaying();
}

} // namespace autodj

// recording.cpp
#include "recording.h"
#include <utility>

Recording::Recording(const QString& name, double concentration)
    : m_name(name),
    m_concentration(concentration),
    m_gridResolution(0),
    m_gridGeneration(0)
{
}

const QString& Recording::getName() const { return m_name; }
double Recording::getConcentration() const { return m_concentration; }
void Recording::setConcentration(double concentration) { m_concentration = concentration; }

const std::vector<Squares::Track>& Recording::getTracks() const { return m_tracks; }
std::vector<Squares::Track>& Recording::getTracks() { return m_tracks; }

void Recording::setTracks(std::vector<Squares::Track> tracks) {
    clearSquares();
    m_tracks = std::move(tracks);
}

void Recording::addTrack(Squares::Track track) {
    if (track.recordingName.isEmpty()) {
        track.recordingName = m_name;
    }
    m_tracks.push_back(std::move(track));
}

int Recording::getNumberOfTracks() const {
    return static_cast<int>(m_tracks.size());
}

const std::vector<Square>& Recording::getSquares() const { return m_squares; }
std::vector<Square>& Recording::getSquares() { return m_squares; }

void Recording::setSquares(std::vector<Square> squares, int gridResolution) {
    clearSquares();
    m_squares = std::move(squares);
    m_gridResolution = gridResolution;
}

void Recording::clearSquares() {
    m_squares.clear();
    m_gridResolution = 0;
    m_gridGeneration++;
    m_attributes = Squares::RecordingAttributes();
    for (Squares::Track& track : m_tracks) {
        track.squareNumber = -1;
        track.labelNumber = -1;
    }
}

int Recording::getGridResolution() const { return m_gridResolution; }
quint64 Recording::getGridGeneration() const { return m_gridGeneration; }

Square* Recording::findSquare(int squareNumber) {
    // Squares are stored row-major, so the number is normally the index
    if (squareNumber >= 0 && squareNumber < static_cast<int>(m_squares.size())
        && m_squares[squareNumber].getSquareNumber() == squareNumber) {
        return &m_squares[squareNumber];
    }
    for (Square& square : m_squares) {
        if (square.getSquareNumber() == squareNumber) {
            return &square;
        }
    }
    return nullptr;
}

const Square* Recording::findSquare(int squareNumber) const {
    return const_cast<Recording*>(this)->findSquare(squareNumber);
}

std::vector<int> Recording::getTracksInSelectedSquares() const {
    std::vector<int> indices;
    for (const Square& square : m_squares) {
        if (!square.isSelected()) continue;
        indices.insert(indices.end(), square.getTrackIndices().begin(), square.getTrackIndices().end());
    }
    return indices;
}

const Squares::RecordingAttributes& Recording::getAttributes() const { return m_attributes; }
void Recording::setAttributes(const Squares::RecordingAttributes& attributes) { m_attributes = attributes; }

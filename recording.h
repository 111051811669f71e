// recording.h
#ifndef RECORDING_H
#define RECORDING_H

#include <QString>
#include <vector>
#include "squarecommon.h"
#include "square.h"

/**
 * @brief One multi-frame image: its tracks, the squares of the current grid and
 * the recording-level results.
 *
 * The recording owns both lists. Squares refer to tracks by index into
 * getTracks(), so the track list must not be reordered once squares exist.
 */
class Recording {
public:
    explicit Recording(const QString& name, double concentration = 1.0);

    const QString& getName() const;
    double getConcentration() const;
    void setConcentration(double concentration);

    // --- Tracks ---
    const std::vector<Squares::Track>& getTracks() const;
    std::vector<Squares::Track>& getTracks();
    void setTracks(std::vector<Squares::Track> tracks);
    void addTrack(Squares::Track track);
    int getNumberOfTracks() const;

    // --- Squares ---
    const std::vector<Square>& getSquares() const;
    std::vector<Square>& getSquares();

    /**
     * @brief Replace the grid. Any previous squares and track assignments are discarded.
     * @param squares resolution x resolution squares, row-major.
     * @param gridResolution Number of squares per row.
     */
    void setSquares(std::vector<Square> squares, int gridResolution);
    void clearSquares();
    int getGridResolution() const;

    // Changes every time the square list is replaced or cleared
    quint64 getGridGeneration() const;

    /**
     * @brief Find a square by number
     * @return Pointer to the square, or nullptr if there is no such square
     */
    Square* findSquare(int squareNumber);
    const Square* findSquare(int squareNumber) const;

    // Indices of the tracks that lie in selected squares
    std::vector<int> getTracksInSelectedSquares() const;

    // --- Results ---
    const Squares::RecordingAttributes& getAttributes() const;
    void setAttributes(const Squares::RecordingAttributes& attributes);

private:
    QString m_name;
    double m_concentration;
    std::vector<Squares::Track> m_tracks;
    std::vector<Square> m_squares;
    int m_gridResolution;
    quint64 m_gridGeneration;
    Squares::RecordingAttributes m_attributes;
};

#endif // RECORDING_H

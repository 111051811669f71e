// square.h
#ifndef SQUARE_H
#define SQUARE_H

#include <QRectF>
#include <vector>
#include "squarecommon.h"

/**
 * @brief One cell of the N x N grid laid over a recording.
 *
 * The statistics are written once per generation pass and are frozen after
 * that. Only the manual tags (cell id, selection and exclusion flags, label)
 * may change on a finalized square.
 */
class Square {
public:
    Square(int squareNumber, int row, int column, double x0, double y0, double x1, double y1);

    int getSquareNumber() const;
    int getRow() const;
    int getColumn() const;

    // Bounding box in micrometer; x0/y0 inclusive, x1/y1 exclusive except on the outer edge
    double getX0() const;
    double getY0() const;
    double getX1() const;
    double getY1() const;
    double getArea() const;
    QRectF getBoundingBox() const;

    // Indices into the recording's track list, not owned
    const std::vector<int>& getTrackIndices() const;
    void setTrackIndices(std::vector<int> trackIndices);
    int getNumberOfTracks() const;

    double getRawDensity() const;
    void setRawDensity(double density);

    const Squares::SquareStatistics& getStatistics() const;
    bool isFinalized() const;
    bool finalizeStatistics(const Squares::SquareStatistics& statistics);
    void resetStatistics();

    int getLabelNumber() const;
    void setLabelNumber(int labelNumber);
    int getCellId() const;
    void setCellId(int cellId);
    bool isSelected() const;
    void setSelected(bool selected);
    bool isManuallyExcluded() const;
    void setManuallyExcluded(bool excluded);
    bool isImageExcluded() const;
    void setImageExcluded(bool excluded);

private:
    int m_squareNumber;
    int m_row;
    int m_column;
    double m_x0;
    double m_y0;
    double m_x1;
    double m_y1;

    std::vector<int> m_trackIndices;
    double m_rawDensity;
    Squares::SquareStatistics m_statistics;
    bool m_finalized;

    int m_labelNumber;      // -1 while the square is not selected
    int m_cellId;           // -1 until assigned by hand
    bool m_selected;
    bool m_manuallyExcluded;
    bool m_imageExcluded;
};

#endif // SQUARE_H

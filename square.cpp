// square.cpp
#include "square.h"
#include <QDebug>
#include <utility>

Square::Square(int squareNumber, int row, int column, double x0, double y0, double x1, double y1)
    : m_squareNumber(squareNumber),
    m_row(row),
    m_column(column),
    m_x0(x0),
    m_y0(y0),
    m_x1(x1),
    m_y1(y1),
    m_rawDensity(SquareConstants::UNDEFINED),
    m_finalized(false),
    m_labelNumber(-1),
    m_cellId(-1),
    m_selected(false),
    m_manuallyExcluded(false),
    m_imageExcluded(false)
{
}

int Square::getSquareNumber() const { return m_squareNumber; }
int Square::getRow() const { return m_row; }
int Square::getColumn() const { return m_column; }

double Square::getX0() const { return m_x0; }
double Square::getY0() const { return m_y0; }
double Square::getX1() const { return m_x1; }
double Square::getY1() const { return m_y1; }

double Square::getArea() const {
    return (m_x1 - m_x0) * (m_y1 - m_y0);
}

QRectF Square::getBoundingBox() const {
    return QRectF(QPointF(m_x0, m_y0), QPointF(m_x1, m_y1));
}

const std::vector<int>& Square::getTrackIndices() const {
    return m_trackIndices;
}

void Square::setTrackIndices(std::vector<int> trackIndices) {
    m_trackIndices = std::move(trackIndices);
}

int Square::getNumberOfTracks() const {
    return static_cast<int>(m_trackIndices.size());
}

double Square::getRawDensity() const { return m_rawDensity; }
void Square::setRawDensity(double density) { m_rawDensity = density; }

const Squares::SquareStatistics& Square::getStatistics() const {
    return m_statistics;
}

bool Square::isFinalized() const {
    return m_finalized;
}

bool Square::finalizeStatistics(const Squares::SquareStatistics& statistics) {
    if (m_finalized) {
        qWarning() << "Square: statistics of square" << m_squareNumber << "are already final, update ignored";
        return false;
    }
    m_statistics = statistics;
    m_finalized = true;
    return true;
}

// Only used when the square is regenerated for a new pass
void Square::resetStatistics() {
    m_statistics = Squares::SquareStatistics();
    m_rawDensity = SquareConstants::UNDEFINED;
    m_finalized = false;
}

int Square::getLabelNumber() const { return m_labelNumber; }
void Square::setLabelNumber(int labelNumber) { m_labelNumber = labelNumber; }
int Square::getCellId() const { return m_cellId; }
void Square::setCellId(int cellId) { m_cellId = cellId; }
bool Square::isSelected() const { return m_selected; }
void Square::setSelected(bool selected) { m_selected = selected; }
bool Square::isManuallyExcluded() const { return m_manuallyExcluded; }
void Square::setManuallyExcluded(bool excluded) { m_manuallyExcluded = excluded; }
bool Square::isImageExcluded() const { return m_imageExcluded; }
void Square::setImageExcluded(bool excluded) { m_imageExcluded = excluded; }

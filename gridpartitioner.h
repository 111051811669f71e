#ifndef GRIDPARTITIONER_H
#define GRIDPARTITIONER_H

#include <vector>
#include "squarecommon.h"
#include "square.h"

namespace GridPartitioner {

    // Position of grid line `index` along an axis of length `extent`. Every
    // edge of every square goes through here so neighbours share identical values.
    double edge(int index, double extent, int resolution);

    inline int squareNumber(int row, int column, int resolution) {
        return row * resolution + column;
    }

    /**
     * @brief Split the field of view into resolution x resolution squares.
     *
     * Squares are numbered row-major: squareNumber = row * resolution + column.
     * Square (row, col) spans [col*W/N, (col+1)*W/N) x [row*H/N, (row+1)*H/N).
     *
     * @throws Squares::InvalidConfiguration if resolution < 1 or the field of view is empty.
     */
    std::vector<Square> createSquares(const Squares::FieldOfView& fieldOfView, int resolution);

} // namespace GridPartitioner

#endif // GRIDPARTITIONER_H

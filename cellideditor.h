#ifndef CELLIDEDITOR_H
#define CELLIDEDITOR_H

#include <QObject>
#include <QList>
#include <QPair>
#include <QStack>
#include "recording.h"

/**
 * @brief Manual assignment of cell ids to squares, with undo.
 *
 * Only the cell id tag of a square is touched; statistics, selection and
 * labels are left alone. Every call that changes at least one square becomes
 * one undo step.
 */
class CellIdEditor : public QObject {
    Q_OBJECT

public:
    explicit CellIdEditor(Recording* recording, QObject* parent = nullptr);

    /**
     * @brief Tag squares with a cell id
     * @param squareNumbers Squares to tag; unknown numbers are skipped
     * @param cellId The id, or -1 to remove the tag
     * @return Number of squares whose id changed
     */
    int assignCellId(const QList<int>& squareNumbers, int cellId);

    // Tags every selected square of the recording
    int assignCellIdToSelected(int cellId);

    int clearCellId(const QList<int>& squareNumbers);

    /**
     * @brief Revert the most recent change
     * @return False if there was nothing to undo
     */
    bool undo();
    bool canUndo() const;
    int undoDepth() const;
    void clearHistory();

signals:
    void cellIdsChanged(const QList<int>& squareNumbers);

private:
    struct Edit {
        quint64 gridGeneration = 0;         // Grid the edit was made on
        QList<QPair<int, int>> previousIds; // Square number and the id it had before
    };

    Recording* m_recording;     // Not owned
    QStack<Edit> m_undoStack;

    void dropStaleEdits();
};

#endif // CELLIDEDITOR_H

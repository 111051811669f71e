#include "cellideditor.h"
#include "debugutils.h"

CellIdEditor::CellIdEditor(Recording* recording, QObject* parent)
    : QObject(parent),
    m_recording(recording)
{
}

int CellIdEditor::assignCellId(const QList<int>& squareNumbers, int cellId) {
    if (!m_recording) {
        qWarning() << "CellIdEditor: no recording to edit";
        return 0;
    }
    if (cellId < -1) {
        qWarning() << "CellIdEditor: invalid cell id" << cellId;
        return 0;
    }

    dropStaleEdits();

    Edit edit;
    edit.gridGeneration = m_recording->getGridGeneration();
    QList<int> changed;
    for (int squareNumber : squareNumbers) {
        Square* square = m_recording->findSquare(squareNumber);
        if (!square) {
            qWarning() << "CellIdEditor: recording" << m_recording->getName() << "has no square" << squareNumber;
            continue;
        }
        if (square->getCellId() == cellId) {
            continue;
        }
        edit.previousIds.append(qMakePair(squareNumber, square->getCellId()));
        square->setCellId(cellId);
        changed.append(squareNumber);
    }

    if (changed.isEmpty()) {
        return 0;
    }

    m_undoStack.push(edit);
    SQUARES_DEBUG() << "CellIdEditor: cell id" << cellId << "on" << changed.size() << "squares of"
                    << m_recording->getName();
    emit cellIdsChanged(changed);
    return changed.size();
}

int CellIdEditor::assignCellIdToSelected(int cellId) {
    if (!m_recording) {
        return 0;
    }
    QList<int> selected;
    for (const Square& square : m_recording->getSquares()) {
        if (square.isSelected()) {
            selected.append(square.getSquareNumber());
        }
    }
    return assignCellId(selected, cellId);
}

int CellIdEditor::clearCellId(const QList<int>& squareNumbers) {
    return assignCellId(squareNumbers, -1);
}

bool CellIdEditor::undo() {
    dropStaleEdits();
    if (m_undoStack.isEmpty() || !m_recording) {
        return false;
    }

    const Edit edit = m_undoStack.pop();
    QList<int> changed;
    for (const auto& entry : edit.previousIds) {
        Square* square = m_recording->findSquare(entry.first);
        if (!square) {
            continue;
        }
        square->setCellId(entry.second);
        changed.append(entry.first);
    }

    if (!changed.isEmpty()) {
        emit cellIdsChanged(changed);
    }
    return true;
}

bool CellIdEditor::canUndo() const {
    return undoDepth() > 0;
}

int CellIdEditor::undoDepth() const {
    if (!m_recording) {
        return 0;
    }
    int depth = 0;
    for (const Edit& edit : m_undoStack) {
        if (edit.gridGeneration == m_recording->getGridGeneration()) depth++;
    }
    return depth;
}

// Edits made on a grid that has since been replaced refer to other regions
void CellIdEditor::dropStaleEdits() {
    if (!m_recording) {
        return;
    }
    const quint64 generation = m_recording->getGridGeneration();
    QStack<Edit> current;
    for (const Edit& edit : m_undoStack) {
        if (edit.gridGeneration == generation) {
            current.push(edit);
        }
    }
    if (current.size() != m_undoStack.size()) {
        SQUARES_DEBUG() << "CellIdEditor: dropped" << m_undoStack.size() - current.size()
                        << "edits made on an earlier grid of" << m_recording->getName();
        m_undoStack = current;
    }
}

void CellIdEditor::clearHistory() {
    m_undoStack.clear();
}

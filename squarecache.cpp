#include "squarecache.h"
#include "debugutils.h"
#include <QMutexLocker>
#include <utility>

SquareCache::SquareCache(QObject* parent)
    : QObject(parent),
    m_gridResolution(0),
    m_generation(0)
{
}

std::shared_ptr<Recording> SquareCache::getOrLoad(const QString& key, const Loader& loader) {
    quint64 generation = 0;
    {
        QMutexLocker locker(&m_mutex);
        for (;;) {
            auto it = m_entries.constFind(key);
            if (it != m_entries.constEnd()) {
                return it.value();
            }
            if (!m_loading.contains(key)) {
                break;
            }
            m_loadFinished.wait(&m_mutex);
        }
        m_loading.insert(key);
        generation = m_generation;
    }

    std::shared_ptr<Recording> recording;
    try {
        recording = loader(key);
    } catch (...) {
        QMutexLocker locker(&m_mutex);
        m_loading.remove(key);
        m_loadFinished.wakeAll();
        throw;
    }

    bool cached = false;
    {
        QMutexLocker locker(&m_mutex);
        m_loading.remove(key);
        // A load that straddles an invalidation belongs to the old grid
        if (recording && generation == m_generation) {
            m_entries.insert(key, recording);
            cached = true;
        }
        m_loadFinished.wakeAll();
    }

    if (cached) {
        SQUARES_DEBUG() << "SquareCache: loaded" << key;
        emit recordingLoaded(key);
    }
    return recording;
}

std::shared_ptr<Recording> SquareCache::get(const QString& key) const {
    QMutexLocker locker(&m_mutex);
    return m_entries.value(key);
}

bool SquareCache::contains(const QString& key) const {
    QMutexLocker locker(&m_mutex);
    return m_entries.contains(key);
}

void SquareCache::insert(const QString& key, std::shared_ptr<Recording> recording) {
    if (!recording) {
        return;
    }
    QMutexLocker locker(&m_mutex);
    m_entries.insert(key, std::move(recording));
}

bool SquareCache::remove(const QString& key) {
    QMutexLocker locker(&m_mutex);
    return m_entries.remove(key) > 0;
}

void SquareCache::clear() {
    {
        QMutexLocker locker(&m_mutex);
        m_entries.clear();
        m_generation++;
    }
    emit cacheInvalidated();
}

int SquareCache::size() const {
    QMutexLocker locker(&m_mutex);
    return m_entries.size();
}

int SquareCache::getGridResolution() const {
    QMutexLocker locker(&m_mutex);
    return m_gridResolution;
}

void SquareCache::setGridResolution(int resolution) {
    {
        QMutexLocker locker(&m_mutex);
        if (resolution == m_gridResolution) {
            return;
        }
        SQUARES_DEBUG() << "SquareCache: grid resolution" << m_gridResolution << "->" << resolution
                        << ", dropping" << m_entries.size() << "recordings";
        m_gridResolution = resolution;
    }
    clear();
}

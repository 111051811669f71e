#ifndef SQUARECACHE_H
#define SQUARECACHE_H

#include <QObject>
#include <QMap>
#include <QSet>
#include <QString>
#include <QMutex>
#include <QWaitCondition>
#include <functional>
#include <memory>
#include "recording.h"

/**
 * @brief Process-wide store of generated recordings, keyed by recording name.
 *
 * All cached recordings belong to one grid resolution. Changing the resolution
 * drops every entry, since their squares no longer apply. Loading is
 * get-or-load: concurrent requests for the same key wait for a single load
 * instead of starting their own.
 */
class SquareCache : public QObject {
    Q_OBJECT

public:
    using Loader = std::function<std::shared_ptr<Recording>(const QString& key)>;

    explicit SquareCache(QObject* parent = nullptr);

    /**
     * @brief Return the cached recording, loading it first if needed.
     *
     * The loader runs without the cache lock held and at most once per key at a
     * time. A null result is returned to the caller but not cached. Exceptions
     * thrown by the loader propagate to the caller that ran it; waiting callers
     * then retry the load themselves.
     *
     * @param key Recording name.
     * @param loader Called to produce the recording when it is not cached.
     */
    std::shared_ptr<Recording> getOrLoad(const QString& key, const Loader& loader);

    /**
     * @brief Look up a recording without loading
     * @return The recording, or nullptr if it is not cached
     */
    std::shared_ptr<Recording> get(const QString& key) const;

    bool contains(const QString& key) const;
    void insert(const QString& key, std::shared_ptr<Recording> recording);
    bool remove(const QString& key);
    void clear();
    int size() const;

    int getGridResolution() const;

    /**
     * @brief Set the grid resolution of the cached squares
     * @param resolution Squares per row; a different value empties the cache
     */
    void setGridResolution(int resolution);

signals:
    void recordingLoaded(const QString& key);
    void cacheInvalidated();

private:
    mutable QMutex m_mutex;
    QWaitCondition m_loadFinished;
    QMap<QString, std::shared_ptr<Recording>> m_entries;
    QSet<QString> m_loading;        // Keys with a load in progress
    int m_gridResolution;
    quint64 m_generation;           // Bumped on every invalidation
};

#endif // SQUARECACHE_H

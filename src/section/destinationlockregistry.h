/*
 * destinationlockregistry.h — Per-destination FIFO write serialization
 *
 * Writers to the same destination key are granted the lock in the order
 * they asked for it; different keys never wait on each other. A key's queue
 * exists only while it has a holder or a waiter.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_DESTINATIONLOCKREGISTRY_H
#define DOKUMENTOR_DESTINATIONLOCKREGISTRY_H

#include <QHash>
#include <QMutex>
#include <QString>
#include <QWaitCondition>

class DestinationLockRegistry
{
public:
    // Held for the lifetime of the object; released on destruction.
    class Lock
    {
    public:
        Lock(Lock &&other);
        ~Lock();

        Lock(const Lock &) = delete;
        Lock &operator=(const Lock &) = delete;
        Lock &operator=(Lock &&) = delete;

        const QString &key() const { return m_key; }

    private:
        friend class DestinationLockRegistry;
        Lock(DestinationLockRegistry *registry, const QString &key);

        DestinationLockRegistry *m_registry = nullptr;
        QString m_key;
    };

    DestinationLockRegistry() = default;
    DestinationLockRegistry(const DestinationLockRegistry &) = delete;
    DestinationLockRegistry &operator=(const DestinationLockRegistry &) = delete;

    // Blocks until every earlier request for key has been released.
    Lock acquire(const QString &key);

    // Holders plus waiters currently queued for key.
    int pendingCount(const QString &key) const;
    int activeKeyCount() const;

private:
    struct Queue {
        quint64 nextTicket = 0;
        quint64 serving = 0;
    };

    void release(const QString &key);

    mutable QMutex m_mutex;
    QWaitCondition m_released;
    QHash<QString, Queue> m_queues;
};

#endif // DOKUMENTOR_DESTINATIONLOCKREGISTRY_H

/*
 * destinationlockregistry.cpp — Per-destination FIFO write serialization
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "destinationlockregistry.h"

#include <QMutexLocker>

// --- Lock ---

DestinationLockRegistry::Lock::Lock(DestinationLockRegistry *registry, const QString &key)
    : m_registry(registry)
    , m_key(key)
{
}

DestinationLockRegistry::Lock::Lock(Lock &&other)
    : m_registry(other.m_registry)
    , m_key(std::move(other.m_key))
{
    other.m_registry = nullptr;
}

DestinationLockRegistry::Lock::~Lock()
{
    if (m_registry)
        m_registry->release(m_key);
}

// --- DestinationLockRegistry ---

DestinationLockRegistry::Lock DestinationLockRegistry::acquire(const QString &key)
{
    QMutexLocker lock(&m_mutex);
    const quint64 ticket = m_queues[key].nextTicket++;
    // The entry cannot disappear while this ticket is outstanding.
    while (m_queues.value(key).serving != ticket)
        m_released.wait(&m_mutex);
    return Lock(this, key);
}

void DestinationLockRegistry::release(const QString &key)
{
    QMutexLocker lock(&m_mutex);
    auto it = m_queues.find(key);
    if (it == m_queues.end())
        return;
    ++it->serving;
    if (it->serving == it->nextTicket)
        m_queues.erase(it);
    m_released.wakeAll();
}

int DestinationLockRegistry::pendingCount(const QString &key) const
{
    QMutexLocker lock(&m_mutex);
    const auto it = m_queues.constFind(key);
    if (it == m_queues.constEnd())
        return 0;
    return int(it->nextTicket - it->serving);
}

int DestinationLockRegistry::activeKeyCount() const
{
    QMutexLocker lock(&m_mutex);
    return int(m_queues.size());
}

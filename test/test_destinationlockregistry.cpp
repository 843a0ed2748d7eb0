#include <gtest/gtest.h>

#include "section/destinationlockregistry.h"

#include <QMutex>
#include <QMutexLocker>
#include <QStringList>
#include <QThread>

#include <memory>
#include <optional>

TEST(DestinationLockRegistryTest, EntryRemovedAfterRelease)
{
    DestinationLockRegistry registry;
    {
        const DestinationLockRegistry::Lock lock = registry.acquire(QStringLiteral("README.md"));
        EXPECT_EQ(lock.key(), QStringLiteral("README.md"));
        EXPECT_EQ(registry.pendingCount(QStringLiteral("README.md")), 1);
        EXPECT_EQ(registry.activeKeyCount(), 1);
    }
    EXPECT_EQ(registry.pendingCount(QStringLiteral("README.md")), 0);
    EXPECT_EQ(registry.activeKeyCount(), 0);
}

TEST(DestinationLockRegistryTest, DifferentKeysDoNotBlock)
{
    DestinationLockRegistry registry;
    const DestinationLockRegistry::Lock a = registry.acquire(QStringLiteral("a.md"));
    const DestinationLockRegistry::Lock b = registry.acquire(QStringLiteral("b.md"));
    EXPECT_EQ(registry.activeKeyCount(), 2);
}

TEST(DestinationLockRegistryTest, MovedLockReleasesOnce)
{
    DestinationLockRegistry registry;
    {
        DestinationLockRegistry::Lock first = registry.acquire(QStringLiteral("x"));
        const DestinationLockRegistry::Lock second(std::move(first));
        EXPECT_EQ(registry.pendingCount(QStringLiteral("x")), 1);
    }
    EXPECT_EQ(registry.activeKeyCount(), 0);
    const DestinationLockRegistry::Lock again = registry.acquire(QStringLiteral("x"));
    EXPECT_EQ(registry.pendingCount(QStringLiteral("x")), 1);
}

TEST(DestinationLockRegistryTest, WaitersAreServedInArrivalOrder)
{
    DestinationLockRegistry registry;
    QMutex orderMutex;
    QStringList order;

    auto held = std::make_optional(registry.acquire(QStringLiteral("doc")));

    QList<QThread *> threads;
    for (int i = 0; i < 3; ++i) {
        QThread *thread = QThread::create([&registry, &orderMutex, &order, i]() {
            const DestinationLockRegistry::Lock lock = registry.acquire(QStringLiteral("doc"));
            QMutexLocker locker(&orderMutex);
            order.append(QString::number(i));
        });
        threads.append(thread);
        thread->start();
        // Wait until this thread holds its ticket before starting the next.
        while (registry.pendingCount(QStringLiteral("doc")) < i + 2)
            QThread::msleep(1);
    }

    EXPECT_EQ(registry.pendingCount(QStringLiteral("doc")), 4);
    held.reset();

    for (QThread *thread : threads) {
        thread->wait();
        delete thread;
    }
    EXPECT_EQ(order, (QStringList{QStringLiteral("0"), QStringLiteral("1"), QStringLiteral("2")}));
    EXPECT_EQ(registry.activeKeyCount(), 0);
}

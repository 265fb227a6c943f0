/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef KPTYBACKENDTEST_H
#define KPTYBACKENDTEST_H

#include <QObject>

namespace DevHaven
{

class KPtyBackendTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testResolveShell();
    void testSpawnFailsForMissingDirectory();
    void testSpawnFailsForBadShell();
    void testShellRoundTrip();
    void testTerminate();
    void testDestroyRunningProcessDoesNotBlock();
};

}

#endif // KPTYBACKENDTEST_H

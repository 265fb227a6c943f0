/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALPANEBINDINGTEST_H
#define TERMINALPANEBINDINGTEST_H

#include <QObject>

namespace DevHaven
{

class TerminalPaneBindingTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testLifetimeHoldsReference();
    void testConnectStreamsOutput();
    void testRestoreBeforeSpawn();
    void testRemountReplaysWithoutRestore();
    void testRemountWithinGracePeriodKeepsShell();
    void testSpawnFailureReported();
    void testInputAndResizeForwarded();
    void testProcessExit();
    void testSnapshotSurvivesUnmount();
    void testOverlappingMountsKeepLiveSnapshot();
    void testTerminatedSessionDisconnects();
};

}

#endif // TERMINALPANEBINDINGTEST_H

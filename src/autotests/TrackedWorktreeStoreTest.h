/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TRACKEDWORKTREESTORETEST_H
#define TRACKEDWORKTREESTORETEST_H

#include <QObject>

namespace DevHaven
{

class TrackedWorktreeStoreTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testEmptyStore();
    void testUpsertAddsAndReplaces();
    void testUpsertRejectsEmptyPath();
    void testProjectsAreSeparate();
    void testRemove();
    void testReconcile();
    void testReconcileKeepsFailedEntries();
    void testUnreadableStoreNotOverwritten();
    void testJsonNulls();
};

}

#endif // TRACKEDWORKTREESTORETEST_H

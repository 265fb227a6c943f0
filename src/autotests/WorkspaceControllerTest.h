/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACECONTROLLERTEST_H
#define WORKSPACECONTROLLERTEST_H

#include <QObject>
#include <QTemporaryDir>

#include <memory>

namespace DevHaven
{

class WorkspaceStore;
class WorkspacePersistence;
class WorkspaceController;

class WorkspaceControllerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void init();
    void cleanup();

    void testSplitActivePane();
    void testSplitInheritsCwd();
    void testSplitUnknownTarget();
    void testClosePane();
    void testCloseLastPaneClosesTab();
    void testCloseLastTabLeavesDefault();
    void testCloseTabSelectsNeighbour();
    void testResizeSplit();
    void testDragDividerOutOfRange();
    void testActivateAndSelect();
    void testRenameTab();
    void testOpenPathInNewTab();
    void testOpenPathAsSplit();
    void testPanelState();
    void testCommandsScheduleSave();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<WorkspaceStore> m_store;
    std::unique_ptr<WorkspacePersistence> m_persistence;
    std::unique_ptr<WorkspaceController> m_controller;
};

}

#endif // WORKSPACECONTROLLERTEST_H

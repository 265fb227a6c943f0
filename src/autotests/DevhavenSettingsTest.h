/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef DEVHAVENSETTINGSTEST_H
#define DEVHAVENSETTINGSTEST_H

#include <QObject>

namespace DevHaven
{

class DevhavenSettingsTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void init();

    void testDefaults();
    void testSettersEmitChanged();
    void testNegativeValuesClamped();
    void testPersistedAcrossInstances();
    void testSingleton();
    void testComponentsFollowSettings();
};

}

#endif // DEVHAVENSETTINGSTEST_H

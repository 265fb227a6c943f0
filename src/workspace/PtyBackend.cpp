/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PtyBackend.h"

namespace DevHaven
{

TerminalProcess::TerminalProcess(QObject *parent)
    : QObject(parent)
{
}

TerminalProcess::~TerminalProcess() = default;

PtyBackend::PtyBackend(QObject *parent)
    : QObject(parent)
{
}

PtyBackend::~PtyBackend() = default;

} // namespace DevHaven

#include "moc_PtyBackend.cpp"
